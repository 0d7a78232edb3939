#include "pg_repository.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace sda::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

template <typename Fn>
auto PgRepository::WithRetry(Fn&& fn) -> decltype(fn(std::declval<pqxx::connection&>())) {
  try {
    auto conn = pool_->Acquire();
    return fn(*conn);
  } catch (const pqxx::broken_connection& e) {
    SDA_LOG_WARN("postgres connection broken, retrying", {observability::StringField("error", e.what())});
  }
  auto conn = pool_->Acquire();
  return fn(*conn);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) return Result::Err(ErrorCode::ConnectionLost, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::sql_error*>(&e) != nullptr) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<model::ArchivedFile> PgRepository::GetArchived(const std::string& user, const std::string& filepath,
                                                             const std::string& checksum) {
  try {
    return WithRetry([&](pqxx::connection& conn) -> std::optional<model::ArchivedFile> {
      pqxx::work tx(conn);
      auto       res = tx.exec_prepared("get_archived", user, filepath, checksum);
      tx.commit();
      if (res.empty()) return std::nullopt;
      return model::ArchivedFile{res[0][0].c_str(), res[0][1].as<int64_t>()};
    });
  } catch (const pqxx::failure& e) {
    throw util::TransientIOError(std::string("GetArchived: ") + e.what());
  }
}

/*
  The header column holds the hex encoded Crypt4GH header.
*/
std::optional<std::string> PgRepository::GetHeader(int64_t file_id) {
  std::string hex;
  try {
    auto found = WithRetry([&](pqxx::connection& conn) {
      pqxx::work tx(conn);
      auto       res = tx.exec_prepared("get_header", file_id);
      tx.commit();
      if (res.empty() || res[0][0].is_null()) return false;
      hex = res[0][0].c_str();
      return true;
    });
    if (!found) return std::nullopt;
  } catch (const pqxx::failure& e) {
    throw util::TransientIOError(std::string("GetHeader: ") + e.what());
  }

  try {
    return util::HexDecode(hex);
  } catch (const std::invalid_argument& e) {
    throw util::TransientIOError("GetHeader: stored header of file " + std::to_string(file_id) + " is not hex: " + e.what());
  }
}

Result PgRepository::MarkCompleted(const model::FileInfo& info, int64_t file_id) {
  try {
    return WithRetry([&](pqxx::connection& conn) {
      pqxx::work tx(conn);
      auto       res = tx.exec_prepared("mark_completed", file_id, info.archive_size, info.archive_checksum, info.decrypted_size,
                                        info.decrypted_checksum);
      if (res.affected_rows() == 0) {
        auto exists = tx.exec_prepared("file_exists", file_id);
        tx.commit();
        if (exists.empty()) return Result::Err(ErrorCode::NotFound, "file " + std::to_string(file_id));
        return Result::Ok();
      }
      tx.commit();
      return Result::Ok();
    });
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                               const std::string& checksum) {
  try {
    return WithRetry([&](pqxx::connection& conn) {
      pqxx::work tx(conn);
      auto       res = tx.exec_prepared("mark_ready", accession_id, user, filepath, checksum);
      if (res.affected_rows() > 0) {
        tx.commit();
        return Result::Ok();
      }

      auto state = tx.exec_prepared("file_state", user, filepath, checksum);
      tx.commit();
      if (state.empty()) return Result::Err(ErrorCode::NotFound, "no file " + filepath + " for " + user);

      const std::string status = state[0][0].c_str();
      if (status == "READY") return Result::Err(ErrorCode::Conflict, "file already has accession id " + std::string(state[0][1].c_str()));
      return Result::Err(ErrorCode::Conflict, "file is " + status + ", not COMPLETED");
    });
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace sda::db::postgres
