#include "pg_pool.hpp"

namespace sda::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

/*
  local_ega.files is the view the rest of the pipeline writes through.
*/
void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_archived",
               "SELECT archive_path, archive_filesize FROM local_ega.files "
               "WHERE elixir_id = $1 AND inbox_path = $2 AND decrypted_file_checksum = $3 "
               "AND status IN ('COMPLETED', 'READY') LIMIT 1");

  conn.prepare("get_header", "SELECT header FROM local_ega.files WHERE id = $1");

  conn.prepare("mark_completed",
               "UPDATE local_ega.files SET status = 'COMPLETED', "
               "archive_filesize = $2, archive_file_checksum = $3, archive_file_checksum_type = 'SHA256', "
               "decrypted_file_size = $4, decrypted_file_checksum = $5, decrypted_file_checksum_type = 'SHA256' "
               "WHERE id = $1 AND status <> 'READY'");

  conn.prepare("file_exists", "SELECT 1 FROM local_ega.files WHERE id = $1");

  conn.prepare("mark_ready",
               "UPDATE local_ega.files SET status = 'READY', stable_id = $1 "
               "WHERE elixir_id = $2 AND inbox_path = $3 AND decrypted_file_checksum = $4 "
               "AND (status = 'COMPLETED' OR (status = 'READY' AND stable_id = $1))");

  conn.prepare("file_state",
               "SELECT status, COALESCE(stable_id, '') FROM local_ega.files "
               "WHERE elixir_id = $1 AND inbox_path = $2 AND decrypted_file_checksum = $3 LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace sda::db::postgres
