#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"

namespace sda::db::postgres {

/*
  PostgreSQL repository (libpqxx) over local_ega.files.

  Every operation is one short transaction on a pooled connection. A
  broken connection is retried once on a fresh one; further failures
  surface to the caller (reads throw, writes return Result).
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::optional<model::ArchivedFile> GetArchived(const std::string& user, const std::string& filepath,
                                                 const std::string& checksum) override;
  std::optional<std::string>         GetHeader(int64_t file_id) override;
  Result                             MarkCompleted(const model::FileInfo& info, int64_t file_id) override;
  Result MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                   const std::string& checksum) override;

 private:
  template <typename Fn>
  auto WithRetry(Fn&& fn) -> decltype(fn(std::declval<pqxx::connection&>()));

  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace sda::db::postgres
