#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace sda::db::sqlite {

/*
  SQLite repository over a single `files` table with the columns of
  local_ega.files. Creates the table on first use.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::optional<model::ArchivedFile> GetArchived(const std::string& user, const std::string& filepath,
                                                 const std::string& checksum) override;
  std::optional<std::string>         GetHeader(int64_t file_id) override;
  Result                             MarkCompleted(const model::FileInfo& info, int64_t file_id) override;
  Result MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                   const std::string& checksum) override;

  // Registration happens upstream; these exist for tooling and tests.
  int64_t                           InsertFile(const model::FileRecord& record);
  std::optional<model::FileRecord> GetFile(int64_t file_id);

 private:
  static Result Translate(sqlite3* db, int rc);
  void          EnsureSchema();

  std::shared_ptr<SqliteDB> db_;
};

} // namespace sda::db::sqlite
