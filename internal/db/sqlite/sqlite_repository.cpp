#include "sqlite_repository.hpp"

#include "internal/util/errors.hpp"

namespace sda::db::sqlite {

using model::FileStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
  return data ? std::string(data, static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : std::string{};
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  EnsureSchema();
}

void SqliteRepository::EnsureSchema() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS files ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  elixir_id TEXT NOT NULL,"
      "  inbox_path TEXT NOT NULL,"
      "  archive_path TEXT NOT NULL DEFAULT '',"
      "  archive_filesize INTEGER NOT NULL DEFAULT 0,"
      "  archive_file_checksum TEXT NOT NULL DEFAULT '',"
      "  archive_file_checksum_type TEXT NOT NULL DEFAULT '',"
      "  decrypted_file_size INTEGER NOT NULL DEFAULT 0,"
      "  decrypted_file_checksum TEXT NOT NULL DEFAULT '',"
      "  decrypted_file_checksum_type TEXT NOT NULL DEFAULT '',"
      "  header BLOB,"
      "  stable_id TEXT NOT NULL DEFAULT '',"
      "  status TEXT NOT NULL DEFAULT 'REGISTERED'"
      ");"
      "CREATE INDEX IF NOT EXISTS files_submission ON files(elixir_id, inbox_path, decrypted_file_checksum);");
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<model::ArchivedFile> SqliteRepository::GetArchived(const std::string& user, const std::string& filepath,
                                                                 const std::string& checksum) {
  auto st = db_->Prepare(
      "SELECT archive_path, archive_filesize FROM files "
      "WHERE elixir_id=?1 AND inbox_path=?2 AND decrypted_file_checksum=?3 AND status IN ('COMPLETED','READY') "
      "LIMIT 1;");
  BindText(st.get(), 1, user);
  BindText(st.get(), 2, filepath);
  BindText(st.get(), 3, checksum);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::TransientIOError("GetArchived: " + Translate(db_->Handle(), rc).message);

  return model::ArchivedFile{ColText(st.get(), 0), ColI64(st.get(), 1)};
}

std::optional<std::string> SqliteRepository::GetHeader(int64_t file_id) {
  auto st = db_->Prepare("SELECT header FROM files WHERE id=?1;");
  BindI64(st.get(), 1, file_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::TransientIOError("GetHeader: " + Translate(db_->Handle(), rc).message);

  auto header = ColBlob(st.get(), 0);
  if (header.empty()) return std::nullopt;
  return header;
}

Result SqliteRepository::MarkCompleted(const model::FileInfo& info, int64_t file_id) {
  auto* db = db_->Handle();

  auto st = db_->Prepare(
      "UPDATE files SET status='COMPLETED', archive_filesize=?2, archive_file_checksum=?3, archive_file_checksum_type='SHA256', "
      "decrypted_file_size=?4, decrypted_file_checksum=?5, decrypted_file_checksum_type='SHA256' "
      "WHERE id=?1 AND status <> 'READY';");
  BindI64(st.get(), 1, file_id);
  BindI64(st.get(), 2, info.archive_size);
  BindText(st.get(), 3, info.archive_checksum);
  BindI64(st.get(), 4, info.decrypted_size);
  BindText(st.get(), 5, info.decrypted_checksum);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) > 0) return Result::Ok();

  // Nothing updated: either unknown id or already READY.
  auto row = db_->Prepare("SELECT 1 FROM files WHERE id=?1;");
  BindI64(row.get(), 1, file_id);
  rc = sqlite3_step(row.get());
  if (rc == SQLITE_ROW) return Result::Ok();
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "file " + std::to_string(file_id));
  return Translate(db, rc);
}

Result SqliteRepository::MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                                   const std::string& checksum) {
  auto* db = db_->Handle();

  auto st = db_->Prepare(
      "UPDATE files SET status='READY', stable_id=?1 "
      "WHERE elixir_id=?2 AND inbox_path=?3 AND decrypted_file_checksum=?4 "
      "AND (status='COMPLETED' OR (status='READY' AND stable_id=?1));");
  BindText(st.get(), 1, accession_id);
  BindText(st.get(), 2, user);
  BindText(st.get(), 3, filepath);
  BindText(st.get(), 4, checksum);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) > 0) return Result::Ok();

  auto row = db_->Prepare("SELECT status, stable_id FROM files WHERE elixir_id=?1 AND inbox_path=?2 AND decrypted_file_checksum=?3 LIMIT 1;");
  BindText(row.get(), 1, user);
  BindText(row.get(), 2, filepath);
  BindText(row.get(), 3, checksum);
  rc = sqlite3_step(row.get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "no file " + filepath + " for " + user);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  const auto status = ColText(row.get(), 0);
  if (status == "READY") return Result::Err(ErrorCode::Conflict, "file already has accession id " + ColText(row.get(), 1));
  return Result::Err(ErrorCode::Conflict, "file is " + status + ", not COMPLETED");
}

int64_t SqliteRepository::InsertFile(const model::FileRecord& r) {
  auto st = db_->Prepare(
      "INSERT INTO files(elixir_id,inbox_path,archive_path,archive_filesize,archive_file_checksum,archive_file_checksum_type,"
      "decrypted_file_size,decrypted_file_checksum,decrypted_file_checksum_type,header,stable_id,status) "
      "VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12);");
  BindText(st.get(), 1, r.submission_user);
  BindText(st.get(), 2, r.submission_file_path);
  BindText(st.get(), 3, r.archive_path);
  BindI64(st.get(), 4, r.archive_size);
  BindText(st.get(), 5, r.archive_checksum);
  BindText(st.get(), 6, r.archive_checksum_type);
  BindI64(st.get(), 7, r.decrypted_size);
  BindText(st.get(), 8, r.decrypted_checksum);
  BindText(st.get(), 9, r.decrypted_checksum_type);
  BindBlob(st.get(), 10, r.header);
  BindText(st.get(), 11, r.stable_id);
  BindText(st.get(), 12, std::string(model::ToString(r.status)));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) throw util::TransientIOError("InsertFile: " + Translate(db_->Handle(), rc).message);
  return static_cast<int64_t>(sqlite3_last_insert_rowid(db_->Handle()));
}

std::optional<model::FileRecord> SqliteRepository::GetFile(int64_t file_id) {
  auto st = db_->Prepare(
      "SELECT id,elixir_id,inbox_path,archive_path,archive_filesize,archive_file_checksum,archive_file_checksum_type,"
      "decrypted_file_size,decrypted_file_checksum,decrypted_file_checksum_type,header,stable_id,status "
      "FROM files WHERE id=?1;");
  BindI64(st.get(), 1, file_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::TransientIOError("GetFile: " + Translate(db_->Handle(), rc).message);

  model::FileRecord r;
  r.id                      = ColI64(st.get(), 0);
  r.submission_user         = ColText(st.get(), 1);
  r.submission_file_path    = ColText(st.get(), 2);
  r.archive_path            = ColText(st.get(), 3);
  r.archive_size            = ColI64(st.get(), 4);
  r.archive_checksum        = ColText(st.get(), 5);
  r.archive_checksum_type   = ColText(st.get(), 6);
  r.decrypted_size          = ColI64(st.get(), 7);
  r.decrypted_checksum      = ColText(st.get(), 8);
  r.decrypted_checksum_type = ColText(st.get(), 9);
  r.header                  = ColBlob(st.get(), 10);
  r.stable_id               = ColText(st.get(), 11);

  const auto status = model::ParseFileStatus(ColText(st.get(), 12));
  if (!status) throw util::TransientIOError("GetFile: unknown status " + ColText(st.get(), 12));
  r.status = *status;
  return r;
}

} // namespace sda::db::sqlite
