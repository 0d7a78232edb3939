#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using sda::db::ErrorCode;
using sda::db::Repository;
using sda::db::model::FileInfo;
using sda::db::model::FileRecord;
using sda::db::model::FileStatus;

const std::string kSha = "82e4e60e7beb3db2e06a00a079788f7d71f75b61a4b75f28c4c942703dabb6d6";

/*
  Each backend seeds rows its own way and reads them back whole; the
  scenarios only go through the Repository interface.
*/
struct Backend {
  std::string                                  name;
  std::shared_ptr<Repository>                  repository;
  std::function<int64_t(const FileRecord&)>    insert;
  std::function<std::optional<FileRecord>(int64_t)> get;
};

Backend MakeMemory() {
  auto repo = std::make_shared<sda::db::memory::MemoryRepository>();
  return {"memory", repo, [repo](const FileRecord& r) { return repo->Put(r); }, [repo](int64_t id) { return repo->Get(id); }};
}

Backend MakeSqlite(const std::string& name) {
  const auto path = std::filesystem::temp_directory_path() / ("sda_repository_parity_" + name + ".db");
  std::filesystem::remove(path);

  auto db   = std::make_shared<sda::db::sqlite::SqliteDB>(path.string());
  auto repo = std::make_shared<sda::db::sqlite::SqliteRepository>(db);
  return {"sqlite", repo, [repo](const FileRecord& r) { return repo->InsertFile(r); }, [repo](int64_t id) { return repo->GetFile(id); }};
}

FileRecord Archived(const std::string& user, const std::string& path) {
  FileRecord r;
  r.submission_user      = user;
  r.submission_file_path = path;
  r.archive_path         = "4f1c-archive-" + path;
  r.archive_size         = 1024;
  r.header               = std::string("crypt4gh\x01\0\0\0", 12);
  r.status               = FileStatus::kArchived;
  return r;
}

FileInfo Info() {
  FileInfo info;
  info.archive_size       = 1024;
  info.archive_checksum   = "aa";
  info.decrypted_size     = 996;
  info.decrypted_checksum = kSha;
  return info;
}

void VerifyHeaderLookup(Backend& b) {
  const auto id = b.insert(Archived("alice", "hdr.c4gh"));

  auto header = b.repository->GetHeader(id);
  assert(header.has_value());
  assert(header->size() == 12);
  assert((*header)[8] == '\x01');

  assert(!b.repository->GetHeader(id + 1000).has_value());

  auto no_header   = Archived("alice", "noheader.c4gh");
  no_header.header = "";
  assert(!b.repository->GetHeader(b.insert(no_header)).has_value());
}

void VerifyCompletedThenReady(Backend& b) {
  const auto id = b.insert(Archived("alice", "file.c4gh"));

  // not yet verified: no archived location for the copy worker
  assert(!b.repository->GetArchived("alice", "file.c4gh", kSha).has_value());

  assert(b.repository->MarkCompleted(Info(), id));
  auto row = b.get(id);
  assert(row && row->status == FileStatus::kCompleted);
  assert(row->archive_checksum_type == "SHA256");
  assert(row->decrypted_size == 996);

  auto archived = b.repository->GetArchived("alice", "file.c4gh", kSha);
  assert(archived.has_value());
  assert(archived->archive_path == "4f1c-archive-file.c4gh");
  assert(archived->archive_size == 1024);
  assert(!b.repository->GetArchived("bob", "file.c4gh", kSha).has_value());

  assert(b.repository->MarkReady("EGAF001", "alice", "file.c4gh", kSha));
  row = b.get(id);
  assert(row && row->status == FileStatus::kReady && row->stable_id == "EGAF001");

  // same accession again is a no-op, a different one conflicts
  assert(b.repository->MarkReady("EGAF001", "alice", "file.c4gh", kSha));
  auto conflict = b.repository->MarkReady("EGAF999", "alice", "file.c4gh", kSha);
  assert(conflict.code == ErrorCode::Conflict);
  assert(conflict.Permanent());

  // READY never moves back to COMPLETED
  auto again           = Info();
  again.decrypted_size = 1;
  assert(b.repository->MarkCompleted(again, id));
  row = b.get(id);
  assert(row && row->status == FileStatus::kReady && row->decrypted_size == 996);

  // still served to the copy worker after READY
  assert(b.repository->GetArchived("alice", "file.c4gh", kSha).has_value());
}

void VerifyMissingRows(Backend& b) {
  assert(b.repository->MarkCompleted(Info(), 987654).code == ErrorCode::NotFound);
  assert(b.repository->MarkReady("EGAF002", "nobody", "none.c4gh", kSha).code == ErrorCode::NotFound);
}

void VerifyReadyNeedsCompleted(Backend& b) {
  auto r               = Archived("carol", "early.c4gh");
  r.decrypted_checksum = kSha;
  const auto id        = b.insert(r);

  auto result = b.repository->MarkReady("EGAF003", "carol", "early.c4gh", kSha);
  assert(result.code == ErrorCode::Conflict);
  assert(b.get(id)->status == FileStatus::kArchived);
}

void VerifyRecompletionOverwrites(Backend& b) {
  const auto id = b.insert(Archived("dave", "twice.c4gh"));
  assert(b.repository->MarkCompleted(Info(), id));

  auto second             = Info();
  second.archive_checksum = "bb";
  assert(b.repository->MarkCompleted(second, id));
  assert(b.get(id)->archive_checksum == "bb");
}

void Run(Backend b) {
  VerifyHeaderLookup(b);
  VerifyCompletedThenReady(b);
  VerifyMissingRows(b);
  VerifyReadyNeedsCompleted(b);
  VerifyRecompletionOverwrites(b);
  std::cout << "  " << b.name << ": ok\n";
}

void VerifyMemoryFailureInjection() {
  sda::db::memory::MemoryRepository repo;
  const auto                        id = repo.Put(Archived("erin", "f.c4gh"));

  repo.FailWrites(true);
  auto result = repo.MarkCompleted(Info(), id);
  assert(result.code == ErrorCode::IOError);
  assert(!result.Permanent());
  assert(result.Describe() == "io error: write failure injected");
  assert(repo.WriteCalls() == 1);
  repo.FailWrites(false);

  repo.FailReads(true);
  bool threw = false;
  try {
    (void)repo.GetHeader(id);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  Run(MakeMemory());
  Run(MakeSqlite("main"));
  VerifyMemoryFailureInjection();

  std::cout << "sda_integration_repository_parity: pass\n";
  return 0;
}
