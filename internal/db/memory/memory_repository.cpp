#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sda::db::memory {

using model::FileStatus;

namespace {

bool Matches(const model::FileRecord& r, const std::string& user, const std::string& filepath, const std::string& checksum) {
  return r.submission_user == user && r.submission_file_path == filepath && r.decrypted_checksum == checksum;
}

} // namespace

std::optional<model::ArchivedFile> MemoryRepository::GetArchived(const std::string& user, const std::string& filepath,
                                                                 const std::string& checksum) {
  std::lock_guard lock(mutex_);
  if (fail_reads_) throw util::TransientIOError("memory repository: read failure injected");

  for (const auto& [_, r] : files_) {
    if (Matches(r, user, filepath, checksum) && (r.status == FileStatus::kCompleted || r.status == FileStatus::kReady)) {
      return model::ArchivedFile{r.archive_path, r.archive_size};
    }
  }
  return std::nullopt;
}

std::optional<std::string> MemoryRepository::GetHeader(int64_t file_id) {
  std::lock_guard lock(mutex_);
  if (fail_reads_) throw util::TransientIOError("memory repository: read failure injected");

  auto it = files_.find(file_id);
  if (it == files_.end() || it->second.header.empty()) return std::nullopt;
  return it->second.header;
}

Result MemoryRepository::MarkCompleted(const model::FileInfo& info, int64_t file_id) {
  std::lock_guard lock(mutex_);
  ++write_calls_;
  if (fail_writes_) return Result::Err(ErrorCode::IOError, "write failure injected");

  auto it = files_.find(file_id);
  if (it == files_.end()) return Result::Err(ErrorCode::NotFound, "file " + std::to_string(file_id));

  auto& r = it->second;
  if (!model::CanTransition(r.status, FileStatus::kCompleted)) return Result::Ok();

  r.archive_size            = info.archive_size;
  r.archive_checksum        = info.archive_checksum;
  r.archive_checksum_type   = "SHA256";
  r.decrypted_size          = info.decrypted_size;
  r.decrypted_checksum      = info.decrypted_checksum;
  r.decrypted_checksum_type = "SHA256";
  r.status                  = FileStatus::kCompleted;
  return Result::Ok();
}

Result MemoryRepository::MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                                   const std::string& checksum) {
  std::lock_guard lock(mutex_);
  ++write_calls_;
  if (fail_writes_) return Result::Err(ErrorCode::IOError, "write failure injected");

  bool found = false;
  for (auto& [_, r] : files_) {
    if (!Matches(r, user, filepath, checksum)) continue;
    found = true;

    if (r.status == FileStatus::kReady) {
      if (r.stable_id != accession_id) return Result::Err(ErrorCode::Conflict, "file already has accession id " + r.stable_id);
      continue;
    }
    if (r.status != FileStatus::kCompleted) return Result::Err(ErrorCode::Conflict, "file is not completed");

    r.stable_id = accession_id;
    r.status    = FileStatus::kReady;
  }
  if (!found) return Result::Err(ErrorCode::NotFound, "no file " + filepath + " for " + user);
  return Result::Ok();
}

int64_t MemoryRepository::Put(model::FileRecord record) {
  std::lock_guard lock(mutex_);
  if (record.id == 0) record.id = next_id_;
  next_id_ = std::max(next_id_, record.id + 1);

  const auto id = record.id;
  files_[id]    = std::move(record);
  return id;
}

std::optional<model::FileRecord> MemoryRepository::Get(int64_t file_id) const {
  std::lock_guard lock(mutex_);
  auto            it = files_.find(file_id);
  if (it == files_.end()) return std::nullopt;
  return it->second;
}

void MemoryRepository::FailReads(bool fail) {
  std::lock_guard lock(mutex_);
  fail_reads_ = fail;
}

void MemoryRepository::FailWrites(bool fail) {
  std::lock_guard lock(mutex_);
  fail_writes_ = fail;
}

int MemoryRepository::WriteCalls() const {
  std::lock_guard lock(mutex_);
  return write_calls_;
}

} // namespace sda::db::memory
