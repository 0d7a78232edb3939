#pragma once

#include <cstdint>
#include <string>

#include "file_status.hpp"

namespace sda::db::model {

/*
  Persistent file row (local_ega.files).

  Checksums are lowercase hex; types are stored upper case ("SHA256").
*/
struct FileRecord {
  int64_t id = 0;

  std::string submission_user;
  std::string submission_file_path;

  std::string archive_path;
  int64_t     archive_size = 0;
  std::string archive_checksum;
  std::string archive_checksum_type;

  int64_t     decrypted_size = 0;
  std::string decrypted_checksum;
  std::string decrypted_checksum_type;

  // Crypt4GH header, raw bytes.
  std::string header;
  std::string stable_id;

  FileStatus status = FileStatus::kRegistered;
};

// Result of an archive location lookup.
struct ArchivedFile {
  std::string archive_path;
  int64_t     archive_size = 0;
};

// Verification outcome written by MarkCompleted.
struct FileInfo {
  int64_t     archive_size = 0;
  std::string archive_checksum;
  int64_t     decrypted_size = 0;
  std::string decrypted_checksum;
};

} // namespace sda::db::model
