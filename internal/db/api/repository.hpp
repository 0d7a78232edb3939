#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/file_record.hpp"

namespace sda::db {

/*
  Repository abstraction.

  GUARANTEES:

  - Every write is a single statement; no caller-visible transactions
  - Writes are idempotent: re-applying one with identical values
    leaves the row unchanged
  - Status never moves backwards (see model::CanTransition)

  Reads return nullopt when the row does not exist and throw
  util::TransientIOError when the backend fails. Writes report both
  through Result.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  // Archive location of a COMPLETED/READY file, by owner, submitted path and decrypted sha256.
  virtual std::optional<model::ArchivedFile> GetArchived(const std::string& user, const std::string& filepath,
                                                         const std::string& checksum) = 0;

  // Stored Crypt4GH header, raw bytes.
  virtual std::optional<std::string> GetHeader(int64_t file_id) = 0;

  /*
    Records verification results and moves the file to COMPLETED.
    A READY file is left untouched (Ok).
  */
  virtual Result MarkCompleted(const model::FileInfo& info, int64_t file_id) = 0;

  /*
    Assigns the accession id and moves the file to READY.
    Ok when already READY under the same accession id; Conflict when
    READY under another one or not yet COMPLETED.
  */
  virtual Result MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                           const std::string& checksum) = 0;
};

using RepositoryPtr = std::shared_ptr<Repository>;

} // namespace sda::db
