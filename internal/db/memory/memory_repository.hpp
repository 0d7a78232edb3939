#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace sda::db::memory {

/*
  In-memory repository with the same semantics as the SQL backends.
  Used by tests; failures can be injected per operation kind.
*/
class MemoryRepository final : public db::Repository {
 public:
  std::optional<model::ArchivedFile> GetArchived(const std::string& user, const std::string& filepath,
                                                 const std::string& checksum) override;
  std::optional<std::string>         GetHeader(int64_t file_id) override;
  Result                             MarkCompleted(const model::FileInfo& info, int64_t file_id) override;
  Result MarkReady(const std::string& accession_id, const std::string& user, const std::string& filepath,
                   const std::string& checksum) override;

  // Stores the record; assigns an id when record.id is 0. Returns the id.
  int64_t                           Put(model::FileRecord record);
  std::optional<model::FileRecord> Get(int64_t file_id) const;

  void FailReads(bool fail);
  void FailWrites(bool fail);

  int WriteCalls() const;

 private:
  mutable std::mutex                   mutex_;
  std::map<int64_t, model::FileRecord> files_;
  int64_t                              next_id_     = 1;
  bool                                 fail_reads_  = false;
  bool                                 fail_writes_ = false;
  int                                  write_calls_ = 0;
};

} // namespace sda::db::memory
