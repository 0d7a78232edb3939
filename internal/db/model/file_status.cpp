#include "file_status.hpp"

namespace sda::db::model {

std::string_view ToString(FileStatus status) {
  switch (status) {
    case FileStatus::kRegistered:
      return "REGISTERED";
    case FileStatus::kArchived:
      return "ARCHIVED";
    case FileStatus::kCompleted:
      return "COMPLETED";
    case FileStatus::kReady:
      return "READY";
  }
  return "UNKNOWN";
}

std::optional<FileStatus> ParseFileStatus(std::string_view text) {
  for (auto status : {FileStatus::kRegistered, FileStatus::kArchived, FileStatus::kCompleted, FileStatus::kReady}) {
    if (ToString(status) == text) return status;
  }
  return std::nullopt;
}

} // namespace sda::db::model
