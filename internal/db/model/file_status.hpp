#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sda::db::model {

/*
  File lifecycle:

      REGISTERED → ARCHIVED → COMPLETED → READY

  Monotonic: a file never moves back.
*/
enum class FileStatus : std::uint8_t {
  kRegistered = 1,
  kArchived   = 2,
  kCompleted  = 3,
  kReady      = 4,
};

constexpr bool CanTransition(FileStatus from, FileStatus to) {
  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

// Database spelling: "REGISTERED", "ARCHIVED", ...
std::string_view ToString(FileStatus status);

std::optional<FileStatus> ParseFileStatus(std::string_view text);

} // namespace sda::db::model
