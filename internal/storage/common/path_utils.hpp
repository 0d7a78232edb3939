#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace sda::storage::common {

/*
  clean(join(root, path)), confined to root.

  Absolute request paths are treated as relative to root.
  Throws InvalidPath when the result escapes root or names root itself.
*/
inline std::filesystem::path ResolveUnderRoot(const std::filesystem::path& root, const std::string& path) {
  if (path.find('\0') != std::string::npos) {
    throw util::InvalidPath("path contains NUL byte");
  }

  auto clean_root = root.lexically_normal();
  if (!clean_root.has_filename() && clean_root.has_parent_path() && clean_root != clean_root.root_path()) {
    clean_root = clean_root.parent_path();
  }

  std::filesystem::path relative(path);
  relative = relative.relative_path();

  const auto joined = (clean_root / relative).lexically_normal();
  const auto inside = joined.lexically_relative(clean_root);

  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    throw util::InvalidPath("path escapes storage root: " + path);
  }
  return joined;
}

} // namespace sda::storage::common
