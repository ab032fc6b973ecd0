#pragma once

#include "sweguard/common/result.hpp"

#include <string>
#include <vector>

namespace sweguard::patch {

struct DiffFile {
  std::string old_path;
  std::string new_path;
  bool created = false;
  bool deleted = false;
  std::size_t hunks = 0;
};

/// Reads the file headers of a unified or git-style diff. Paths are repository-relative
/// with the conventional `a/` and `b/` prefixes removed.
[[nodiscard]] common::Result<std::vector<DiffFile>> parse_diff(const std::string &diff);

/// Every repository path the diff reads or writes, sorted and de-duplicated.
[[nodiscard]] std::vector<std::string> touched_paths(const std::string &diff);

} // namespace sweguard::patch
