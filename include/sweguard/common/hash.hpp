#pragma once

#include "sweguard/common/result.hpp"

#include <filesystem>
#include <string>

namespace sweguard::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Digest over every regular file and symlink under `root`: relative path, permission
/// bits and content, visited in sorted order.
[[nodiscard]] Result<std::string> fingerprint_tree(const std::filesystem::path &root);

} // namespace sweguard::common
