#pragma once

#include "sweguard/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sweguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Lexically normalizes `path` against `base` without touching the filesystem.
/// The result is absolute when `base` is absolute and has no trailing separator.
[[nodiscard]] std::filesystem::path resolve_lexically(const std::filesystem::path &base,
                                                      const std::filesystem::path &path);

/// Single-quotes `value` for POSIX shells.
[[nodiscard]] std::string shell_quote(const std::string &value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Keeps at most `limit` bytes of `text`, appending a note with the dropped byte count.
[[nodiscard]] std::string truncate_output(const std::string &text, std::size_t limit);

[[nodiscard]] std::string now_rfc3339();

} // namespace sweguard::common
