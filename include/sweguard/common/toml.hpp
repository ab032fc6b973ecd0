#pragma once

#include "sweguard/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sweguard::common {

/// Flat view of a TOML file: every value is stored under its dotted `section.key` path
/// as raw text and converted on access.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

/// Supports sections, basic and literal strings, integers, floats, booleans and
/// (possibly multi-line) arrays of scalars.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace sweguard::common
