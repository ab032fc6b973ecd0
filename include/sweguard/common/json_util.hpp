#pragma once

#include "sweguard/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sweguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body, including \uXXXX sequences and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                   char open_ch, char close_ch);

/// Parse a JSON object into a key→raw value map, top-level keys only.
/// String values are unescaped; objects, arrays, numbers and literals are kept verbatim.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] Result<JsonFlatMap> json_parse_object(const std::string &json);

/// Lenient variant: returns an empty map for malformed input.
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Parse an array literal of strings like ["a","b"].
[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Render a string vector as a JSON array literal.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

[[nodiscard]] bool json_parse_u64(const std::string &raw, std::uint64_t &out);

} // namespace sweguard::common
