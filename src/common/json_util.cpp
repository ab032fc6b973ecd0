#include "sweguard/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace sweguard::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

std::size_t scan_literal_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                     const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

Result<JsonFlatMap> json_parse_object(const std::string &input) {
  const std::string json = [&input] {
    std::size_t start = json_skip_ws(input, 0);
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
      --end;
    }
    return input.substr(start, end - start);
  }();

  if (json.size() < 2 || json.front() != '{' || json.back() != '}') {
    return Result<JsonFlatMap>::failure("expected a JSON object");
  }

  JsonFlatMap result;
  std::size_t pos = 1;
  bool expect_member = true;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      return Result<JsonFlatMap>::failure("unterminated JSON object");
    }
    if (json[pos] == '}') {
      if (pos != json.size() - 1) {
        return Result<JsonFlatMap>::failure("trailing data after JSON object");
      }
      break;
    }
    if (!expect_member) {
      if (json[pos] != ',') {
        return Result<JsonFlatMap>::failure("expected ',' at offset " + std::to_string(pos));
      }
      ++pos;
      expect_member = true;
      continue;
    }

    if (json[pos] != '"') {
      return Result<JsonFlatMap>::failure("expected key at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return Result<JsonFlatMap>::failure("unterminated key");
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return Result<JsonFlatMap>::failure("expected ':' after key '" + key + "'");
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      return Result<JsonFlatMap>::failure("missing value for key '" + key + "'");
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unterminated string for key '" + key + "'");
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        return Result<JsonFlatMap>::failure("unbalanced value for key '" + key + "'");
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t end = scan_literal_end(json, pos);
      if (end == pos) {
        return Result<JsonFlatMap>::failure("empty value for key '" + key + "'");
      }
      result[key] = json.substr(pos, end - pos);
      pos = end;
    }
    expect_member = false;
  }

  return Result<JsonFlatMap>::success(std::move(result));
}

JsonFlatMap json_parse_flat(const std::string &json) {
  auto parsed = json_parse_object(json);
  if (!parsed.ok()) {
    return {};
  }
  return std::move(parsed.value());
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &input) {
  std::size_t pos = json_skip_ws(input, 0);
  if (pos >= input.size() || input[pos] != '[') {
    return Result<std::vector<std::string>>::failure("expected a JSON array");
  }
  const auto close = json_find_matching_token(input, pos, '[', ']');
  if (close == std::string::npos || json_skip_ws(input, close + 1) != input.size()) {
    return Result<std::vector<std::string>>::failure("malformed JSON array");
  }

  std::vector<std::string> out;
  ++pos;
  bool expect_value = true;
  while (true) {
    pos = json_skip_ws(input, pos);
    if (pos == close) {
      if (expect_value && !out.empty()) {
        return Result<std::vector<std::string>>::failure("trailing ',' in JSON array");
      }
      break;
    }
    if (!expect_value) {
      if (input[pos] != ',') {
        return Result<std::vector<std::string>>::failure("expected ',' in JSON array");
      }
      ++pos;
      expect_value = true;
      continue;
    }
    if (input[pos] != '"') {
      return Result<std::vector<std::string>>::failure("array element is not a string");
    }
    const auto end = json_find_string_end(input, pos);
    if (end == std::string::npos || end > close) {
      return Result<std::vector<std::string>>::failure("unterminated string in JSON array");
    }
    out.push_back(json_unescape(input.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
    expect_value = false;
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += json_quote(values[i]);
  }
  out += "]";
  return out;
}

bool json_parse_u64(const std::string &raw, std::uint64_t &out) {
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // namespace sweguard::common
