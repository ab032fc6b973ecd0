#include "sweguard/patch/diff.hpp"

#include "sweguard/common/fs.hpp"

#include <algorithm>
#include <set>

namespace sweguard::patch {

namespace {

std::string unquote_c_path(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return raw;
  }
  std::string out;
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] == '\\' && i + 2 < raw.size()) {
      const char next = raw[++i];
      out.push_back(next == 't' ? '\t' : next == 'n' ? '\n' : next);
    } else {
      out.push_back(raw[i]);
    }
  }
  return out;
}

std::string header_path(const std::string &line, const std::size_t prefix_len) {
  std::string value = line.substr(prefix_len);
  // "--- a/file\t2024-01-01 00:00:00" carries a timestamp after a tab
  if (const auto tab = value.find('\t'); tab != std::string::npos) {
    value = value.substr(0, tab);
  }
  value = unquote_c_path(common::trim(value));
  if (value == "/dev/null") {
    return "";
  }
  if (common::starts_with(value, "a/") || common::starts_with(value, "b/")) {
    value = value.substr(2);
  }
  return value;
}

/// Splits "diff --git a/x b/x" into its two paths. Unquoted names containing " b/" are
/// split at the midpoint, which is correct whenever old and new path are identical.
std::pair<std::string, std::string> git_header_paths(const std::string &line) {
  const std::string rest = line.substr(std::string("diff --git ").size());
  if (!rest.empty() && rest.front() == '"') {
    const auto close = rest.find('"', 1);
    if (close != std::string::npos) {
      const std::string first = rest.substr(0, close + 1);
      const std::string second = common::trim(rest.substr(close + 1));
      return {header_path(first, 0), header_path(second, 0)};
    }
  }
  const auto split = rest.find(" b/");
  if (split == std::string::npos) {
    return {"", ""};
  }
  if (rest.size() % 2 == 1) {
    const std::size_t mid = rest.size() / 2;
    if (rest[mid] == ' ' && rest.substr(2, mid - 2) == rest.substr(mid + 3)) {
      return {rest.substr(2, mid - 2), rest.substr(mid + 3)};
    }
  }
  return {header_path(rest.substr(0, split), 0), header_path(rest.substr(split + 1), 0)};
}

} // namespace

common::Result<std::vector<DiffFile>> parse_diff(const std::string &diff) {
  std::vector<DiffFile> files;
  bool in_git_header = false;

  const auto lines = common::split_lines(diff);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (common::starts_with(line, "diff --git ")) {
      auto [old_path, new_path] = git_header_paths(line);
      files.push_back(DiffFile{.old_path = old_path, .new_path = new_path});
      in_git_header = true;
      continue;
    }
    // a "--- " line only opens a file when "+++ " follows; inside a hunk it is a removed line
    if (common::starts_with(line, "--- ") && i + 1 < lines.size() &&
        common::starts_with(lines[i + 1], "+++ ")) {
      const std::string old_path = header_path(line, 4);
      const std::string new_path = header_path(lines[i + 1], 4);
      if (!in_git_header) {
        files.push_back(DiffFile{});
      }
      files.back().old_path = old_path;
      files.back().new_path = new_path;
      files.back().created = files.back().created || old_path.empty();
      files.back().deleted = files.back().deleted || new_path.empty();
      in_git_header = false;
      ++i;
      continue;
    }
    if (files.empty()) {
      continue;
    }
    if (common::starts_with(line, "@@ ")) {
      ++files.back().hunks;
      in_git_header = false;
    } else if (!in_git_header) {
      continue;
    } else if (common::starts_with(line, "new file mode")) {
      files.back().created = true;
    } else if (common::starts_with(line, "deleted file mode")) {
      files.back().deleted = true;
    } else if (common::starts_with(line, "rename from ")) {
      files.back().old_path = unquote_c_path(line.substr(12));
    } else if (common::starts_with(line, "rename to ")) {
      files.back().new_path = unquote_c_path(line.substr(10));
    }
  }

  if (files.empty()) {
    return common::Result<std::vector<DiffFile>>::failure("no file headers found in diff");
  }
  return common::Result<std::vector<DiffFile>>::success(std::move(files));
}

std::vector<std::string> touched_paths(const std::string &diff) {
  std::set<std::string> paths;
  const auto parsed = parse_diff(diff);
  if (!parsed.ok()) {
    return {};
  }
  for (const auto &file : parsed.value()) {
    if (!file.old_path.empty()) {
      paths.insert(file.old_path);
    }
    if (!file.new_path.empty()) {
      paths.insert(file.new_path);
    }
  }
  return {paths.begin(), paths.end()};
}

} // namespace sweguard::patch
