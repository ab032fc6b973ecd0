#pragma once

#include "sweguard/common/result.hpp"

#include <string>
#include <vector>

namespace sweguard::security {

struct Redirection {
  int fd = -1;
  std::string op;
  std::string target;

  /// True when the redirection opens `target` for writing (not an fd duplication).
  [[nodiscard]] bool writes() const;
  [[nodiscard]] bool reads() const;
};

/// One simple command: optional NAME=value prefixes, argv and its redirections.
/// Words keep their expansion syntax ($VAR, ~, globs); quotes are removed.
struct SimpleCommand {
  std::vector<std::string> assignments;
  std::vector<std::string> argv;
  std::vector<Redirection> redirections;
  std::size_t depth = 0;
};

constexpr std::size_t kMaxShellNesting = 8;

/// Splits a shell command line into simple commands. Separators (; && || | & newline),
/// subshell parentheses and reserved words are dropped; command substitutions are parsed
/// into additional commands one level deeper. Heredoc bodies are skipped.
[[nodiscard]] common::Result<std::vector<SimpleCommand>>
parse_shell_command(const std::string &command, std::size_t depth = 0);

} // namespace sweguard::security
