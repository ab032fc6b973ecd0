#include "sweguard/security/shell_words.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_set>

namespace sweguard::security {

namespace {

bool is_identifier_assignment(const std::string &word) {
  const auto eq = word.find('=');
  if (eq == std::string::npos || eq == 0) {
    return false;
  }
  if (std::isalpha(static_cast<unsigned char>(word[0])) == 0 && word[0] != '_') {
    return false;
  }
  return std::all_of(word.begin(), word.begin() + static_cast<std::ptrdiff_t>(eq),
                     [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; });
}

bool all_digits(const std::string &value) {
  return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

const std::unordered_set<std::string> &reserved_words() {
  static const std::unordered_set<std::string> words = {
      "if", "then", "else", "elif", "fi", "do", "done", "while", "until", "{", "}", "!", "esac"};
  return words;
}

class ShellLexer {
public:
  ShellLexer(const std::string &input, const std::size_t depth) : s_(input), depth_(depth) {}

  common::Result<std::vector<SimpleCommand>> run() {
    while (pos_ < s_.size() && error_.empty()) {
      step();
    }
    if (error_.empty()) {
      finish_word();
      end_command();
    }
    if (!error_.empty()) {
      return common::Result<std::vector<SimpleCommand>>::failure(error_);
    }

    for (const auto &inner : substitutions_) {
      if (depth_ + 1 > kMaxShellNesting) {
        return common::Result<std::vector<SimpleCommand>>::failure("command nesting too deep");
      }
      auto nested = parse_shell_command(inner, depth_ + 1);
      if (!nested.ok()) {
        return nested;
      }
      for (auto &command : nested.value()) {
        commands_.push_back(std::move(command));
      }
    }
    return common::Result<std::vector<SimpleCommand>>::success(std::move(commands_));
  }

private:
  void step() {
    const char c = s_[pos_];
    const char next = pos_ + 1 < s_.size() ? s_[pos_ + 1] : '\0';

    if (c == '\\') {
      if (next == '\n') {
        pos_ += 2;
      } else if (next != '\0') {
        word_.push_back(next);
        started_ = true;
        quoted_ = true;
        pos_ += 2;
      } else {
        word_.push_back('\\');
        started_ = true;
        ++pos_;
      }
      return;
    }
    if (c == '\'') {
      const auto end = s_.find('\'', pos_ + 1);
      if (end == std::string::npos) {
        error_ = "unterminated single quote";
        return;
      }
      word_ += s_.substr(pos_ + 1, end - pos_ - 1);
      started_ = true;
      quoted_ = true;
      pos_ = end + 1;
      return;
    }
    if (c == '"') {
      read_double_quoted();
      return;
    }
    if (c == '`') {
      read_backticks();
      return;
    }
    if (c == '$' && next == '(') {
      read_dollar_paren();
      return;
    }
    if (c == '$' && next == '\'') {
      const auto end = find_unescaped(s_, '\'', pos_ + 2);
      if (end == std::string::npos) {
        error_ = "unterminated $'' quote";
        return;
      }
      word_ += s_.substr(pos_ + 2, end - pos_ - 2);
      started_ = true;
      quoted_ = true;
      pos_ = end + 1;
      return;
    }
    if (c == '$' && next == '{') {
      const auto end = s_.find('}', pos_ + 2);
      if (end == std::string::npos) {
        error_ = "unterminated ${";
        return;
      }
      word_ += s_.substr(pos_, end - pos_ + 1);
      started_ = true;
      pos_ = end + 1;
      return;
    }
    if (c == '#' && !started_) {
      while (pos_ < s_.size() && s_[pos_] != '\n') {
        ++pos_;
      }
      return;
    }
    if (c == '\n') {
      finish_word();
      end_command();
      ++pos_;
      skip_heredoc_bodies();
      return;
    }
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      finish_word();
      ++pos_;
      return;
    }
    if (c == '&' && next == '>') {
      finish_word();
      const bool append = pos_ + 2 < s_.size() && s_[pos_ + 2] == '>';
      open_redirection(-1, append ? "&>>" : "&>");
      pos_ += append ? 3 : 2;
      return;
    }
    if (c == '>' || c == '<') {
      read_redirection_operator();
      return;
    }
    if (c == ';' || c == '&' || c == '|' || c == '(' || c == ')') {
      finish_word();
      end_command();
      ++pos_;
      if ((c == '&' || c == '|' || c == ';') && pos_ < s_.size() &&
          (s_[pos_] == c || (c == '|' && s_[pos_] == '&') || (c == ';' && s_[pos_] == '&'))) {
        ++pos_;
      }
      return;
    }

    word_.push_back(c);
    started_ = true;
    ++pos_;
  }

  static std::size_t find_unescaped(const std::string &text, const char target,
                                    std::size_t from) {
    for (std::size_t i = from; i < text.size(); ++i) {
      if (text[i] == '\\') {
        ++i;
        continue;
      }
      if (text[i] == target) {
        return i;
      }
    }
    return std::string::npos;
  }

  /// Index of the ')' closing the '(' at `open`, skipping quoted text.
  std::size_t find_paren_end(std::size_t open) const {
    int depth = 0;
    for (std::size_t i = open; i < s_.size(); ++i) {
      const char c = s_[i];
      if (c == '\\') {
        ++i;
      } else if (c == '\'') {
        const auto end = s_.find('\'', i + 1);
        if (end == std::string::npos) {
          return std::string::npos;
        }
        i = end;
      } else if (c == '"') {
        const auto end = find_unescaped(s_, '"', i + 1);
        if (end == std::string::npos) {
          return std::string::npos;
        }
        i = end;
      } else if (c == '(') {
        ++depth;
      } else if (c == ')') {
        if (--depth == 0) {
          return i;
        }
      }
    }
    return std::string::npos;
  }

  void read_backticks() {
    const auto end = find_unescaped(s_, '`', pos_ + 1);
    if (end == std::string::npos) {
      error_ = "unterminated backtick substitution";
      return;
    }
    substitutions_.push_back(s_.substr(pos_ + 1, end - pos_ - 1));
    word_ += s_.substr(pos_, end - pos_ + 1);
    started_ = true;
    pos_ = end + 1;
  }

  void read_dollar_paren() {
    const auto end = find_paren_end(pos_ + 1);
    if (end == std::string::npos) {
      error_ = "unterminated $( substitution";
      return;
    }
    std::string inner = s_.substr(pos_ + 2, end - pos_ - 2);
    // $(( arithmetic )) carries no commands
    if (inner.empty() || inner.front() != '(') {
      substitutions_.push_back(std::move(inner));
    }
    word_ += s_.substr(pos_, end - pos_ + 1);
    started_ = true;
    pos_ = end + 1;
  }

  void read_double_quoted() {
    started_ = true;
    quoted_ = true;
    ++pos_;
    while (pos_ < s_.size()) {
      const char c = s_[pos_];
      const char next = pos_ + 1 < s_.size() ? s_[pos_ + 1] : '\0';
      if (c == '"') {
        ++pos_;
        return;
      }
      if (c == '\\' && next != '\0' && std::strchr("\"\\$`\n", next) != nullptr) {
        if (next != '\n') {
          word_.push_back(next);
        }
        pos_ += 2;
        continue;
      }
      if (c == '`') {
        read_backticks();
        if (!error_.empty()) {
          return;
        }
        continue;
      }
      if (c == '$' && next == '(') {
        read_dollar_paren();
        if (!error_.empty()) {
          return;
        }
        continue;
      }
      word_.push_back(c);
      ++pos_;
    }
    error_ = "unterminated double quote";
  }

  void read_redirection_operator() {
    int fd = -1;
    if (started_ && !quoted_ && all_digits(word_)) {
      fd = std::stoi(word_);
      word_.clear();
      started_ = false;
    } else {
      finish_word();
    }

    static const char *kOperators[] = {"<<<", "<<-", ">>", ">|", ">&", "<<", "<&", "<>", ">", "<"};
    for (const char *op : kOperators) {
      const std::size_t len = std::strlen(op);
      if (s_.compare(pos_, len, op) == 0) {
        if (fd < 0) {
          fd = op[0] == '<' ? 0 : 1;
        }
        open_redirection(fd, op);
        pos_ += len;
        return;
      }
    }
    ++pos_;
  }

  void open_redirection(const int fd, std::string op) {
    if (pending_redirection_) {
      error_ = "redirection without target";
      return;
    }
    pending_ = Redirection{.fd = fd, .op = std::move(op), .target = ""};
    pending_redirection_ = true;
  }

  void finish_word() {
    if (!started_) {
      return;
    }
    if (pending_redirection_) {
      pending_.target = word_;
      if (pending_.op == "<<" || pending_.op == "<<-") {
        heredocs_.push_back({word_, pending_.op == "<<-"});
      }
      current_.redirections.push_back(pending_);
      pending_redirection_ = false;
    } else if (current_.argv.empty() && !quoted_ && is_identifier_assignment(word_)) {
      current_.assignments.push_back(word_);
    } else if (current_.argv.empty() && !quoted_ && reserved_words().contains(word_)) {
      // keyword, the next word is the command
    } else {
      current_.argv.push_back(word_);
    }
    word_.clear();
    started_ = false;
    quoted_ = false;
  }

  void end_command() {
    if (pending_redirection_) {
      error_ = "redirection without target";
      return;
    }
    if (!current_.argv.empty() || !current_.redirections.empty() ||
        !current_.assignments.empty()) {
      current_.depth = depth_;
      commands_.push_back(std::move(current_));
    }
    current_ = SimpleCommand{};
  }

  void skip_heredoc_bodies() {
    for (const auto &[delimiter, strip_tabs] : heredocs_) {
      while (pos_ < s_.size()) {
        auto eol = s_.find('\n', pos_);
        if (eol == std::string::npos) {
          eol = s_.size();
        }
        std::string line = s_.substr(pos_, eol - pos_);
        pos_ = eol < s_.size() ? eol + 1 : eol;
        if (strip_tabs) {
          line.erase(0, line.find_first_not_of('\t') == std::string::npos
                            ? line.size()
                            : line.find_first_not_of('\t'));
        }
        if (line == delimiter) {
          break;
        }
      }
    }
    heredocs_.clear();
  }

  const std::string &s_;
  std::size_t depth_;
  std::size_t pos_ = 0;

  std::string word_;
  bool started_ = false;
  bool quoted_ = false;

  SimpleCommand current_;
  Redirection pending_;
  bool pending_redirection_ = false;
  std::vector<std::pair<std::string, bool>> heredocs_;

  std::vector<SimpleCommand> commands_;
  std::vector<std::string> substitutions_;
  std::string error_;
};

} // namespace

bool Redirection::writes() const {
  if (op == ">" || op == ">>" || op == ">|" || op == "&>" || op == "&>>" || op == "<>") {
    return true;
  }
  // ">&file" writes to file; ">&2" and ">&-" duplicate or close descriptors
  return op == ">&" && !all_digits(target) && target != "-";
}

bool Redirection::reads() const { return op == "<" || op == "<>"; }

common::Result<std::vector<SimpleCommand>> parse_shell_command(const std::string &command,
                                                               const std::size_t depth) {
  ShellLexer lexer(command, depth);
  return lexer.run();
}

} // namespace sweguard::security
