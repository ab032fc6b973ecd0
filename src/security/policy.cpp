#include "sweguard/security/policy.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/security/shell_words.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace sweguard::security {

const std::array<const char *, 10> SYSTEM_DENY_PATHS = {
    "/tmp", "/var/tmp", "/etc", "/root", "/home", "/proc", "/sys", "/dev", "/boot", "/run"};

namespace {

namespace fs = std::filesystem;

constexpr const char *SANDBOX_HOME = "/root";
constexpr const char *SANDBOX_TMP = "/tmp";

using WordSet = std::unordered_set<std::string>;

std::string base_name(const std::string &program) {
  const auto slash = program.find_last_of('/');
  return slash == std::string::npos ? program : program.substr(slash + 1);
}

bool is_short_option(const std::string &word) {
  return word.size() > 1 && word[0] == '-' && word[1] != '-';
}

bool is_option(const std::string &word) { return word.size() > 1 && word[0] == '-'; }

bool has_glob(const std::string &text) { return text.find_first_of("*?[") != std::string::npos; }

void substitute_var(std::string &text, const std::string &name, const std::string &value) {
  for (const std::string &form : {"${" + name + "}", "$" + name}) {
    std::size_t pos = 0;
    while ((pos = text.find(form, pos)) != std::string::npos) {
      const std::size_t end = pos + form.size();
      const bool braced = form[1] == '{';
      if (!braced && end < text.size() &&
          (std::isalnum(static_cast<unsigned char>(text[end])) != 0 || text[end] == '_')) {
        pos = end;
        continue;
      }
      text.replace(pos, form.size(), value);
      pos += value.size();
    }
  }
}

/// Substitutes ~, $HOME, $TMPDIR and $PWD. Anything still expandable afterwards is opaque.
std::optional<std::string> expand_word(const std::string &word, const fs::path &cwd) {
  std::string out = word;
  if (out == "~" || common::starts_with(out, "~/")) {
    out = std::string(SANDBOX_HOME) + out.substr(1);
  } else if (common::starts_with(out, "~")) {
    out = "/home/" + out.substr(1);
  }
  substitute_var(out, "HOME", SANDBOX_HOME);
  substitute_var(out, "TMPDIR", SANDBOX_TMP);
  substitute_var(out, "PWD", cwd.string());
  if (out.find('$') != std::string::npos || out.find('`') != std::string::npos ||
      out.find("{}") != std::string::npos) {
    return std::nullopt;
  }
  return out;
}

bool looks_like_path(const std::string &word) {
  if (word.empty() || word.find("://") != std::string::npos) {
    return false;
  }
  if (std::any_of(word.begin(), word.end(),
                  [](unsigned char c) { return std::isspace(c) != 0; })) {
    return false;
  }
  const char first = word.front();
  if (first == '/' || first == '~' || first == '.') {
    return true;
  }
  for (const char *prefix : {"$HOME", "${HOME}", "$TMPDIR", "${TMPDIR}", "$PWD", "${PWD}"}) {
    if (common::starts_with(word, prefix)) {
      return true;
    }
  }
  return word.find('/') != std::string::npos;
}

/// Non-option arguments, skipping the value of options listed in `value_options`.
std::vector<std::string> operands(const std::vector<std::string> &args,
                                  const WordSet &value_options = {}) {
  std::vector<std::string> out;
  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    if (!options_done && is_option(arg)) {
      if (value_options.contains(arg)) {
        ++i;
      }
      continue;
    }
    out.push_back(arg);
  }
  return out;
}

std::optional<std::string> option_value(const std::vector<std::string> &args,
                                        const std::string &short_flag,
                                        const std::string &long_flag) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if ((args[i] == short_flag || args[i] == long_flag) && i + 1 < args.size()) {
      return args[i + 1];
    }
    if (!long_flag.empty() && common::starts_with(args[i], long_flag + "=")) {
      return args[i].substr(long_flag.size() + 1);
    }
  }
  return std::nullopt;
}

bool contains_word(const std::vector<std::string> &args, const std::string &word) {
  return std::find(args.begin(), args.end(), word) != args.end();
}

struct PathUse {
  std::string word;
  fs::path resolved;
  bool program = false;
};

struct Mutation {
  std::string what;
  std::vector<std::string> targets;
  bool unknown = false;
  bool outside = false;
  bool tree_wide = false;
  // interpreter code whose effects cannot be read from the command line
  bool code = false;
};

struct CommandFacts {
  fs::path cwd;
  std::vector<std::string> argv;
  std::vector<PathUse> paths;
  std::vector<Mutation> mutations;
  std::string cd_violation;
  std::optional<std::string> script;
};

struct GitInvocation {
  std::string subcommand;
  std::vector<std::string> args;
};

GitInvocation parse_git(const std::vector<std::string> &args) {
  static const WordSet global_value_options = {"-C",          "-c",         "--git-dir",
                                               "--work-tree", "--namespace", "--exec-path"};
  std::size_t i = 0;
  while (i < args.size() && is_option(args[i])) {
    i += global_value_options.contains(args[i]) ? 2 : 1;
  }
  GitInvocation invocation;
  if (i < args.size()) {
    invocation.subcommand = args[i];
    invocation.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
  }
  return invocation;
}

const WordSet &git_value_options() {
  static const WordSet options = {
      "-n",      "--max-count", "--author", "--committer", "--grep",     "--since",
      "--until", "--after",     "--before", "--format",    "--pretty",   "-S",
      "-G",      "-L",          "-U",       "--skip",      "-e",         "-f",
      "-m",      "-F",          "-b",       "-B",          "-c",         "-o",
      "--date",  "--message",   "--file",   "--template",  "-t"};
  return options;
}

/// Operands of a git subcommand, skipping option values and anything after `--`.
std::vector<std::string> git_revision_operands(const GitInvocation &git) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < git.args.size(); ++i) {
    const std::string &arg = git.args[i];
    if (arg == "--") {
      break;
    }
    if (is_option(arg)) {
      if (git_value_options().contains(arg)) {
        ++i;
      }
      continue;
    }
    out.push_back(arg);
  }
  if (git.subcommand == "grep" && !contains_word(git.args, "-e") && !out.empty()) {
    out.erase(out.begin());
  }
  return out;
}

/// Operands git treats as paths: everything after `--`, plus plain operands.
std::vector<std::string> git_path_operands(const GitInvocation &git) {
  std::vector<std::string> out;
  bool options_done = false;
  for (std::size_t i = 0; i < git.args.size(); ++i) {
    const std::string &arg = git.args[i];
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    if (!options_done && is_option(arg)) {
      if (git_value_options().contains(arg) ||
          (is_short_option(arg) && arg.size() > 2 && arg.back() == 'm')) {
        ++i;
      }
      continue;
    }
    out.push_back(arg);
  }
  return out;
}

bool revision_beyond_ceiling(std::string rev) {
  if (rev.find("@{") != std::string::npos) {
    return true;
  }
  if (!rev.empty() && rev.front() == '^') {
    rev.erase(0, 1);
  }
  if (const auto colon = rev.find(':'); colon != std::string::npos) {
    rev = rev.substr(0, colon);
  }
  if (const auto suffix = rev.find_first_of("~^"); suffix != std::string::npos) {
    rev = rev.substr(0, suffix);
  }
  if (rev.empty() || rev == "HEAD" || rev == "@") {
    return false;
  }

  static const WordSet special_heads = {"FETCH_HEAD",       "ORIG_HEAD",   "MERGE_HEAD",
                                        "CHERRY_PICK_HEAD", "REBASE_HEAD", "AUTO_MERGE",
                                        "main",             "master",      "develop",
                                        "trunk",            "stash"};
  if (special_heads.contains(rev)) {
    return true;
  }
  for (const char *prefix : {"refs/", "origin/", "upstream/", "remotes/"}) {
    if (common::starts_with(rev, prefix)) {
      return true;
    }
  }
  // Object ids and paths name only what survived pruning at provision time.
  return false;
}

std::string git_ancestry_violation(const std::vector<std::string> &args) {
  const GitInvocation git = parse_git(args);
  if (git.subcommand.empty()) {
    return "";
  }

  static const WordSet history_fetching = {"fetch", "pull", "clone", "ls-remote", "reflog",
                                           "fetch-pack"};
  if (history_fetching.contains(git.subcommand)) {
    return "git " + git.subcommand + " is not allowed";
  }
  if (git.subcommand == "remote" &&
      (contains_word(git.args, "update") || contains_word(git.args, "prune"))) {
    return "git remote update is not allowed";
  }
  if (git.subcommand == "branch") {
    for (const char *flag : {"-a", "-r", "--all", "--remotes"}) {
      if (contains_word(git.args, flag)) {
        return std::string("git branch ") + flag + " is not allowed";
      }
    }
  }

  static const WordSet revision_subcommands = {
      "log",        "show",        "rev-list",    "rev-parse", "diff",        "shortlog",
      "whatchanged", "show-branch", "describe",   "name-rev",  "blame",       "annotate",
      "cat-file",   "ls-tree",     "archive",     "format-patch", "cherry",   "range-diff",
      "merge-base", "checkout",    "switch",      "reset",     "cherry-pick", "revert",
      "rebase",     "merge",       "grep",        "bisect",    "diff-tree",   "restore"};
  if (!revision_subcommands.contains(git.subcommand)) {
    return "";
  }

  for (const auto &arg : git.args) {
    if (arg == "--") {
      break;
    }
    const bool enumerates_refs =
        arg == "--all" || arg == "--reflog" || arg == "-g" || arg == "--walk-reflogs" ||
        arg == "--branches" || common::starts_with(arg, "--branches=") || arg == "--tags" ||
        common::starts_with(arg, "--tags=") || arg == "--remotes" ||
        common::starts_with(arg, "--remotes=") || common::starts_with(arg, "--glob=") ||
        common::starts_with(arg, "--exclude=");
    if (enumerates_refs) {
      return "git flag " + arg + " is not allowed";
    }
  }

  for (const auto &token : git_revision_operands(git)) {
    std::vector<std::string> sides;
    if (const auto dots = token.find(".."); dots != std::string::npos) {
      const std::size_t width = token.compare(dots, 3, "...") == 0 ? 3 : 2;
      sides.push_back(token.substr(0, dots));
      sides.push_back(token.substr(dots + width));
    } else {
      sides.push_back(token);
    }
    for (const auto &side : sides) {
      if (revision_beyond_ceiling(side)) {
        return "git revision '" + token + "' is beyond the ancestry ceiling";
      }
    }
  }
  return "";
}

void classify_git(const std::vector<std::string> &args, CommandFacts &facts) {
  const GitInvocation git = parse_git(args);
  static const WordSet mutating = {
      "add",   "am",    "apply",    "checkout", "switch",   "restore",    "reset",
      "commit", "merge", "rebase",  "cherry-pick", "revert", "stash",     "clean",
      "rm",    "mv",    "init",     "gc",       "prune",    "worktree",   "update-ref",
      "notes", "update-index", "branch", "tag"};
  if (!mutating.contains(git.subcommand)) {
    return;
  }

  const auto paths = git_path_operands(git);
  if (git.subcommand == "apply") {
    const bool inspect_only = contains_word(git.args, "--check") ||
                              contains_word(git.args, "--stat") ||
                              contains_word(git.args, "--numstat") ||
                              contains_word(git.args, "--summary");
    if (inspect_only && !contains_word(git.args, "--apply")) {
      return;
    }
    facts.mutations.push_back(
        Mutation{.what = "git apply", .targets = {}, .unknown = true, .tree_wide = true});
    return;
  }
  if ((git.subcommand == "stash" || git.subcommand == "worktree" || git.subcommand == "notes") &&
      !paths.empty() && (paths.front() == "list" || paths.front() == "show")) {
    return;
  }
  if (git.subcommand == "branch" || git.subcommand == "tag") {
    for (const char *flag : {"--list", "-l", "--show-current", "--contains", "--merged",
                             "--no-merged", "--points-at", "-v", "-vv"}) {
      if (contains_word(git.args, flag)) {
        return;
      }
    }
    if (paths.empty()) {
      return;
    }
    facts.mutations.push_back(
        Mutation{.what = "git " + git.subcommand, .targets = {}, .tree_wide = true});
    return;
  }

  std::vector<std::string> targets;
  const bool path_subcommand = git.subcommand == "add" || git.subcommand == "rm" ||
                               git.subcommand == "mv" || git.subcommand == "restore" ||
                               git.subcommand == "checkout" || git.subcommand == "reset" ||
                               git.subcommand == "clean" || git.subcommand == "commit";
  if (path_subcommand) {
    targets = paths;
  }
  facts.mutations.push_back(
      Mutation{.what = "git " + git.subcommand, .targets = targets, .tree_wide = true});
}

bool is_package_install(const std::string &name, const std::vector<std::string> &args) {
  const auto ops = operands(args);
  const std::string sub = ops.empty() ? "" : ops.front();
  if (common::starts_with(name, "pip")) {
    return sub == "install" || sub == "uninstall" || sub == "wheel";
  }
  if (common::starts_with(name, "python")) {
    if (args.size() >= 3 && args[0] == "-m" && common::starts_with(args[1], "pip")) {
      return args[2] == "install" || args[2] == "uninstall";
    }
    return !ops.empty() && base_name(ops.front()) == "setup.py" &&
           (contains_word(args, "install") || contains_word(args, "develop"));
  }
  if (name == "npm" || name == "yarn" || name == "pnpm") {
    static const WordSet subs = {"install", "i", "add", "ci", "uninstall", "remove", "rm",
                                 "update", "link"};
    return subs.contains(sub);
  }
  if (name == "conda" || name == "mamba" || name == "poetry") {
    static const WordSet subs = {"install", "remove", "create", "update", "uninstall", "add"};
    return subs.contains(sub);
  }
  if (name == "apt" || name == "apt-get" || name == "yum" || name == "dnf" || name == "apk") {
    static const WordSet subs = {"install", "remove", "add", "del", "purge", "upgrade",
                                 "update"};
    return subs.contains(sub);
  }
  return name == "easy_install";
}

bool sed_in_place(const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    if (arg == "--in-place" || common::starts_with(arg, "--in-place=") ||
        common::starts_with(arg, "-i")) {
      return true;
    }
    if (is_short_option(arg)) {
      const auto i = arg.find('i');
      if (i != std::string::npos &&
          arg.find_first_not_of("nsrEuz", 1) == i) {
        return true;
      }
    }
  }
  return false;
}

bool perl_in_place(const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    if (!is_short_option(arg)) {
      continue;
    }
    const auto i = arg.find('i');
    const auto e = arg.find_first_of("eE");
    if (i != std::string::npos && (e == std::string::npos || i < e) &&
        arg.find_first_not_of("pnlaw0", 1) == i) {
      return true;
    }
  }
  return false;
}

/// Files an in-place editor rewrites: every operand after the script.
std::vector<std::string> script_targets(const std::vector<std::string> &args,
                                        const WordSet &script_options) {
  std::vector<std::string> out;
  bool script_given = false;
  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    if (!options_done && is_option(arg)) {
      if (script_options.contains(arg)) {
        script_given = true;
        ++i;
      } else if (is_short_option(arg) && arg.find_first_of("eE") != std::string::npos &&
                 script_options.contains("-e")) {
        // clustered form such as -pie 's/a/b/'
        script_given = true;
        ++i;
      }
      continue;
    }
    if (!script_given) {
      script_given = true;
      continue;
    }
    out.push_back(arg);
  }
  return out;
}

bool is_shell(const std::string &name) {
  return name == "bash" || name == "sh" || name == "zsh" || name == "dash" || name == "ksh";
}

struct InterpreterSyntax {
  WordSet code_options;
  WordSet value_options;
  WordSet info_options;
  // short-option letters that introduce program text inside a cluster such as -ne
  std::string code_letters;
  // short-option letters that take the rest of the word as their value
  std::string attached_letters;
  bool module_option = false;
};

const InterpreterSyntax *interpreter_syntax(const std::string &name) {
  static const InterpreterSyntax python{.code_options = {"-c"},
                                        .value_options = {"-W", "-X", "-Q"},
                                        .info_options = {"-V", "--version", "-h", "--help"},
                                        .code_letters = "c",
                                        .attached_letters = "WXQ",
                                        .module_option = true};
  static const InterpreterSyntax perl{.code_options = {"-e", "-E"},
                                      .value_options = {"-I", "-M", "-m"},
                                      .info_options = {"-v", "-V", "-h", "--version", "--help"},
                                      .code_letters = "eE",
                                      .attached_letters = "IMmxFCd"};
  static const InterpreterSyntax ruby{.code_options = {"-e"},
                                      .value_options = {"-I", "-r", "-C", "-E"},
                                      .info_options = {"-v", "--version", "-h", "--help"},
                                      .code_letters = "e",
                                      .attached_letters = "IrCEFKTx"};
  static const InterpreterSyntax node{.code_options = {"-e", "--eval", "-p", "--print"},
                                      .value_options = {"-r", "--require", "--import"},
                                      .info_options = {"-v", "--version", "-h", "--help"}};
  static const InterpreterSyntax php{.code_options = {"-r", "-B", "-R", "-E"},
                                     .value_options = {"-c", "-d", "-z"},
                                     .info_options = {"-v", "--version", "-h", "--help", "-l"}};
  static const InterpreterSyntax lua{.code_options = {"-e"},
                                     .value_options = {"-l"},
                                     .info_options = {"-v"}};
  static const InterpreterSyntax rscript{.code_options = {"-e"},
                                         .info_options = {"--version", "--help"}};
  static const InterpreterSyntax shell{.value_options = {"-o", "-O"},
                                       .info_options = {"--version", "--help"},
                                       .code_letters = "s"};

  if (common::starts_with(name, "python") || common::starts_with(name, "pypy")) {
    return &python;
  }
  if (name == "perl") {
    return &perl;
  }
  if (name == "ruby") {
    return &ruby;
  }
  if (name == "node" || name == "nodejs") {
    return &node;
  }
  if (name == "php") {
    return &php;
  }
  if (common::starts_with(name, "lua")) {
    return &lua;
  }
  if (name == "Rscript") {
    return &rscript;
  }
  if (is_shell(name)) {
    return &shell;
  }
  return nullptr;
}

struct InterpreterRun {
  bool inline_code = false;
  std::optional<std::string> script;
};

/// How an interpreter gets its program: inline text, stdin, a script file, or not at all.
std::optional<InterpreterRun> interpreter_run(const std::string &name,
                                              const std::vector<std::string> &args) {
  if (name == "awk" || name == "gawk" || name == "mawk" || name == "nawk") {
    if (option_value(args, "-f", "--file").has_value()) {
      return InterpreterRun{.inline_code = true};
    }
    const auto ops = operands(args, {"-F", "-v", "--field-separator", "--assign"});
    if (ops.empty()) {
      return InterpreterRun{};
    }
    const std::string &program = ops.front();
    return InterpreterRun{.inline_code = program.find_first_of(">|") != std::string::npos ||
                                         program.find("system") != std::string::npos};
  }

  const InterpreterSyntax *syntax = interpreter_syntax(name);
  if (syntax == nullptr) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--") {
      if (i + 1 < args.size()) {
        return InterpreterRun{.script = args[i + 1]};
      }
      break;
    }
    if (arg == "-") {
      return InterpreterRun{.inline_code = true};
    }
    if (!is_option(arg)) {
      return InterpreterRun{.script = arg};
    }
    if (syntax->info_options.contains(arg)) {
      return InterpreterRun{};
    }
    if (syntax->code_options.contains(arg.substr(0, arg.find('=')))) {
      return InterpreterRun{.inline_code = true};
    }
    if (syntax->module_option && common::starts_with(arg, "-m")) {
      return InterpreterRun{};
    }
    if (syntax->value_options.contains(arg)) {
      ++i;
      continue;
    }
    if (is_short_option(arg)) {
      for (std::size_t c = 1; c < arg.size(); ++c) {
        if (syntax->attached_letters.find(arg[c]) != std::string::npos) {
          break;
        }
        if (syntax->code_letters.find(arg[c]) != std::string::npos) {
          return InterpreterRun{.inline_code = true};
        }
      }
    }
  }
  // no script operand: the program is read from stdin
  return InterpreterRun{.inline_code = true};
}

void classify_mutations(const std::string &name, const std::vector<std::string> &args,
                        CommandFacts &facts) {
  static const std::unordered_map<std::string, WordSet> plain_writers = {
      {"rm", {}},
      {"rmdir", {}},
      {"unlink", {}},
      {"shred", {"-n", "-s"}},
      {"touch", {"-d", "-t", "-r"}},
      {"truncate", {"-s", "-r", "--size", "--reference"}},
      {"mkdir", {"-m"}},
      {"mkfifo", {"-m"}},
      {"tee", {}},
  };

  if (const auto found = plain_writers.find(name); found != plain_writers.end()) {
    auto targets = operands(args, found->second);
    facts.mutations.push_back(Mutation{.what = name, .targets = std::move(targets)});
    return;
  }
  if (name == "mknod") {
    auto ops = operands(args, {"-m"});
    if (ops.size() > 1) {
      ops.resize(1);
    }
    facts.mutations.push_back(Mutation{.what = name, .targets = std::move(ops)});
    return;
  }
  if (name == "chmod" || name == "chown" || name == "chgrp") {
    auto ops = operands(args);
    const bool by_reference =
        std::any_of(args.begin(), args.end(),
                    [](const std::string &arg) { return common::starts_with(arg, "--reference="); });
    if (!by_reference && !ops.empty()) {
      ops.erase(ops.begin());
    }
    facts.mutations.push_back(Mutation{.what = name, .targets = std::move(ops)});
    return;
  }
  if (name == "mv") {
    auto ops = operands(args, {"-t", "-S"});
    if (const auto dir = option_value(args, "-t", "--target-directory"); dir.has_value()) {
      ops.push_back(*dir);
    }
    facts.mutations.push_back(Mutation{.what = name, .targets = std::move(ops)});
    return;
  }
  if (name == "cp" || name == "install" || name == "ln" || name == "rsync") {
    const WordSet value_options = {"-t", "-S", "-m", "-o", "-g", "-e", "--target-directory"};
    auto ops = operands(args, value_options);
    std::vector<std::string> targets;
    if (const auto dir = option_value(args, "-t", "--target-directory"); dir.has_value()) {
      targets.push_back(*dir);
    } else if (name == "install" && contains_word(args, "-d")) {
      targets = ops;
    } else if (ops.size() == 1 && name == "ln") {
      targets.push_back(".");
    } else if (!ops.empty()) {
      targets.push_back(ops.back());
    }
    const bool unresolved = targets.empty();
    facts.mutations.push_back(
        Mutation{.what = name, .targets = std::move(targets), .unknown = unresolved});
    return;
  }
  if (name == "dd") {
    for (const auto &arg : args) {
      if (common::starts_with(arg, "of=")) {
        facts.mutations.push_back(Mutation{.what = "dd", .targets = {arg.substr(3)}});
      }
    }
    return;
  }
  if (name == "sed" && sed_in_place(args)) {
    facts.mutations.push_back(
        Mutation{.what = "sed -i",
                 .targets = script_targets(args, {"-e", "-f", "--expression", "--file"})});
    return;
  }
  if (name == "perl" && perl_in_place(args)) {
    facts.mutations.push_back(
        Mutation{.what = "perl -i", .targets = script_targets(args, {"-e", "-E"})});
    return;
  }
  if (name == "patch") {
    if (contains_word(args, "--dry-run")) {
      return;
    }
    Mutation mutation{.what = "patch"};
    if (const auto out = option_value(args, "-o", "--output"); out.has_value()) {
      mutation.targets.push_back(*out);
    } else if (const auto ops = operands(args, {"-p", "-i", "-d", "-r", "-F", "-B", "-z"});
               !ops.empty()) {
      mutation.targets.push_back(ops.front());
    } else {
      mutation.unknown = true;
    }
    facts.mutations.push_back(std::move(mutation));
    return;
  }
  if (name == "tar") {
    bool extracting = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string &arg = args[i];
      if (arg == "--extract" || arg == "--get" ||
          (is_short_option(arg) && arg.find('x') != std::string::npos) ||
          (i == 0 && !is_option(arg) && arg.find('x') != std::string::npos)) {
        extracting = true;
      }
    }
    if (extracting) {
      const auto dir = option_value(args, "-C", "--directory");
      facts.mutations.push_back(Mutation{.what = "tar", .targets = {dir.value_or(".")}});
    }
    return;
  }
  if (name == "unzip") {
    if (contains_word(args, "-l") || contains_word(args, "-t")) {
      return;
    }
    const auto dir = option_value(args, "-d", "");
    facts.mutations.push_back(Mutation{.what = "unzip", .targets = {dir.value_or(".")}});
    return;
  }
  if (name == "git") {
    classify_git(args, facts);
    return;
  }
  if (is_package_install(name, args)) {
    facts.mutations.push_back(Mutation{.what = name + " install", .outside = true});
    return;
  }
  if (const auto run = interpreter_run(name, args); run.has_value()) {
    if (run->inline_code) {
      facts.mutations.push_back(Mutation{.what = name + " inline code", .code = true});
    }
    facts.script = run->script;
  }
}

struct Unwrapped {
  std::size_t program = 0;
  bool operands_from_stdin = false;
};

/// Skips launcher commands (env, timeout, xargs, ...) to the program they start.
Unwrapped unwrap(const std::vector<std::string> &argv) {
  Unwrapped result;
  std::size_t i = 0;
  auto skip_options = [&](const WordSet &value_options) {
    while (i < argv.size() && is_option(argv[i])) {
      i += value_options.contains(argv[i]) ? 2 : 1;
    }
  };

  for (int hops = 0; hops < 16 && i < argv.size(); ++hops) {
    const std::string name = base_name(argv[i]);
    if (name == "env") {
      ++i;
      while (i < argv.size()) {
        const std::string &word = argv[i];
        if (word == "-u" || word == "--unset" || word == "-C" || word == "--chdir") {
          i += 2;
        } else if (is_option(word) || word == "-" ||
                   (word.find('=') != std::string::npos && word.front() != '=')) {
          ++i;
        } else {
          break;
        }
      }
    } else if (name == "command" || name == "builtin" || name == "exec" || name == "nohup" ||
               name == "time") {
      ++i;
      skip_options({});
    } else if (name == "nice") {
      ++i;
      skip_options({"-n", "--adjustment"});
    } else if (name == "timeout") {
      ++i;
      skip_options({"-s", "-k", "--signal", "--kill-after"});
      ++i;
    } else if (name == "stdbuf") {
      ++i;
      skip_options({"-i", "-o", "-e"});
    } else if (name == "sudo") {
      ++i;
      skip_options({"-u", "-g", "-C", "-D", "-h", "-p", "-r", "-t", "-U"});
    } else if (name == "xargs") {
      ++i;
      result.operands_from_stdin = true;
      skip_options({"-I", "-n", "-P", "-L", "-s", "-d", "-E", "-a"});
    } else {
      break;
    }
  }
  result.program = i;
  return result;
}

class CommandAnalyzer {
public:
  CommandAnalyzer(const PolicyScope &scope, const std::vector<fs::path> &device_paths)
      : scope_(scope), device_paths_(device_paths) {}

  bool analyze(const std::vector<SimpleCommand> &commands, const fs::path &base_cwd) {
    fs::path cwd = base_cwd;
    std::vector<fs::path> dir_stack;
    std::size_t last_depth = commands.empty() ? 0 : commands.front().depth;

    for (const auto &command : commands) {
      if (command.depth != last_depth) {
        cwd = base_cwd;
        dir_stack.clear();
        last_depth = command.depth;
      }

      CommandFacts facts;
      facts.cwd = cwd;
      for (const auto &assignment : command.assignments) {
        add_path_word(assignment.substr(assignment.find('=') + 1), facts, false);
      }
      for (const auto &redirection : command.redirections) {
        if (redirection.op == "<<" || redirection.op == "<<-" || redirection.op == "<<<") {
          continue;
        }
        if (redirection.op == "<&" || (redirection.op == ">&" && !redirection.writes())) {
          continue;
        }
        add_path_word(redirection.target, facts, true);
        if (redirection.writes() && !is_device_word(redirection.target, cwd)) {
          facts.mutations.push_back(
              Mutation{.what = "output redirection", .targets = {redirection.target}});
        }
      }
      if (!analyze_argv(command.argv, facts, command.depth, cwd, dir_stack)) {
        return false;
      }
      note_written_script(facts);
      facts_.push_back(std::move(facts));
    }
    return true;
  }

  [[nodiscard]] const std::vector<CommandFacts> &facts() const { return facts_; }
  [[nodiscard]] const std::string &error() const { return error_; }

  [[nodiscard]] bool is_device(const fs::path &path) const {
    if (common::starts_with(path.string(), "/dev/fd/")) {
      return true;
    }
    return std::find(device_paths_.begin(), device_paths_.end(), path) != device_paths_.end();
  }

private:
  /// A script the same command line wrote earlier runs code nobody reviewed.
  void note_written_script(CommandFacts &facts) {
    if (facts.script.has_value()) {
      const auto expanded = expand_word(*facts.script, facts.cwd);
      const bool written =
          !expanded.has_value() ||
          std::find(written_.begin(), written_.end(),
                    common::resolve_lexically(facts.cwd, *expanded)) != written_.end();
      if (written) {
        facts.mutations.push_back(
            Mutation{.what = "script '" + *facts.script + "'", .code = true});
      }
    }
    for (const auto &mutation : facts.mutations) {
      for (const auto &target : mutation.targets) {
        if (const auto expanded = expand_word(target, facts.cwd); expanded.has_value()) {
          written_.push_back(common::resolve_lexically(facts.cwd, *expanded));
        }
      }
    }
  }

  bool is_device_word(const std::string &word, const fs::path &cwd) const {
    const auto expanded = expand_word(word, cwd);
    return expanded.has_value() && is_device(common::resolve_lexically(cwd, *expanded));
  }

  void add_path_word(const std::string &word, CommandFacts &facts, const bool forced,
                     const bool program = false) const {
    if (!forced && !looks_like_path(word)) {
      return;
    }
    const auto expanded = expand_word(word, facts.cwd);
    if (!expanded.has_value() || expanded->empty()) {
      return;
    }
    facts.paths.push_back(PathUse{.word = word,
                                  .resolved = common::resolve_lexically(facts.cwd, *expanded),
                                  .program = program});
  }

  bool analyze_argv(const std::vector<std::string> &argv, CommandFacts &facts,
                    const std::size_t depth, fs::path &cwd, std::vector<fs::path> &dir_stack) {
    if (argv.empty()) {
      return true;
    }
    const Unwrapped unwrapped = unwrap(argv);
    const bool has_program = unwrapped.program < argv.size();
    const std::string name = has_program ? base_name(argv[unwrapped.program]) : "";
    std::vector<std::string> args;
    if (has_program) {
      args.assign(argv.begin() + static_cast<std::ptrdiff_t>(unwrapped.program) + 1, argv.end());
      facts.argv.assign(argv.begin() + static_cast<std::ptrdiff_t>(unwrapped.program),
                        argv.end());
    }

    std::optional<std::string> payload;
    WordSet payload_words;
    if (is_shell(name)) {
      for (std::size_t j = 0; j < args.size(); ++j) {
        if (is_short_option(args[j]) && args[j].find('c') != std::string::npos) {
          if (j + 1 < args.size()) {
            payload = args[j + 1];
            payload_words.insert(args[j + 1]);
          }
          break;
        }
        if (!is_option(args[j])) {
          break;
        }
      }
    } else if (name == "eval") {
      std::string joined;
      for (const auto &arg : args) {
        joined += (joined.empty() ? "" : " ") + arg;
        payload_words.insert(arg);
      }
      payload = joined;
    }

    for (std::size_t i = 0; i < argv.size(); ++i) {
      const std::string &word = argv[i];
      if (i == 0 || i == unwrapped.program) {
        if (looks_like_path(word)) {
          add_path_word(word, facts, true, true);
        }
        continue;
      }
      if (payload_words.contains(word)) {
        continue;
      }
      add_path_word(word, facts, false);
      if (const auto eq = word.find('='); eq != std::string::npos && eq + 1 < word.size()) {
        add_path_word(word.substr(eq + 1), facts, false);
      }
    }

    if (!has_program) {
      return true;
    }

    if (name == "cd" || name == "pushd") {
      change_directory(args, name == "pushd", facts, cwd, dir_stack);
      return true;
    }
    if (name == "popd") {
      if (!dir_stack.empty()) {
        cwd = dir_stack.back();
        dir_stack.pop_back();
      }
      return true;
    }

    if (payload.has_value()) {
      if (depth + 1 > kMaxShellNesting) {
        error_ = "command nesting too deep";
        return false;
      }
      auto nested = parse_shell_command(*payload, depth + 1);
      if (!nested.ok()) {
        error_ = nested.error();
        return false;
      }
      return analyze(nested.value(), cwd);
    }

    if (name == "find") {
      return analyze_find(args, facts, depth, cwd, dir_stack);
    }

    const std::size_t before = facts.mutations.size();
    classify_mutations(name, args, facts);
    if (unwrapped.operands_from_stdin) {
      for (std::size_t i = before; i < facts.mutations.size(); ++i) {
        facts.mutations[i].unknown = true;
      }
    }
    return true;
  }

  void change_directory(const std::vector<std::string> &args, const bool push,
                        CommandFacts &facts, fs::path &cwd, std::vector<fs::path> &dir_stack) {
    std::optional<std::string> target;
    for (const auto &arg : args) {
      if (arg == "-") {
        facts.cd_violation = "cd - is not allowed";
        return;
      }
      if (!is_option(arg)) {
        target = arg;
        break;
      }
    }

    fs::path destination = scope_.repo_root;
    if (target.has_value()) {
      const auto expanded = expand_word(*target, cwd);
      if (!expanded.has_value()) {
        facts.cd_violation = "cannot resolve cd target '" + *target + "'";
        return;
      }
      destination = common::resolve_lexically(cwd, *expanded);
    }
    if (!common::is_subpath(destination, scope_.repo_root)) {
      facts.cd_violation = "cd target '" + target.value_or("~") + "' leaves the repository root";
      return;
    }
    if (push) {
      dir_stack.push_back(cwd);
    }
    cwd = destination;
  }

  bool analyze_find(const std::vector<std::string> &args, CommandFacts &facts,
                    const std::size_t depth, fs::path &cwd, std::vector<fs::path> &dir_stack) {
    std::vector<std::string> roots;
    std::size_t k = 0;
    for (; k < args.size(); ++k) {
      if (is_option(args[k]) || args[k] == "(" || args[k] == "!" || args[k] == "\\(") {
        break;
      }
      roots.push_back(args[k]);
    }
    if (roots.empty()) {
      roots.emplace_back(".");
    }

    for (; k < args.size(); ++k) {
      if (args[k] == "-delete") {
        facts.mutations.push_back(Mutation{.what = "find -delete", .targets = roots});
        continue;
      }
      if (args[k] == "-exec" || args[k] == "-execdir" || args[k] == "-ok" ||
          args[k] == "-okdir") {
        std::vector<std::string> inner;
        for (++k; k < args.size() && args[k] != ";" && args[k] != "+"; ++k) {
          inner.push_back(args[k]);
        }
        CommandFacts inner_facts;
        inner_facts.cwd = cwd;
        fs::path inner_cwd = cwd;
        std::vector<fs::path> inner_stack = dir_stack;
        if (!analyze_argv(inner, inner_facts, depth, inner_cwd, inner_stack)) {
          return false;
        }
        // {} stands for anything below the search roots
        for (auto &mutation : inner_facts.mutations) {
          std::vector<std::string> targets;
          for (const auto &target : mutation.targets) {
            if (target.find("{}") == std::string::npos) {
              targets.push_back(target);
            } else {
              targets.insert(targets.end(), roots.begin(), roots.end());
            }
          }
          mutation.targets = std::move(targets);
        }
        facts_.push_back(std::move(inner_facts));
      }
    }
    return true;
  }

  const PolicyScope &scope_;
  const std::vector<fs::path> &device_paths_;
  std::vector<CommandFacts> facts_;
  std::vector<fs::path> written_;
  std::string error_;
};

std::vector<fs::path> protected_paths(const PolicyScope &scope, const task::Task &task) {
  std::vector<fs::path> out;
  out.reserve(task.protected_paths.size());
  for (const auto &path : task.protected_paths) {
    out.push_back(common::resolve_lexically(scope.repo_root, path));
  }
  return out;
}

bool matches_protected(const fs::path &target, const std::vector<fs::path> &protected_list,
                       const fs::path &root) {
  const bool glob = has_glob(target.string());
  for (const auto &path : protected_list) {
    if (target == path || common::is_subpath(path, target)) {
      return true;
    }
    if (!glob) {
      continue;
    }
    for (fs::path ancestor = path; !ancestor.empty(); ancestor = ancestor.parent_path()) {
      if (fnmatch(target.c_str(), ancestor.c_str(), 0) == 0) {
        return true;
      }
      if (ancestor == root || ancestor == ancestor.parent_path()) {
        break;
      }
    }
  }
  return false;
}

std::string describe_target(const std::string &word, const fs::path &resolved,
                            const fs::path &root) {
  if (common::is_subpath(resolved, root)) {
    const auto relative = resolved.lexically_relative(root).string();
    return relative.empty() || relative == "." ? word : relative;
  }
  return resolved.string();
}

} // namespace

std::string_view execution_mode_name(const ExecutionMode mode) {
  return mode == ExecutionMode::Debug ? "debug" : "bash";
}

std::string_view policy_rule_name(const PolicyRule rule) {
  switch (rule) {
  case PolicyRule::None:
    return "none";
  case PolicyRule::Malformed:
    return "malformed";
  case PolicyRule::PathContainment:
    return "path-containment";
  case PolicyRule::SystemPath:
    return "system-path";
  case PolicyRule::AncestryCeiling:
    return "ancestry-ceiling";
  case PolicyRule::TestFileImmutable:
    return "test-file-immutable";
  case PolicyRule::ModeWrite:
    return "mode-write";
  }
  return "unknown";
}

std::string PolicyDecision::denial_text() const {
  if (allowed) {
    return "";
  }
  return "Permission denied by sandbox policy (" + std::string(policy_rule_name(rule)) +
         "): " + reason;
}

SecurityPolicy::SecurityPolicy() : SecurityPolicy(config::PolicyConfig{}) {}

SecurityPolicy::SecurityPolicy(const config::PolicyConfig &config) {
  auto add_deny = [this](const std::string &entry) {
    const auto expanded = expand_word(entry, SANDBOX_HOME);
    if (!expanded.has_value()) {
      return;
    }
    const fs::path path = common::resolve_lexically("/", *expanded);
    if (std::find(deny_paths_.begin(), deny_paths_.end(), path) == deny_paths_.end()) {
      deny_paths_.push_back(path);
    }
  };
  for (const char *system_path : SYSTEM_DENY_PATHS) {
    add_deny(system_path);
  }
  for (const auto &entry : config.deny_paths) {
    add_deny(entry);
  }
  for (const auto &device : config.device_paths) {
    device_paths_.push_back(common::resolve_lexically("/", device));
  }
}

PolicyDecision SecurityPolicy::evaluate(const std::string &command, const PolicyScope &scope,
                                        const task::Task &task) const {
  if (common::trim(command).empty()) {
    return PolicyDecision::deny(PolicyRule::Malformed, "empty command");
  }
  const auto parsed = parse_shell_command(command);
  if (!parsed.ok()) {
    return PolicyDecision::deny(PolicyRule::Malformed, parsed.error());
  }

  const fs::path repo_root = common::resolve_lexically("/", scope.repo_root);
  PolicyScope normalized = scope;
  normalized.repo_root = repo_root;
  normalized.working_dir = scope.working_dir.empty()
                               ? repo_root
                               : common::resolve_lexically(repo_root, scope.working_dir);

  CommandAnalyzer analyzer(normalized, device_paths_);
  if (!analyzer.analyze(parsed.value(), normalized.working_dir)) {
    return PolicyDecision::deny(PolicyRule::Malformed, analyzer.error());
  }
  const auto &all_facts = analyzer.facts();

  for (const auto &facts : all_facts) {
    if (!facts.cd_violation.empty()) {
      return PolicyDecision::deny(PolicyRule::PathContainment, facts.cd_violation);
    }
    for (const auto &use : facts.paths) {
      if (use.program || analyzer.is_device(use.resolved)) {
        continue;
      }
      if (!common::is_subpath(use.resolved, repo_root)) {
        return PolicyDecision::deny(PolicyRule::PathContainment,
                                    "path '" + use.word + "' resolves to " +
                                        use.resolved.string() +
                                        ", outside the repository root " + repo_root.string());
      }
    }
  }

  for (const auto &facts : all_facts) {
    for (const auto &use : facts.paths) {
      if (analyzer.is_device(use.resolved)) {
        continue;
      }
      for (const auto &denied : deny_paths_) {
        if (!common::is_subpath(use.resolved, denied)) {
          continue;
        }
        if (common::is_subpath(repo_root, denied) &&
            common::is_subpath(use.resolved, repo_root)) {
          continue;
        }
        return PolicyDecision::deny(PolicyRule::SystemPath,
                                    "path '" + use.word + "' is inside restricted system path " +
                                        denied.string());
      }
    }
  }

  for (const auto &facts : all_facts) {
    if (facts.argv.empty() || base_name(facts.argv.front()) != "git") {
      continue;
    }
    const std::vector<std::string> git_args(facts.argv.begin() + 1, facts.argv.end());
    if (auto violation = git_ancestry_violation(git_args); !violation.empty()) {
      return PolicyDecision::deny(PolicyRule::AncestryCeiling, std::move(violation));
    }
  }

  const auto protected_list = protected_paths(normalized, task);
  if (!protected_list.empty()) {
    for (const auto &facts : all_facts) {
      for (const auto &mutation : facts.mutations) {
        if (mutation.unknown) {
          return PolicyDecision::deny(PolicyRule::TestFileImmutable,
                                      mutation.what +
                                          " has targets that cannot be resolved while "
                                          "protected test files exist");
        }
        if (mutation.code) {
          return PolicyDecision::deny(PolicyRule::TestFileImmutable,
                                      mutation.what +
                                          " could modify protected test files; run a script "
                                          "file or a test command instead");
        }
        for (const auto &target : mutation.targets) {
          const auto expanded = expand_word(target, facts.cwd);
          if (!expanded.has_value()) {
            return PolicyDecision::deny(PolicyRule::TestFileImmutable,
                                        mutation.what + " target '" + target +
                                            "' cannot be resolved while protected test files "
                                            "exist");
          }
          const auto resolved = common::resolve_lexically(facts.cwd, *expanded);
          if (matches_protected(resolved, protected_list, repo_root)) {
            return PolicyDecision::deny(PolicyRule::TestFileImmutable,
                                        mutation.what + " would modify protected test file(s) via '" +
                                            describe_target(target, resolved, repo_root) + "'");
          }
        }
      }
    }
  }

  const fs::path writable_root = normalized.writable_root.empty()
                                     ? fs::path()
                                     : common::resolve_lexically("/", normalized.writable_root);
  for (const auto &facts : all_facts) {
    for (const auto &mutation : facts.mutations) {
      if (normalized.mode == ExecutionMode::Bash) {
        return PolicyDecision::deny(PolicyRule::ModeWrite,
                                    mutation.what +
                                        " modifies the filesystem, which bash mode does not allow");
      }
      if (writable_root.empty()) {
        return PolicyDecision::deny(PolicyRule::ModeWrite, "no writable snapshot is attached");
      }
      if (mutation.outside) {
        return PolicyDecision::deny(PolicyRule::ModeWrite,
                                    mutation.what + " writes outside the writable snapshot");
      }
      if (mutation.unknown) {
        return PolicyDecision::deny(PolicyRule::ModeWrite,
                                    mutation.what + " has targets that cannot be resolved");
      }
      if ((mutation.tree_wide || mutation.code) &&
          !common::is_subpath(facts.cwd, writable_root)) {
        return PolicyDecision::deny(PolicyRule::ModeWrite,
                                    mutation.what + " runs outside the writable snapshot");
      }
      for (const auto &target : mutation.targets) {
        const auto expanded = expand_word(target, facts.cwd);
        if (!expanded.has_value()) {
          return PolicyDecision::deny(PolicyRule::ModeWrite,
                                      mutation.what + " target '" + target +
                                          "' cannot be resolved");
        }
        const auto resolved = common::resolve_lexically(facts.cwd, *expanded);
        if (!common::is_subpath(resolved, writable_root)) {
          return PolicyDecision::deny(PolicyRule::ModeWrite,
                                      mutation.what + " writes to " + resolved.string() +
                                          ", outside the writable snapshot " +
                                          writable_root.string());
        }
      }
    }
  }

  return PolicyDecision::allow();
}

} // namespace sweguard::security
