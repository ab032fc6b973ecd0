#pragma once

#include <string>
#include <vector>

namespace sweguard::task {

/// One benchmark instance. Loaded once per run and never mutated; the known fix is
/// deliberately absent.
struct Task {
  std::string instance_id;
  std::string repo;
  std::string base_commit;
  std::string environment_setup_commit;
  std::string problem_statement;
  std::string hints_text;
  std::string version;
  std::string runtime_version;
  std::string test_patch;
  std::vector<std::string> fail_to_pass;
  std::vector<std::string> pass_to_pass;
  std::string created_at;
  std::string difficulty;

  /// Repository-relative files touched by `test_patch`; agents may never modify them.
  std::vector<std::string> protected_paths;
};

/// Python version used to build the sandbox image for `repo` at `version`.
[[nodiscard]] std::string resolve_runtime_version(const std::string &repo,
                                                  const std::string &version);

/// Parses a dotted version the way the benchmark tables compare them ("1.10" == 1.1).
[[nodiscard]] double version_number(const std::string &version);

} // namespace sweguard::task
