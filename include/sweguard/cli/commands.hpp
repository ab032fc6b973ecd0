#pragma once

namespace sweguard::cli {

/// Exit code of `policy-check` when the command would be refused.
constexpr int POLICY_CHECK_DENIED_EXIT_CODE = 3;

void print_help();
int run_cli(int argc, char **argv);

} // namespace sweguard::cli
