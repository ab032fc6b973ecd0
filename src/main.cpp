#include "sweguard/cli/commands.hpp"

int main(int argc, char **argv) { return sweguard::cli::run_cli(argc, argv); }
