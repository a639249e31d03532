#pragma once

#include <string>

namespace sessionsync::cli {

[[nodiscard]] std::string version_string();

void print_help();

/// Entry point for the `sessionsync` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace sessionsync::cli
