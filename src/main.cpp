#include "sessionsync/cli/commands.hpp"

int main(int argc, char **argv) { return sessionsync::cli::run_cli(argc, argv); }
