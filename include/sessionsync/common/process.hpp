#pragma once

#include "sessionsync/common/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sessionsync::common {

struct CommandOutput {
  int exit_code = -1;
  std::string output; // stdout and stderr, interleaved
};

/// Runs `command` from PATH with `args`, optionally feeding `input` on stdin.
/// A non-zero exit is reported through exit_code, not as a failure.
[[nodiscard]] Result<CommandOutput> run_command(const std::string &command,
                                                const std::vector<std::string> &args,
                                                const std::optional<std::string> &input =
                                                    std::nullopt);

[[nodiscard]] bool command_exists(const std::string &command);

} // namespace sessionsync::common
