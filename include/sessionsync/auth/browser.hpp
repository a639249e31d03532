#pragma once

#include "sessionsync/common/result.hpp"

#include <string>
#include <vector>

namespace sessionsync::auth {

class BrowserLauncher {
public:
  virtual ~BrowserLauncher() = default;

  [[nodiscard]] virtual common::Status open(const std::string &url) = 0;
};

/// Opens the URL in the user's default browser as a detached process:
/// `open` on macOS, `xdg-open` elsewhere on POSIX, `cmd /c start` on Windows.
class SystemBrowserLauncher final : public BrowserLauncher {
public:
  [[nodiscard]] common::Status open(const std::string &url) override;

  /// Command and arguments used for `url` on the current platform.
  [[nodiscard]] static std::vector<std::string> command_for(const std::string &url);

  /// `cmd /c start "" <url>` with cmd.exe metacharacters in `url` caret-escaped,
  /// so `&` in the query string reaches the browser instead of splitting the command.
  [[nodiscard]] static std::vector<std::string> windows_start_command(const std::string &url);
};

/// Prefixes each cmd.exe metacharacter (`& | < > ^ ( )`) with `^`.
[[nodiscard]] std::string escape_cmd_argument(const std::string &value);

} // namespace sessionsync::auth
