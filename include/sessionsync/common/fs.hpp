#pragma once

#include "sessionsync/common/result.hpp"

#include <filesystem>
#include <string>

namespace sessionsync::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string getenv_or(const char *name, const std::string &fallback);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes `content` to `path.tmp`, restricts it to the owner (0600) and renames it
/// over `path`, so a reader never sees a half-written file.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace sessionsync::common
