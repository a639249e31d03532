#include "sessionsync/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace sessionsync::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string getenv_or(const char *name, const std::string &fallback) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return fallback;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
#ifdef _WIN32
  if (const char *profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(profile));
  }
#endif
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty() || value[0] != '~') {
    return value;
  }
  if (value.size() > 1 && value[1] != '/' && value[1] != '\\') {
    return value;
  }
  if (auto home = home_dir(); home.ok()) {
    value.replace(0, 1, home.value().string());
  }
  return value;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure("failed reading " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      return Status::error("unable to write " + tmp_path.string());
    }
    file << content;
    file.close();
    if (!file) {
      return Status::error("failed writing " + tmp_path.string());
    }
  }

#ifndef _WIN32
  chmod(tmp_path.c_str(), 0600);
#endif

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return Status::error("failed to replace " + path.string() + ": " + reason);
  }
  return Status::success();
}

} // namespace sessionsync::common
