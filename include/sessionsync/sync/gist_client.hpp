#pragma once

#include "sessionsync/http/http_client.hpp"
#include "sessionsync/sync/errors.hpp"

#include <cstdint>
#include <string>

namespace sessionsync::sync {

inline constexpr const char *GIST_FILENAME = "cs-cli-session-data.enc";
inline constexpr const char *GIST_DESCRIPTION = "CS-CLI encrypted session data - DO NOT EDIT";
inline constexpr const char *GITHUB_API_VERSION = "2022-11-28";

/// Remote storage contract for the encrypted session blob. Gists are always
/// created secret (non-public).
class GistTransport {
public:
  virtual ~GistTransport() = default;

  /// Returns the new gist id.
  [[nodiscard]] virtual SyncResult<std::string> create_gist(const std::string &description,
                                                            const std::string &filename,
                                                            const std::string &content,
                                                            const std::string &token) = 0;
  [[nodiscard]] virtual SyncStatus update_gist(const std::string &gist_id,
                                               const std::string &filename,
                                               const std::string &content,
                                               const std::string &token) = 0;
  /// GistNotFound when the gist or the file inside it is missing.
  [[nodiscard]] virtual SyncResult<std::string> read_gist_file(const std::string &gist_id,
                                                               const std::string &filename,
                                                               const std::string &token) = 0;
  [[nodiscard]] virtual SyncStatus delete_gist(const std::string &gist_id,
                                               const std::string &token) = 0;
  /// Login of the token's owner.
  [[nodiscard]] virtual SyncResult<std::string> current_user(const std::string &token) = 0;
};

/// Translates a failed response into the error taxonomy.
[[nodiscard]] SyncError map_http_failure(const std::string &operation,
                                         const http::HttpResponse &response,
                                         std::uint64_t timeout_ms,
                                         const std::string &gist_id = "");

/// GitHub REST implementation over an HttpClient.
class GitHubGistClient final : public GistTransport {
public:
  GitHubGistClient(http::HttpClient &http, std::string api_base_url,
                   std::uint64_t timeout_ms = 30000);

  [[nodiscard]] SyncResult<std::string> create_gist(const std::string &description,
                                                    const std::string &filename,
                                                    const std::string &content,
                                                    const std::string &token) override;
  [[nodiscard]] SyncStatus update_gist(const std::string &gist_id, const std::string &filename,
                                       const std::string &content,
                                       const std::string &token) override;
  [[nodiscard]] SyncResult<std::string> read_gist_file(const std::string &gist_id,
                                                       const std::string &filename,
                                                       const std::string &token) override;
  [[nodiscard]] SyncStatus delete_gist(const std::string &gist_id,
                                       const std::string &token) override;
  [[nodiscard]] SyncResult<std::string> current_user(const std::string &token) override;

private:
  [[nodiscard]] http::HttpRequest make_request(const std::string &method, const std::string &path,
                                               const std::string &token) const;

  http::HttpClient &http_;
  std::string api_base_url_;
  std::uint64_t timeout_ms_;
};

} // namespace sessionsync::sync
