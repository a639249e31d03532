#pragma once

#include "sessionsync/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace sessionsync::auth {

inline constexpr std::size_t MAX_CALLBACK_REQUEST_BYTES = 8 * 1024;

/// One-shot loopback HTTP listener for the OAuth redirect. Owns the listening
/// socket; it is closed on destruction or after the first accepted request.
class CallbackListener {
public:
  CallbackListener() = default;
  ~CallbackListener();

  CallbackListener(const CallbackListener &) = delete;
  CallbackListener &operator=(const CallbackListener &) = delete;

  /// Port 0 asks the kernel for an ephemeral port.
  [[nodiscard]] common::Status bind(const std::string &host, std::uint16_t port);

  /// Tries every port in [first, last] and keeps the first that binds.
  [[nodiscard]] common::Status bind_first_free(const std::string &host, std::uint16_t first,
                                               std::uint16_t last);

  /// Waits for a single connection, returns its raw request head, replies with
  /// the completion page and stops listening. nullopt means the wait timed out.
  [[nodiscard]] common::Result<std::optional<std::string>>
  accept_one(std::chrono::milliseconds timeout);

  void close();

  [[nodiscard]] bool is_bound() const { return listen_fd_ >= 0; }
  [[nodiscard]] std::uint16_t port() const { return port_; }

private:
  int listen_fd_ = -1;
  std::uint16_t port_ = 0;
};

[[nodiscard]] const std::string &callback_response_page();

} // namespace sessionsync::auth
