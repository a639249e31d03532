#pragma once

#include "sessionsync/config/config.hpp"
#include "sessionsync/observability/global.hpp"
#include "sessionsync/sync/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace sessionsync::sync {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct RetryConfig {
  std::uint32_t max_retries = 3;
  std::uint64_t base_delay_ms = 1000;
  std::uint64_t max_delay_ms = 10000;
  double backoff_multiplier = 2.0;
  double jitter_factor = 0.1;
  /// Longest server-advertised wait honored before giving up instead.
  std::uint64_t max_server_delay_ms = 60000;

  /// Short waits for local or interactive steps.
  [[nodiscard]] static RetryConfig fast();
  /// Remote gist API calls.
  [[nodiscard]] static RetryConfig http();
  /// Token validation against the API.
  [[nodiscard]] static RetryConfig auth();
  [[nodiscard]] static RetryConfig from_settings(const config::SyncSettings &settings);

  /// min(max_delay, base_delay * multiplier^attempt), without jitter.
  [[nodiscard]] std::chrono::milliseconds backoff_delay(std::uint32_t attempt) const;
};

/// backoff_delay(attempt) plus up to jitter_factor of it at random.
[[nodiscard]] std::chrono::milliseconds jittered_delay(const RetryConfig &config,
                                                       std::uint32_t attempt);

[[nodiscard]] Sleeper default_sleeper();

/// Runs `operation` until it succeeds, `should_retry` rejects the error, or
/// max_retries retries have been spent. `server_delay` may return a wait the
/// remote side asked for; it replaces the computed back-off, and a wait longer
/// than max_server_delay_ms ends the loop with that error.
template <typename Operation, typename Predicate, typename ServerDelay>
auto execute_with_retry(Operation &&operation, const RetryConfig &config,
                        const std::string &operation_name, Predicate &&should_retry,
                        ServerDelay &&server_delay, const Sleeper &sleep)
    -> std::invoke_result_t<Operation &> {
  for (std::uint32_t attempt = 0;; ++attempt) {
    auto result = operation();
    if (result.ok()) {
      return result;
    }
    const auto &error = result.error();
    if (attempt >= config.max_retries || !should_retry(error)) {
      return result;
    }

    std::chrono::milliseconds delay = jittered_delay(config, attempt);
    const std::optional<std::chrono::milliseconds> requested = server_delay(error);
    if (requested.has_value()) {
      if (static_cast<std::uint64_t>(requested->count()) > config.max_server_delay_ms) {
        observability::log_warn("retry", operation_name + ": server asked to wait " +
                                             std::to_string(requested->count()) +
                                             "ms, giving up");
        return result;
      }
      delay = *requested;
    }

    observability::record_retry(operation_name, attempt + 1, delay,
                                common::detail::describe_error(error));
    sleep(delay);
  }
}

namespace detail {

[[nodiscard]] std::optional<std::chrono::milliseconds> rate_limit_delay(const SyncError &error);

} // namespace detail

/// SyncError flavor: retries what SyncError::is_retryable() allows and honors
/// RateLimitExceeded::retry_after.
template <typename Operation>
auto execute_with_retry(Operation &&operation, const RetryConfig &config,
                        const std::string &operation_name, const Sleeper &sleep = default_sleeper())
    -> std::invoke_result_t<Operation &> {
  return execute_with_retry(
      std::forward<Operation>(operation), config, operation_name,
      [](const SyncError &error) { return error.is_retryable(); }, &detail::rate_limit_delay,
      sleep);
}

} // namespace sessionsync::sync
