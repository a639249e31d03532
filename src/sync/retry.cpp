#include "sessionsync/sync/retry.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace sessionsync::sync {

RetryConfig RetryConfig::fast() {
  return RetryConfig{.max_retries = 2,
                     .base_delay_ms = 100,
                     .max_delay_ms = 1000,
                     .backoff_multiplier = 2.0,
                     .jitter_factor = 0.1};
}

RetryConfig RetryConfig::http() { return RetryConfig{}; }

RetryConfig RetryConfig::auth() {
  return RetryConfig{.max_retries = 2,
                     .base_delay_ms = 500,
                     .max_delay_ms = 5000,
                     .backoff_multiplier = 2.0,
                     .jitter_factor = 0.1};
}

RetryConfig RetryConfig::from_settings(const config::SyncSettings &settings) {
  return RetryConfig{.max_retries = settings.max_retries,
                     .base_delay_ms = settings.retry_base_delay_ms,
                     .max_delay_ms = settings.retry_max_delay_ms,
                     .backoff_multiplier = settings.retry_backoff_multiplier,
                     .jitter_factor = settings.retry_jitter_factor};
}

std::chrono::milliseconds RetryConfig::backoff_delay(std::uint32_t attempt) const {
  const double scaled =
      static_cast<double>(base_delay_ms) * std::pow(backoff_multiplier, static_cast<double>(attempt));
  const double capped = std::min(scaled, static_cast<double>(max_delay_ms));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::chrono::milliseconds jittered_delay(const RetryConfig &config, std::uint32_t attempt) {
  const auto base = config.backoff_delay(attempt);
  if (config.jitter_factor <= 0.0 || base.count() == 0) {
    return base;
  }
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, config.jitter_factor);
  const auto jitter = static_cast<std::int64_t>(static_cast<double>(base.count()) * dist(rng));
  return base + std::chrono::milliseconds(jitter);
}

Sleeper default_sleeper() {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

namespace detail {

std::optional<std::chrono::milliseconds> rate_limit_delay(const SyncError &error) {
  if (error.kind != ErrorKind::RateLimitExceeded) {
    return std::nullopt;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(error.retry_after);
}

} // namespace detail

} // namespace sessionsync::sync
