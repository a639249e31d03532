#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace sessionsync::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the carried error text appended when `result` is not ok.
/// Works for common::Status, common::Result<T> and sync::SyncResult<T>.
template <typename ResultT> void require_ok(const ResultT &result, const std::string &message) {
  if (result.ok()) {
    return;
  }
  using ErrorT = std::decay_t<decltype(result.error())>;
  if constexpr (std::is_convertible_v<ErrorT, std::string>) {
    throw std::runtime_error(message + ": " + std::string(result.error()));
  } else {
    throw std::runtime_error(message + ": " + result.error().to_string());
  }
}

} // namespace sessionsync::tests
