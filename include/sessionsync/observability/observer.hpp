#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sessionsync::observability {

enum class LogLevel { Debug, Info, Warn, Error };

struct SyncOperationEvent {
  std::string operation;
  std::string phase; // "start" or "end"
  bool success = false;
  std::chrono::milliseconds duration{0};
};

struct OAuthTransitionEvent {
  std::string from;
  std::string to;
};

struct RetryEvent {
  std::string operation;
  std::uint32_t attempt = 0;
  std::chrono::milliseconds delay{0};
  std::string reason;
};

struct SecretStoreEvent {
  std::string backend;
  std::string action;
  std::string key;
};

struct MessageEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<SyncOperationEvent, OAuthTransitionEvent, RetryEvent,
                                   SecretStoreEvent, MessageEvent>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] std::string_view level_name(LogLevel level);

} // namespace sessionsync::observability
