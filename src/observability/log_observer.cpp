#include "sessionsync/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace sessionsync::observability {

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(std::cerr, min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SyncOperationEvent>) {
          if (evt.phase == "start") {
            log_line(LogLevel::Debug, "sync." + evt.operation + " start");
          } else {
            log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                     "sync." + evt.operation + " success=" + (evt.success ? "true" : "false") +
                         " duration_ms=" + std::to_string(evt.duration.count()));
          }
        } else if constexpr (std::is_same_v<T, OAuthTransitionEvent>) {
          log_line(LogLevel::Debug, "oauth.state " + evt.from + " -> " + evt.to);
        } else if constexpr (std::is_same_v<T, RetryEvent>) {
          log_line(LogLevel::Warn, "retry " + evt.operation +
                                       " attempt=" + std::to_string(evt.attempt) +
                                       " delay_ms=" + std::to_string(evt.delay.count()) +
                                       " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SecretStoreEvent>) {
          log_line(LogLevel::Debug,
                   "secret_store." + evt.action + " backend=" + evt.backend + " key=" + evt.key);
        } else if constexpr (std::is_same_v<T, MessageEvent>) {
          log_line(evt.level, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace sessionsync::observability
