#include "sessionsync/observability/global.hpp"

#include <mutex>

namespace sessionsync::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

void record_message(const LogLevel level, const std::string &component,
                    const std::string &message) {
  record_event(MessageEvent{.level = level, .component = component, .message = message});
}

} // namespace

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_sync_start(const std::string &operation) {
  record_event(SyncOperationEvent{.operation = operation, .phase = "start"});
}

void record_sync_end(const std::string &operation, std::chrono::milliseconds duration,
                     const bool success) {
  record_event(SyncOperationEvent{
      .operation = operation, .phase = "end", .success = success, .duration = duration});
}

void record_oauth_transition(const std::string &from, const std::string &to) {
  record_event(OAuthTransitionEvent{.from = from, .to = to});
}

void record_retry(const std::string &operation, const std::uint32_t attempt,
                  std::chrono::milliseconds delay, const std::string &reason) {
  record_event(
      RetryEvent{.operation = operation, .attempt = attempt, .delay = delay, .reason = reason});
}

void record_secret_access(const std::string &backend, const std::string &action,
                          const std::string &key) {
  record_event(SecretStoreEvent{.backend = backend, .action = action, .key = key});
}

void log_debug(const std::string &component, const std::string &message) {
  record_message(LogLevel::Debug, component, message);
}

void log_info(const std::string &component, const std::string &message) {
  record_message(LogLevel::Info, component, message);
}

void log_warn(const std::string &component, const std::string &message) {
  record_message(LogLevel::Warn, component, message);
}

void log_error(const std::string &component, const std::string &message) {
  record_message(LogLevel::Error, component, message);
}

} // namespace sessionsync::observability
