#pragma once

#include "sessionsync/observability/observer.hpp"

#include <memory>

namespace sessionsync::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);

void record_sync_start(const std::string &operation);
void record_sync_end(const std::string &operation, std::chrono::milliseconds duration,
                     bool success);
void record_oauth_transition(const std::string &from, const std::string &to);
void record_retry(const std::string &operation, std::uint32_t attempt,
                  std::chrono::milliseconds delay, const std::string &reason);
void record_secret_access(const std::string &backend, const std::string &action,
                          const std::string &key);

void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);
void log_error(const std::string &component, const std::string &message);

} // namespace sessionsync::observability
