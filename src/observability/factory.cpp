#include "sessionsync/observability/factory.hpp"

#include "sessionsync/common/fs.hpp"
#include "sessionsync/observability/global.hpp"
#include "sessionsync/observability/log_observer.hpp"
#include "sessionsync/observability/noop_observer.hpp"

namespace sessionsync::observability {

namespace {

LogLevel parse_level(const std::string &raw) {
  const std::string level = common::to_lower(common::trim(raw));
  if (level == "debug" || level == "trace") {
    return LogLevel::Debug;
  }
  if (level == "warn" || level == "warning") {
    return LogLevel::Warn;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend, const std::string &level) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.empty() || normalized == "none" || normalized == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(parse_level(level));
}

void init_from_env() {
  set_global_observer(create_observer(common::getenv_or("SESSIONSYNC_LOG", "none"),
                                      common::getenv_or("SESSIONSYNC_LOG_LEVEL", "info")));
}

} // namespace sessionsync::observability
