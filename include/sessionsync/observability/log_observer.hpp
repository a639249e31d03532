#pragma once

#include "sessionsync/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace sessionsync::observability {

/// Writes "[LEVEL] message" lines. Events below `min_level` are dropped.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level);

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream &out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace sessionsync::observability
