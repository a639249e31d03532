#pragma once

#include "sessionsync/observability/observer.hpp"

namespace sessionsync::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace sessionsync::observability
