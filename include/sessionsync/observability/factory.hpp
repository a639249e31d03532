#pragma once

#include "sessionsync/observability/observer.hpp"

#include <memory>
#include <string>

namespace sessionsync::observability {

/// backend: "none"/"noop" or "log"; level: "debug", "info", "warn", "error".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend,
                                                         const std::string &level);

/// Installs the observer named by SESSIONSYNC_LOG / SESSIONSYNC_LOG_LEVEL.
void init_from_env();

} // namespace sessionsync::observability
