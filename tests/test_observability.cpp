#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "sessionsync/observability/factory.hpp"
#include "sessionsync/observability/global.hpp"
#include "sessionsync/observability/log_observer.hpp"
#include "sessionsync/observability/noop_observer.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

class CountingObserver final : public sessionsync::observability::IObserver {
public:
  explicit CountingObserver(int *events) : events_(events) {}

  void record_event(const sessionsync::observability::ObserverEvent &) override { ++*events_; }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  int *events_ = nullptr;
};

} // namespace

void register_observability_tests(std::vector<sessionsync::tests::TestCase> &tests) {
  using sessionsync::tests::require;
  namespace ob = sessionsync::observability;

  tests.push_back({"observability_global_noop", [] {
                     ob::set_global_observer(std::make_unique<ob::NoopObserver>());
                     require(ob::get_global_observer() != nullptr, "observer should be set");
                     require(ob::get_global_observer()->name() == "noop", "expected noop observer");

                     ob::record_sync_start("store_cookies");
                     ob::record_retry("update_gist", 1, std::chrono::milliseconds(5), "timeout");
                     ob::log_info("test", "ignored");

                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_helpers_reach_installed_observer", [] {
                     int events = 0;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&events));
                     ob::record_sync_start("get_cookies");
                     ob::record_sync_end("get_cookies", std::chrono::milliseconds(3), true);
                     ob::record_oauth_transition("Initial", "AwaitingCallback");
                     ob::record_secret_access("memory", "get", "github_token");
                     ob::log_warn("test", "careful");
                     require(events == 5, "expected five events, got " + std::to_string(events));

                     // Reset before `events` goes out of scope
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"observability_log_observer_filters_by_level", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out, ob::LogLevel::Warn);
                     observer.record_event(ob::MessageEvent{
                         .level = ob::LogLevel::Info, .component = "sync", .message = "quiet"});
                     observer.record_event(ob::MessageEvent{
                         .level = ob::LogLevel::Error, .component = "sync", .message = "loud"});
                     observer.record_event(ob::RetryEvent{.operation = "read_gist",
                                                          .attempt = 2,
                                                          .delay = std::chrono::milliseconds(40),
                                                          .reason = "timeout"});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("quiet") == std::string::npos, "info should be dropped");
                     require(text.find("[ERROR] sync: loud") != std::string::npos,
                             "error line missing: " + text);
                     require(text.find("[WARN] retry read_gist attempt=2 delay_ms=40") !=
                                 std::string::npos,
                             "retry line missing: " + text);
                   }});

  tests.push_back({"observability_log_observer_reports_sync_outcome", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out, ob::LogLevel::Debug);
                     observer.record_event(
                         ob::SyncOperationEvent{.operation = "store_cookies", .phase = "start"});
                     observer.record_event(
                         ob::SyncOperationEvent{.operation = "store_cookies",
                                                .phase = "end",
                                                .success = false,
                                                .duration = std::chrono::milliseconds(12)});
                     const std::string text = out.str();
                     require(text.find("[DEBUG] sync.store_cookies start") != std::string::npos,
                             "start line missing");
                     require(text.find("[WARN] sync.store_cookies success=false duration_ms=12") !=
                                 std::string::npos,
                             "failure should log as warning: " + text);
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     require(ob::create_observer("none", "info")->name() == "noop",
                             "none backend should map to noop");
                     require(ob::create_observer("", "info")->name() == "noop",
                             "empty backend should map to noop");
                     require(ob::create_observer("LOG", "debug")->name() == "log",
                             "log backend should map to log observer");
                   }});

  tests.push_back({"observability_init_from_env", [] {
                     sessionsync::testing::EnvGuard backend("SESSIONSYNC_LOG", std::string("log"));
                     sessionsync::testing::EnvGuard level("SESSIONSYNC_LOG_LEVEL",
                                                          std::string("error"));
                     ob::init_from_env();
                     require(ob::get_global_observer() != nullptr &&
                                 ob::get_global_observer()->name() == "log",
                             "SESSIONSYNC_LOG=log should install the log observer");
                     ob::set_global_observer(nullptr);
                   }});
}
