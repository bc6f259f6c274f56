#include "test_framework.hpp"

#include "synmem/observability/factory.hpp"
#include "synmem/observability/global.hpp"
#include "synmem/observability/log_observer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sstream>

void register_observability_tests(std::vector<synmem::tests::TestCase> &tests) {
  using synmem::tests::require;
  namespace o = synmem::observability;

  tests.push_back({"observability_log_observer_formats_events", [] {
                     std::ostringstream out;
                     o::LogObserver observer(out);
                     observer.record_event(o::SessionStartedEvent{.session_id = "s1",
                                                                  .project_path = "/p",
                                                                  .branch = "main",
                                                                  .agent_type = "cursor"});
                     observer.record_event(
                         o::SessionsAbandonedEvent{.project_path = "/p", .count = 2});
                     observer.record_event(o::DuplicateDetectedEvent{
                         .existing_id = "k1", .similarity = 0.9, .exact = false});
                     observer.record_metric(o::FilesRescoredMetric{.count = 3});
                     observer.flush();

                     const std::string text = out.str();
                     require(text.find("[INFO] session.start id=s1 project=/p branch=main "
                                       "agent=cursor") != std::string::npos,
                             "start line missing: " + text);
                     require(text.find("[WARN] session.abandon project=/p count=2") !=
                                 std::string::npos,
                             "abandon line missing");
                     require(text.find("match=title_match similarity=0.90") != std::string::npos,
                             "duplicate line missing");
                     require(text.find("[DEBUG] metric.files_rescored=3") != std::string::npos,
                             "metric line missing");
                   }});

  tests.push_back({"observability_factory_selects_backend", [] {
                     synmem::config::Config config;
                     require(o::create_observer(config)->name() == "noop", "default is noop");
                     config.observability.backend = "LOG";
                     require(o::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "none";
                     require(o::create_observer(config)->name() == "noop", "none backend");
                   }});

  tests.push_back({"observability_global_helpers_reach_installed_observer", [] {
                     synmem::testing::ObserverScope scope;
                     o::record_migration_applied(2);
                     o::record_error("storage", "disk full");
                     auto &observer = scope.observer();
                     require(observer.count<o::MigrationAppliedEvent>() == 1, "migration event");
                     require(observer.count<o::ErrorEvent>() == 1, "error event");
                     require(observer.metrics.size() == 1, "schema version metric");
                     const auto *metric = std::get_if<o::SchemaVersionMetric>(&observer.metrics[0]);
                     require(metric != nullptr && metric->version == 2, "metric carries version");
                   }});

  tests.push_back({"observability_helpers_are_safe_without_observer", [] {
                     o::set_global_observer(nullptr);
                     o::record_session_ended("s", 10);
                     require(o::get_global_observer() == nullptr, "no observer installed");
                   }});
}
