#include "synmem/observability/global.hpp"

#include <mutex>

namespace synmem::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

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

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_migration_applied(const int version) {
  record_event(MigrationAppliedEvent{.version = version});
  record_metric(SchemaVersionMetric{.version = version});
}

void record_session_started(const std::string &session_id, const std::string &project_path,
                            const std::string &branch, const std::string &agent_type) {
  record_event(SessionStartedEvent{.session_id = session_id,
                                   .project_path = project_path,
                                   .branch = branch,
                                   .agent_type = agent_type});
}

void record_session_ended(const std::string &session_id, const std::int64_t duration_secs) {
  record_event(SessionEndedEvent{.session_id = session_id, .duration_secs = duration_secs});
}

void record_sessions_abandoned(const std::string &project_path, const std::uint64_t count) {
  record_event(SessionsAbandonedEvent{.project_path = project_path, .count = count});
}

void record_knowledge_promoted(const std::string &knowledge_id, const std::string &type) {
  record_event(KnowledgePromotedEvent{.knowledge_id = knowledge_id, .knowledge_type = type});
}

void record_duplicate_detected(const std::string &existing_id, const double similarity,
                               const bool exact) {
  record_event(
      DuplicateDetectedEvent{.existing_id = existing_id, .similarity = similarity, .exact = exact});
}

void record_knowledge_surfaced(const std::string &session_id, const std::uint64_t count) {
  record_event(KnowledgeSurfacedEvent{.session_id = session_id, .count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace synmem::observability
