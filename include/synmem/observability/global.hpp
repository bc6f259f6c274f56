#pragma once

#include "synmem/observability/observer.hpp"

#include <memory>

namespace synmem::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_migration_applied(int version);
void record_session_started(const std::string &session_id, const std::string &project_path,
                            const std::string &branch, const std::string &agent_type);
void record_session_ended(const std::string &session_id, std::int64_t duration_secs);
void record_sessions_abandoned(const std::string &project_path, std::uint64_t count);
void record_knowledge_promoted(const std::string &knowledge_id, const std::string &type);
void record_duplicate_detected(const std::string &existing_id, double similarity, bool exact);
void record_knowledge_surfaced(const std::string &session_id, std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace synmem::observability
