#include "synmem/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace synmem::observability {

namespace {

std::string format_similarity(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, MigrationAppliedEvent>) {
          log_line("INFO", "schema.migrate version=" + std::to_string(evt.version));
        } else if constexpr (std::is_same_v<T, SessionStartedEvent>) {
          log_line("INFO", "session.start id=" + evt.session_id + " project=" +
                               evt.project_path + " branch=" + evt.branch +
                               " agent=" + evt.agent_type);
        } else if constexpr (std::is_same_v<T, SessionEndedEvent>) {
          log_line("INFO", "session.end id=" + evt.session_id +
                               " duration_s=" + std::to_string(evt.duration_secs));
        } else if constexpr (std::is_same_v<T, SessionsAbandonedEvent>) {
          log_line("WARN", "session.abandon project=" + evt.project_path +
                               " count=" + std::to_string(evt.count));
        } else if constexpr (std::is_same_v<T, KnowledgePromotedEvent>) {
          log_line("INFO",
                   "knowledge.promote id=" + evt.knowledge_id + " type=" + evt.knowledge_type);
        } else if constexpr (std::is_same_v<T, DuplicateDetectedEvent>) {
          log_line("INFO", "knowledge.duplicate existing=" + evt.existing_id + " match=" +
                               (evt.exact ? std::string("exact_hash")
                                          : std::string("title_match")) +
                               " similarity=" + format_similarity(evt.similarity));
        } else if constexpr (std::is_same_v<T, KnowledgeSurfacedEvent>) {
          log_line("DEBUG", "knowledge.surface session=" + evt.session_id +
                                " count=" + std::to_string(evt.count));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SchemaVersionMetric>) {
          log_line("DEBUG", "metric.schema_version=" + std::to_string(m.version));
        } else if constexpr (std::is_same_v<T, OperationLatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, FilesRescoredMetric>) {
          log_line("DEBUG", "metric.files_rescored=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace synmem::observability
