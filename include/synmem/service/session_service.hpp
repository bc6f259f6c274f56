#pragma once

#include "synmem/common/clock.hpp"
#include "synmem/common/result.hpp"
#include "synmem/config/schema.hpp"
#include "synmem/context/dedup.hpp"
#include "synmem/context/scoring.hpp"
#include "synmem/model/types.hpp"
#include "synmem/probe/environment.hpp"
#include "synmem/storage/agent_store.hpp"
#include "synmem/storage/database.hpp"
#include "synmem/storage/event_store.hpp"
#include "synmem/storage/file_importance_store.hpp"
#include "synmem/storage/knowledge_store.hpp"
#include "synmem/storage/session_store.hpp"
#include "synmem/storage/usage_store.hpp"
#include "synmem/storage/value_metrics_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::service {

struct StartSessionRequest {
  std::string project_path;
  std::optional<std::string> branch;
  std::optional<std::string> git_commit;
  std::optional<model::AgentType> agent_type;
  std::optional<std::string> agent_version;
};

struct SessionDigest {
  context::ScoredSession scored;
  std::vector<std::string> decisions;
  std::vector<std::string> patterns;
};

struct SessionContext {
  model::Session session;
  std::size_t abandoned_count = 0;
  std::vector<SessionDigest> recent_sessions;
  std::vector<context::ScoredKnowledge> knowledge;
  std::vector<model::FileImportance> important_files;
};

struct EndSessionRequest {
  std::string session_id;
  std::optional<std::string> summary;
  std::optional<std::string> git_commit;
};

struct EndSessionOutcome {
  model::Session session;
  model::SessionMetrics metrics;
};

struct RecordEventRequest {
  std::string session_id;
  model::EventDetail detail;
  /// Informational only; the stored type is always derived from `detail`.
  std::optional<model::EventType> declared_type;
};

struct PromoteKnowledgeRequest {
  std::string project_path;
  std::string title;
  std::string content;
  model::KnowledgeType knowledge_type = model::KnowledgeType::Decision;
  std::vector<std::string> tags;
  std::optional<std::string> session_id;
  std::optional<std::string> source_event_id;
  bool allow_duplicate = false;
  std::optional<std::string> supersedes;
};

/// Exactly one of `promoted` / `duplicate` is set.
struct PromotionOutcome {
  std::optional<model::PromotedKnowledge> promoted;
  std::optional<context::DuplicateCandidate> duplicate;
  std::size_t project_total = 0;
};

struct RecallRequest {
  std::string project_path;
  std::optional<std::string> query;
  std::optional<std::string> branch;
  std::optional<model::EventType> event_type;
  std::size_t limit = 10;
  /// When set, matching knowledge is logged as recalled by this session.
  std::optional<std::string> session_id;
};

struct RecalledSession {
  model::Session session;
  std::vector<model::SessionEvent> events;
};

struct RecallResult {
  /// True when only an event type was given: `events` holds the latest events of that type.
  bool events_only = false;
  std::vector<model::SessionEvent> events;
  std::vector<RecalledSession> sessions;
  std::vector<model::PromotedKnowledge> knowledge;
};

enum class StatsPeriod { Day, Week, Month, All };

[[nodiscard]] std::string_view to_string(StatsPeriod period);
[[nodiscard]] std::optional<StatsPeriod> stats_period_from_string(std::string_view text);
/// Lower bound for a period ending at `now`; nullopt for All.
[[nodiscard]] std::optional<std::string> period_start(StatsPeriod period, common::TimePoint now);

struct ProjectStats {
  StatsPeriod period = StatsPeriod::Week;
  storage::SessionStats sessions;
  std::vector<storage::AgentSessionCount> agents;
  storage::UsageCounts usage;
};

struct ValueReport {
  model::ValueMetrics metrics;
  storage::ValueSummary summary;
  storage::KnowledgeCount knowledge;
  double hourly_rate = 50.0;
};

/// Session lifecycle and context surfacing over one open store.
class SessionService {
public:
  SessionService(storage::Database &db, common::IClock &clock, common::IIdGenerator &ids,
                 probe::IEnvironmentProbe &probe, config::ContextConfig limits = {});

  [[nodiscard]] common::Result<SessionContext> start_session(const StartSessionRequest &request);
  [[nodiscard]] common::Result<EndSessionOutcome> end_session(const EndSessionRequest &request);
  [[nodiscard]] common::Result<model::SessionEvent> record_event(const RecordEventRequest &request);

  [[nodiscard]] common::Result<PromotionOutcome>
  promote_knowledge(const PromoteKnowledgeRequest &request);
  [[nodiscard]] common::Result<std::vector<model::PromotedKnowledge>>
  get_knowledge(const std::string &project_path, const std::optional<model::KnowledgeType> &type,
                std::size_t limit);
  /// Logs an `applied` usage and credits the matching value counter.
  [[nodiscard]] common::Result<model::PromotedKnowledge>
  apply_knowledge(const std::string &knowledge_id, const std::string &session_id);

  [[nodiscard]] common::Result<RecallResult> recall(const RecallRequest &request);
  [[nodiscard]] common::Result<ProjectStats> stats(const std::string &project_path,
                                                   StatsPeriod period);
  /// nullopt when the project has never started a session.
  [[nodiscard]] common::Result<std::optional<ValueReport>>
  value_report(const std::string &project_path, double hourly_rate);
  [[nodiscard]] common::Result<std::size_t> refresh_file_importance(const std::string &project_path);

private:
  [[nodiscard]] common::Result<SessionDigest> digest(const context::ScoredSession &scored);

  storage::Database *db_;
  common::IClock *clock_;
  common::IIdGenerator *ids_;
  probe::IEnvironmentProbe *probe_;
  config::ContextConfig limits_;

  storage::SessionStore sessions_;
  storage::EventStore events_;
  storage::KnowledgeStore knowledge_;
  storage::KnowledgeUsageStore usage_;
  storage::FileImportanceStore files_;
  storage::AgentStore agents_;
  storage::ValueMetricsStore value_;
};

} // namespace synmem::service
