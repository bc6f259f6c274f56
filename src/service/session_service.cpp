#include "synmem/service/session_service.hpp"

#include "synmem/common/fs.hpp"
#include "synmem/observability/global.hpp"

#include <algorithm>
#include <ctime>

namespace synmem::service {

namespace {

// Candidates fetched per surfaced slot before ranking trims the list.
constexpr std::size_t SESSION_POOL_FACTOR = 4;
constexpr std::size_t KNOWLEDGE_POOL = 50;
constexpr std::size_t RECALL_KNOWLEDGE_POOL = 100;

template <typename T>
common::Result<T> fail(const std::string &operation, const common::Status &status) {
  observability::record_error("service", operation + ": " + status.error());
  return common::Result<T>::failure("Failed to " + operation + ": " + status.error(),
                                    status.code());
}

std::string session_not_found(const std::string &session_id) {
  return "Session " + session_id + " not found.";
}

bool contains_normalized(const std::string &haystack, const std::string &needle) {
  return context::normalize_content(haystack).find(context::normalize_content(needle)) !=
         std::string::npos;
}

} // namespace

std::string_view to_string(const StatsPeriod period) {
  switch (period) {
  case StatsPeriod::Day:
    return "day";
  case StatsPeriod::Week:
    return "week";
  case StatsPeriod::Month:
    return "month";
  case StatsPeriod::All:
    break;
  }
  return "all";
}

std::optional<StatsPeriod> stats_period_from_string(const std::string_view text) {
  if (text == "day") {
    return StatsPeriod::Day;
  }
  if (text == "week") {
    return StatsPeriod::Week;
  }
  if (text == "month") {
    return StatsPeriod::Month;
  }
  if (text == "all") {
    return StatsPeriod::All;
  }
  return std::nullopt;
}

std::optional<std::string> period_start(const StatsPeriod period, const common::TimePoint now) {
  using std::chrono::hours;
  switch (period) {
  case StatsPeriod::Day:
    return common::format_iso(now - hours(24));
  case StatsPeriod::Week:
    return common::format_iso(now - hours(24 * 7));
  case StatsPeriod::Month: {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = now - std::chrono::system_clock::from_time_t(seconds);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    tm.tm_mon -= 1;
    const std::time_t shifted = timegm(&tm);
    return common::format_iso(std::chrono::system_clock::from_time_t(shifted) + millis);
  }
  case StatsPeriod::All:
    break;
  }
  return std::nullopt;
}

SessionService::SessionService(storage::Database &db, common::IClock &clock,
                               common::IIdGenerator &ids, probe::IEnvironmentProbe &probe,
                               config::ContextConfig limits)
    : db_(&db), clock_(&clock), ids_(&ids), probe_(&probe), limits_(limits), sessions_(db),
      events_(db), knowledge_(db), usage_(db), files_(db), agents_(db), value_(db) {}

common::Result<SessionDigest> SessionService::digest(const context::ScoredSession &scored) {
  SessionDigest out;
  out.scored = scored;

  const auto decisions = events_.for_session(scored.session.session_id, model::EventType::Decision);
  if (!decisions.ok()) {
    return common::Result<SessionDigest>::failure(decisions.status());
  }
  for (const auto &event : decisions.value()) {
    if (const auto *detail = std::get_if<model::DecisionDetail>(&event.detail); detail != nullptr) {
      out.decisions.push_back(detail->title);
    }
  }

  const auto patterns = events_.for_session(scored.session.session_id, model::EventType::Pattern);
  if (!patterns.ok()) {
    return common::Result<SessionDigest>::failure(patterns.status());
  }
  for (const auto &event : patterns.value()) {
    if (const auto *detail = std::get_if<model::PatternDetail>(&event.detail); detail != nullptr) {
      out.patterns.push_back(detail->description);
    }
  }
  return common::Result<SessionDigest>::success(std::move(out));
}

common::Result<SessionContext>
SessionService::start_session(const StartSessionRequest &request) {
  const std::string op = "start session";
  if (common::trim(request.project_path).empty()) {
    return common::Result<SessionContext>::failure("project path is required",
                                                   common::ErrorCode::InvalidArgument);
  }

  const auto now = clock_->now();
  const std::string now_iso = common::format_iso(now);

  model::Session session;
  session.session_id = ids_->next_id();
  session.project_path = request.project_path;
  session.branch = request.branch.has_value() && !request.branch->empty()
                       ? *request.branch
                       : probe_->current_branch(request.project_path);
  session.started_at = now_iso;
  session.status = model::SessionStatus::Active;
  session.git_commit_start = request.git_commit.has_value()
                                 ? request.git_commit
                                 : probe_->head_commit(request.project_path);
  if (request.agent_type.has_value()) {
    session.agent_type = *request.agent_type;
    session.agent_version = request.agent_version;
  } else {
    const auto detected = probe_->detect_agent();
    session.agent_type = detected.type;
    session.agent_version =
        request.agent_version.has_value() ? request.agent_version : detected.version;
  }

  SessionContext out;
  {
    storage::Transaction tx(*db_);
    if (!tx.status().ok()) {
      return fail<SessionContext>(op, tx.status());
    }
    const auto abandoned = sessions_.abandon_active(session.project_path, now_iso);
    if (!abandoned.ok()) {
      return fail<SessionContext>(op, abandoned.status());
    }
    out.abandoned_count = abandoned.value();

    auto status = sessions_.create(session);
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
    const auto agent = agents_.upsert(session.agent_type, now_iso);
    if (!agent.ok()) {
      return fail<SessionContext>(op, agent.status());
    }
    status = value_.increment_sessions(session.project_path, now_iso);
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
    status = tx.commit();
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
  }

  if (out.abandoned_count > 0) {
    observability::record_sessions_abandoned(session.project_path, out.abandoned_count);
  }
  observability::record_session_started(session.session_id, session.project_path,
                                        session.branch,
                                        std::string(model::to_string(session.agent_type)));

  const auto recent = sessions_.recent(session.project_path,
                                       limits_.recent_sessions * SESSION_POOL_FACTOR);
  if (!recent.ok()) {
    return fail<SessionContext>(op, recent.status());
  }
  auto ranked_sessions = context::rank_sessions(recent.value(), session.branch, now);
  if (ranked_sessions.size() > limits_.recent_sessions) {
    ranked_sessions.resize(limits_.recent_sessions);
  }
  for (const auto &scored : ranked_sessions) {
    auto item = digest(scored);
    if (!item.ok()) {
      return fail<SessionContext>(op, item.status());
    }
    out.recent_sessions.push_back(std::move(item.value()));
  }

  const auto candidates = knowledge_.for_project(session.project_path, std::nullopt, KNOWLEDGE_POOL);
  if (!candidates.ok()) {
    return fail<SessionContext>(op, candidates.status());
  }
  out.knowledge = context::rank_knowledge(candidates.value(), session.branch, now);
  if (out.knowledge.size() > limits_.knowledge_items) {
    out.knowledge.resize(limits_.knowledge_items);
  }
  for (auto &scored : out.knowledge) {
    const model::KnowledgeUsage usage{.usage_id = ids_->next_id(),
                                      .knowledge_id = scored.knowledge.knowledge_id,
                                      .session_id = session.session_id,
                                      .usage_type = model::UsageType::Surfaced,
                                      .timestamp = now_iso};
    const auto status = usage_.record(usage);
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
    ++scored.knowledge.usage_count;
  }
  if (!out.knowledge.empty()) {
    const auto status = value_.increment_knowledge_surfaced(
        session.project_path, static_cast<std::int64_t>(out.knowledge.size()), now_iso);
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
    observability::record_knowledge_surfaced(session.session_id, out.knowledge.size());
  }
  if (!out.knowledge.empty() || !out.recent_sessions.empty()) {
    const auto status = value_.increment_context_reuse(session.project_path, now_iso);
    if (!status.ok()) {
      return fail<SessionContext>(op, status);
    }
  }

  const auto files = files_.top(session.project_path, limits_.important_files);
  if (!files.ok()) {
    return fail<SessionContext>(op, files.status());
  }
  out.important_files = files.value();
  out.session = std::move(session);
  return common::Result<SessionContext>::success(std::move(out));
}

common::Result<EndSessionOutcome> SessionService::end_session(const EndSessionRequest &request) {
  const std::string op = "end session";
  const auto now = clock_->now();

  const auto ended = sessions_.end(request.session_id, common::format_iso(now), request.summary,
                                   request.git_commit);
  if (!ended.ok()) {
    return fail<EndSessionOutcome>(op, ended.status());
  }
  if (!ended.value().has_value()) {
    return common::Result<EndSessionOutcome>::failure(
        "Session " + request.session_id + " not found or already ended.",
        common::ErrorCode::NotFound);
  }

  const auto metrics = sessions_.compute_metrics(request.session_id, now);
  if (!metrics.ok()) {
    return fail<EndSessionOutcome>(op, metrics.status());
  }
  if (!metrics.value().has_value()) {
    return common::Result<EndSessionOutcome>::failure(
        "Session " + request.session_id + " ended but metrics could not be computed.");
  }

  observability::record_session_ended(request.session_id, metrics.value()->duration_secs);
  return common::Result<EndSessionOutcome>::success(
      EndSessionOutcome{.session = *ended.value(), .metrics = *metrics.value()});
}

common::Result<model::SessionEvent>
SessionService::record_event(const RecordEventRequest &request) {
  const std::string op = "record event";
  const auto session = sessions_.get(request.session_id);
  if (!session.ok()) {
    return fail<model::SessionEvent>(op, session.status());
  }
  if (!session.value().has_value()) {
    return common::Result<model::SessionEvent>::failure(session_not_found(request.session_id),
                                                        common::ErrorCode::NotFound);
  }
  const auto &owner = *session.value();
  if (owner.status != model::SessionStatus::Active) {
    return common::Result<model::SessionEvent>::failure(
        "Session " + request.session_id + " is " + std::string(model::to_string(owner.status)) +
            ", not active.",
        common::ErrorCode::Precondition);
  }

  const auto now = clock_->now();
  model::SessionEvent event;
  event.event_id = ids_->next_id();
  event.session_id = request.session_id;
  event.timestamp = common::format_iso(now);
  event.event_type = model::derive_event_type(request.detail);
  event.category = model::categorize(event.event_type);
  event.detail = request.detail;

  storage::Transaction tx(*db_);
  if (!tx.status().ok()) {
    return fail<model::SessionEvent>(op, tx.status());
  }
  auto status = events_.insert(event);
  if (!status.ok()) {
    return fail<model::SessionEvent>(op, status);
  }
  if (const auto *file_op = std::get_if<model::FileOpDetail>(&event.detail); file_op != nullptr) {
    const auto access = file_op->operation == model::FileOperation::Read ? model::AccessType::Read
                                                                         : model::AccessType::Edit;
    const auto touched = files_.record_access(owner.project_path, file_op->path, access, now);
    if (!touched.ok()) {
      return fail<model::SessionEvent>(op, touched.status());
    }
  }
  status = tx.commit();
  if (!status.ok()) {
    return fail<model::SessionEvent>(op, status);
  }
  return common::Result<model::SessionEvent>::success(std::move(event));
}

common::Result<PromotionOutcome>
SessionService::promote_knowledge(const PromoteKnowledgeRequest &request) {
  const std::string op = "promote knowledge";
  if (common::trim(request.project_path).empty() || common::trim(request.title).empty() ||
      common::trim(request.content).empty()) {
    return common::Result<PromotionOutcome>::failure(
        "project path, title and content are required", common::ErrorCode::InvalidArgument);
  }

  if (request.supersedes.has_value()) {
    const auto old = knowledge_.get(*request.supersedes);
    if (!old.ok()) {
      return fail<PromotionOutcome>(op, old.status());
    }
    if (!old.value().has_value() || old.value()->project_path != request.project_path) {
      return common::Result<PromotionOutcome>::failure(
          "Knowledge " + *request.supersedes + " not found.", common::ErrorCode::NotFound);
    }
  }

  PromotionOutcome out;
  if (!request.allow_duplicate) {
    const auto duplicates = context::find_duplicates(knowledge_, request.project_path,
                                                     request.title, request.content);
    if (!duplicates.ok()) {
      return fail<PromotionOutcome>(op, duplicates.status());
    }
    for (const auto &candidate : duplicates.value()) {
      // The item being replaced is expected to look like its replacement.
      if (candidate.existing.knowledge_id == request.supersedes) {
        continue;
      }
      out.duplicate = candidate;
      break;
    }
  }

  if (out.duplicate.has_value()) {
    observability::record_duplicate_detected(out.duplicate->existing.knowledge_id,
                                             out.duplicate->similarity,
                                             out.duplicate->match == context::MatchType::ExactHash);
  } else {
    model::PromotedKnowledge knowledge;
    knowledge.knowledge_id = ids_->next_id();
    knowledge.project_path = request.project_path;
    knowledge.session_id = request.session_id;
    knowledge.source_event_id = request.source_event_id;
    knowledge.title = request.title;
    knowledge.content = request.content;
    knowledge.knowledge_type = request.knowledge_type;
    knowledge.tags = request.tags;
    knowledge.created_at = clock_->now_iso();
    knowledge.content_hash = context::content_fingerprint(request.content);

    if (request.session_id.has_value()) {
      const auto source = sessions_.get(*request.session_id);
      if (!source.ok()) {
        return fail<PromotionOutcome>(op, source.status());
      }
      if (source.value().has_value()) {
        knowledge.branch = source.value()->branch;
      }
    }

    storage::Transaction tx(*db_);
    if (!tx.status().ok()) {
      return fail<PromotionOutcome>(op, tx.status());
    }
    auto status = knowledge_.insert(knowledge);
    if (!status.ok()) {
      return fail<PromotionOutcome>(op, status);
    }
    if (request.supersedes.has_value()) {
      status = context::mark_superseded(knowledge_, *request.supersedes, knowledge.knowledge_id);
      if (!status.ok()) {
        return fail<PromotionOutcome>(op, status);
      }
    }
    status = tx.commit();
    if (!status.ok()) {
      return fail<PromotionOutcome>(op, status);
    }

    observability::record_knowledge_promoted(knowledge.knowledge_id,
                                             std::string(model::to_string(knowledge.knowledge_type)));
    out.promoted = std::move(knowledge);
  }

  const auto counts = knowledge_.count(request.project_path);
  if (!counts.ok()) {
    return fail<PromotionOutcome>(op, counts.status());
  }
  out.project_total = static_cast<std::size_t>(counts.value().total);
  return common::Result<PromotionOutcome>::success(std::move(out));
}

common::Result<std::vector<model::PromotedKnowledge>>
SessionService::get_knowledge(const std::string &project_path,
                              const std::optional<model::KnowledgeType> &type,
                              const std::size_t limit) {
  const auto items = knowledge_.for_project(project_path, type, std::max<std::size_t>(limit, 1));
  if (!items.ok()) {
    return fail<std::vector<model::PromotedKnowledge>>("get knowledge", items.status());
  }
  return items;
}

common::Result<model::PromotedKnowledge>
SessionService::apply_knowledge(const std::string &knowledge_id, const std::string &session_id) {
  const std::string op = "apply knowledge";
  const auto item = knowledge_.get(knowledge_id);
  if (!item.ok()) {
    return fail<model::PromotedKnowledge>(op, item.status());
  }
  if (!item.value().has_value()) {
    return common::Result<model::PromotedKnowledge>::failure(
        "Knowledge " + knowledge_id + " not found.", common::ErrorCode::NotFound);
  }
  const auto session = sessions_.get(session_id);
  if (!session.ok()) {
    return fail<model::PromotedKnowledge>(op, session.status());
  }
  if (!session.value().has_value()) {
    return common::Result<model::PromotedKnowledge>::failure(session_not_found(session_id),
                                                             common::ErrorCode::NotFound);
  }

  const std::string now_iso = clock_->now_iso();
  const auto &knowledge = *item.value();
  storage::Transaction tx(*db_);
  if (!tx.status().ok()) {
    return fail<model::PromotedKnowledge>(op, tx.status());
  }
  auto status = usage_.record(model::KnowledgeUsage{.usage_id = ids_->next_id(),
                                                    .knowledge_id = knowledge_id,
                                                    .session_id = session_id,
                                                    .usage_type = model::UsageType::Applied,
                                                    .timestamp = now_iso});
  if (!status.ok()) {
    return fail<model::PromotedKnowledge>(op, status);
  }

  switch (knowledge.knowledge_type) {
  case model::KnowledgeType::Pattern:
    status = value_.increment_patterns_applied(knowledge.project_path, 1, now_iso);
    break;
  case model::KnowledgeType::ErrorResolved:
    status = value_.increment_errors_prevented(knowledge.project_path, 1, now_iso);
    break;
  case model::KnowledgeType::Decision:
    status = value_.increment_decisions_recalled(knowledge.project_path, 1, now_iso);
    break;
  case model::KnowledgeType::Milestone:
    status = value_.increment_context_reuse(knowledge.project_path, now_iso);
    break;
  }
  if (!status.ok()) {
    return fail<model::PromotedKnowledge>(op, status);
  }
  status = tx.commit();
  if (!status.ok()) {
    return fail<model::PromotedKnowledge>(op, status);
  }

  auto updated = knowledge;
  ++updated.usage_count;
  return common::Result<model::PromotedKnowledge>::success(std::move(updated));
}

common::Result<RecallResult> SessionService::recall(const RecallRequest &request) {
  const std::string op = "recall";
  const std::size_t limit = std::max<std::size_t>(request.limit, 1);
  const bool has_query = request.query.has_value() && !common::trim(*request.query).empty();
  RecallResult out;

  if (request.event_type.has_value() && !has_query) {
    out.events_only = true;
    auto events = events_.recent(request.project_path, request.event_type, limit);
    if (!events.ok()) {
      return fail<RecallResult>(op, events.status());
    }
    out.events = std::move(events.value());
    return common::Result<RecallResult>::success(std::move(out));
  }

  const auto sessions = sessions_.search(request.project_path,
                                         has_query ? request.query : std::nullopt,
                                         request.branch, limit);
  if (!sessions.ok()) {
    return fail<RecallResult>(op, sessions.status());
  }
  for (const auto &session : sessions.value()) {
    RecalledSession recalled{.session = session, .events = {}};
    std::vector<model::EventType> wanted;
    if (request.event_type.has_value()) {
      wanted.push_back(*request.event_type);
    } else {
      wanted = {model::EventType::Decision, model::EventType::Pattern};
    }
    for (const auto type : wanted) {
      auto events = events_.for_session(session.session_id, type);
      if (!events.ok()) {
        return fail<RecallResult>(op, events.status());
      }
      for (auto &event : events.value()) {
        recalled.events.push_back(std::move(event));
      }
    }
    out.sessions.push_back(std::move(recalled));
  }

  if (!has_query) {
    return common::Result<RecallResult>::success(std::move(out));
  }

  if (request.session_id.has_value()) {
    const auto session = sessions_.get(*request.session_id);
    if (!session.ok()) {
      return fail<RecallResult>(op, session.status());
    }
    if (!session.value().has_value()) {
      return common::Result<RecallResult>::failure(session_not_found(*request.session_id),
                                                   common::ErrorCode::NotFound);
    }
  }

  const auto pool = knowledge_.for_project(request.project_path, std::nullopt, RECALL_KNOWLEDGE_POOL);
  if (!pool.ok()) {
    return fail<RecallResult>(op, pool.status());
  }
  const std::string now_iso = clock_->now_iso();
  std::int64_t decisions = 0;
  for (const auto &item : pool.value()) {
    if (out.knowledge.size() >= limit) {
      break;
    }
    if (!contains_normalized(item.title, *request.query) &&
        !contains_normalized(item.content, *request.query)) {
      continue;
    }
    auto recalled = item;
    if (request.session_id.has_value()) {
      const auto status = usage_.record(model::KnowledgeUsage{.usage_id = ids_->next_id(),
                                                              .knowledge_id = item.knowledge_id,
                                                              .session_id = *request.session_id,
                                                              .usage_type = model::UsageType::Recalled,
                                                              .timestamp = now_iso});
      if (!status.ok()) {
        return fail<RecallResult>(op, status);
      }
      ++recalled.usage_count;
    }
    if (item.knowledge_type == model::KnowledgeType::Decision) {
      ++decisions;
    }
    out.knowledge.push_back(std::move(recalled));
  }
  if (decisions > 0) {
    const auto status =
        value_.increment_decisions_recalled(request.project_path, decisions, now_iso);
    if (!status.ok()) {
      return fail<RecallResult>(op, status);
    }
  }
  return common::Result<RecallResult>::success(std::move(out));
}

common::Result<ProjectStats> SessionService::stats(const std::string &project_path,
                                                   const StatsPeriod period) {
  const std::string op = "get stats";
  const auto since = period_start(period, clock_->now());

  ProjectStats out;
  out.period = period;
  auto sessions = sessions_.stats(project_path, since);
  if (!sessions.ok()) {
    return fail<ProjectStats>(op, sessions.status());
  }
  out.sessions = std::move(sessions.value());

  auto agents = agents_.stats(project_path, since);
  if (!agents.ok()) {
    return fail<ProjectStats>(op, agents.status());
  }
  out.agents = std::move(agents.value());

  const auto usage = usage_.counts_by_type(project_path, since);
  if (!usage.ok()) {
    return fail<ProjectStats>(op, usage.status());
  }
  out.usage = usage.value();
  return common::Result<ProjectStats>::success(std::move(out));
}

common::Result<std::optional<ValueReport>>
SessionService::value_report(const std::string &project_path, const double hourly_rate) {
  using MaybeReport = common::Result<std::optional<ValueReport>>;
  const std::string op = "get value metrics";
  const auto metrics = value_.get(project_path);
  if (!metrics.ok()) {
    return fail<std::optional<ValueReport>>(op, metrics.status());
  }
  if (!metrics.value().has_value()) {
    return MaybeReport::success(std::nullopt);
  }

  const auto summary = value_.summary(project_path, hourly_rate);
  if (!summary.ok()) {
    return fail<std::optional<ValueReport>>(op, summary.status());
  }
  auto counts = knowledge_.count(project_path);
  if (!counts.ok()) {
    return fail<std::optional<ValueReport>>(op, counts.status());
  }
  return MaybeReport::success(ValueReport{.metrics = *metrics.value(),
                                          .summary = summary.value(),
                                          .knowledge = std::move(counts.value()),
                                          .hourly_rate = hourly_rate});
}

common::Result<std::size_t>
SessionService::refresh_file_importance(const std::string &project_path) {
  const auto updated = files_.refresh(project_path, clock_->now());
  if (!updated.ok()) {
    return fail<std::size_t>("refresh file importance", updated.status());
  }
  observability::record_metric(
      observability::FilesRescoredMetric{.count = static_cast<std::uint64_t>(updated.value())});
  return updated;
}

} // namespace synmem::service
