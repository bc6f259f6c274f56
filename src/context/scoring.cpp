#include "synmem/context/scoring.hpp"

#include <algorithm>
#include <cmath>

namespace synmem::context {

namespace {

constexpr double SAME_BRANCH = 1.0;
constexpr double TRUNK_BRANCH = 0.7;
constexpr double OTHER_BRANCH = 0.3;
constexpr double NO_BRANCH = 0.5;

} // namespace

bool is_trunk_branch(const std::string &branch) { return branch == "main" || branch == "master"; }

double branch_weight(const std::optional<std::string> &item_branch,
                     const std::string &current_branch) {
  if (!item_branch.has_value() || item_branch->empty()) {
    return NO_BRANCH;
  }
  if (*item_branch == current_branch) {
    return SAME_BRANCH;
  }
  if (is_trunk_branch(*item_branch)) {
    return TRUNK_BRANCH;
  }
  return OTHER_BRANCH;
}

double recency_weight(const std::string &created_at, const common::TimePoint now) {
  const auto days = common::days_between(created_at, now);
  if (!days.has_value()) {
    return 0.3;
  }
  if (*days < 1.0) {
    return 1.0;
  }
  if (*days < 7.0) {
    return 0.8;
  }
  if (*days < 30.0) {
    return 0.5;
  }
  return 0.3;
}

double usage_weight(const std::int64_t usage_count) {
  return 1.0 + std::log(static_cast<double>(usage_count) + 1.0) * 0.1;
}

ScoredKnowledge score_knowledge(const model::PromotedKnowledge &knowledge,
                                const std::string &current_branch, const common::TimePoint now) {
  ScoredKnowledge scored;
  scored.knowledge = knowledge;
  scored.branch_weight = branch_weight(knowledge.branch, current_branch);
  scored.recency_weight = recency_weight(knowledge.created_at, now);
  const double usage = usage_weight(knowledge.usage_count);
  scored.relevance =
      scored.branch_weight * 0.4 + scored.recency_weight * 0.4 + (usage - 1.0) * 0.2 + 0.2;
  return scored;
}

ScoredSession score_session(const model::Session &session, const std::string &current_branch,
                            const common::TimePoint now) {
  const double branch = branch_weight(session.branch, current_branch);
  const double recency = recency_weight(session.started_at, now);
  return ScoredSession{.session = session, .score = branch * 0.5 + recency * 0.5};
}

std::vector<ScoredKnowledge> rank_knowledge(const std::vector<model::PromotedKnowledge> &items,
                                            const std::string &current_branch,
                                            const common::TimePoint now) {
  std::vector<ScoredKnowledge> ranked;
  ranked.reserve(items.size());
  for (const auto &item : items) {
    ranked.push_back(score_knowledge(item, current_branch, now));
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.relevance > rhs.relevance;
  });
  return ranked;
}

std::vector<ScoredSession> rank_sessions(const std::vector<model::Session> &sessions,
                                         const std::string &current_branch,
                                         const common::TimePoint now) {
  std::vector<ScoredSession> ranked;
  ranked.reserve(sessions.size());
  for (const auto &session : sessions) {
    ranked.push_back(score_session(session, current_branch, now));
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &lhs, const auto &rhs) { return lhs.score > rhs.score; });
  return ranked;
}

} // namespace synmem::context
