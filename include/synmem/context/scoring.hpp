#pragma once

#include "synmem/common/clock.hpp"
#include "synmem/model/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace synmem::context {

struct ScoredKnowledge {
  model::PromotedKnowledge knowledge;
  double relevance = 0.0;
  double branch_weight = 0.0;
  double recency_weight = 0.0;
};

struct ScoredSession {
  model::Session session;
  double score = 0.0;
};

[[nodiscard]] bool is_trunk_branch(const std::string &branch);

/// 1.0 same branch, 0.7 trunk, 0.3 other, 0.5 when the item has no branch.
[[nodiscard]] double branch_weight(const std::optional<std::string> &item_branch,
                                   const std::string &current_branch);

/// Four-bucket step over age in days. Unparseable timestamps land in the oldest bucket.
[[nodiscard]] double recency_weight(const std::string &created_at, common::TimePoint now);

[[nodiscard]] double usage_weight(std::int64_t usage_count);

[[nodiscard]] ScoredKnowledge score_knowledge(const model::PromotedKnowledge &knowledge,
                                              const std::string &current_branch,
                                              common::TimePoint now);
[[nodiscard]] ScoredSession score_session(const model::Session &session,
                                          const std::string &current_branch,
                                          common::TimePoint now);

/// Stable descending sort; ties keep input order.
[[nodiscard]] std::vector<ScoredKnowledge>
rank_knowledge(const std::vector<model::PromotedKnowledge> &items,
               const std::string &current_branch, common::TimePoint now);
[[nodiscard]] std::vector<ScoredSession> rank_sessions(const std::vector<model::Session> &sessions,
                                                       const std::string &current_branch,
                                                       common::TimePoint now);

} // namespace synmem::context
