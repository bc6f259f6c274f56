#pragma once

#include "synmem/common/result.hpp"
#include "synmem/model/types.hpp"
#include "synmem/storage/knowledge_store.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace synmem::context {

inline constexpr double TITLE_SIMILARITY_THRESHOLD = 0.85;

enum class MatchType { ExactHash, TitleMatch };

[[nodiscard]] std::string_view to_string(MatchType match);

struct DuplicateCandidate {
  model::PromotedKnowledge existing;
  double similarity = 0.0;
  MatchType match = MatchType::TitleMatch;
};

/// Lowercase, collapse whitespace runs to one space, trim.
[[nodiscard]] std::string normalize_content(const std::string &content);
/// Hex SHA-256 of the normalized content.
[[nodiscard]] std::string content_fingerprint(const std::string &content);
[[nodiscard]] std::size_t levenshtein_distance(const std::string &a, const std::string &b);
/// `1 - distance / max_len` over normalized titles; 1.0 when they normalize equal.
[[nodiscard]] double title_similarity(const std::string &a, const std::string &b);

/// An exact fingerprint match is returned alone. Otherwise every visible item whose title
/// similarity reaches the threshold, best first.
[[nodiscard]] common::Result<std::vector<DuplicateCandidate>>
find_duplicates(storage::KnowledgeStore &store, const std::string &project_path,
                const std::string &title, const std::string &content);

[[nodiscard]] common::Status mark_superseded(storage::KnowledgeStore &store,
                                             const std::string &old_id,
                                             const std::string &new_id);

} // namespace synmem::context
