#include "synmem/context/dedup.hpp"

#include "synmem/common/fs.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace synmem::context {

std::string_view to_string(const MatchType match) {
  return match == MatchType::ExactHash ? "exact_hash" : "title_match";
}

std::string normalize_content(const std::string &content) {
  return common::trim(common::collapse_whitespace(common::to_lower(content)));
}

std::string content_fingerprint(const std::string &content) {
  const std::string normalized = normalize_content(content);
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(normalized.data()), normalized.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::size_t levenshtein_distance(const std::string &a, const std::string &b) {
  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) {
    previous[j] = j;
  }

  for (std::size_t i = 1; i <= a.size(); ++i) {
    current[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      if (a[i - 1] == b[j - 1]) {
        current[j] = previous[j - 1];
      } else {
        current[j] = std::min({previous[j - 1], current[j - 1], previous[j]}) + 1;
      }
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

double title_similarity(const std::string &a, const std::string &b) {
  const std::string left = normalize_content(a);
  const std::string right = normalize_content(b);
  if (left == right) {
    return 1.0;
  }
  const std::size_t max_len = std::max(left.size(), right.size());
  if (max_len == 0) {
    return 1.0;
  }
  return 1.0 - static_cast<double>(levenshtein_distance(left, right)) /
                   static_cast<double>(max_len);
}

common::Result<std::vector<DuplicateCandidate>>
find_duplicates(storage::KnowledgeStore &store, const std::string &project_path,
                const std::string &title, const std::string &content) {
  using CandidateList = common::Result<std::vector<DuplicateCandidate>>;

  const auto exact = store.find_by_hash(project_path, content_fingerprint(content));
  if (!exact.ok()) {
    return CandidateList::failure(exact.status());
  }
  if (exact.value().has_value()) {
    return CandidateList::success({DuplicateCandidate{
        .existing = *exact.value(), .similarity = 1.0, .match = MatchType::ExactHash}});
  }

  const auto items = store.all_active(project_path);
  if (!items.ok()) {
    return CandidateList::failure(items.status());
  }

  std::vector<DuplicateCandidate> candidates;
  for (const auto &item : items.value()) {
    const double similarity = title_similarity(title, item.title);
    if (similarity >= TITLE_SIMILARITY_THRESHOLD) {
      candidates.push_back(
          DuplicateCandidate{.existing = item, .similarity = similarity, .match = MatchType::TitleMatch});
    }
  }
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const DuplicateCandidate &lhs, const DuplicateCandidate &rhs) {
                     return lhs.similarity > rhs.similarity;
                   });
  return CandidateList::success(std::move(candidates));
}

common::Status mark_superseded(storage::KnowledgeStore &store, const std::string &old_id,
                               const std::string &new_id) {
  return store.mark_superseded(old_id, new_id);
}

} // namespace synmem::context
