#include "test_framework.hpp"

#include "synmem/context/dedup.hpp"
#include "synmem/context/scoring.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

namespace c = synmem::context;
namespace m = synmem::model;
using synmem::tests::require;
using synmem::testing::at;

constexpr const char *PROJECT = "/work/app";

bool near(const double a, const double b) { return std::abs(a - b) < 1e-9; }

m::PromotedKnowledge knowledge(const std::string &id, const std::string &title,
                               const std::string &content, const std::string &created_at) {
  m::PromotedKnowledge item;
  item.knowledge_id = id;
  item.project_path = PROJECT;
  item.title = title;
  item.content = content;
  item.created_at = created_at;
  item.content_hash = c::content_fingerprint(content);
  return item;
}

} // namespace

void register_context_tests(std::vector<synmem::tests::TestCase> &tests) {
  tests.push_back({"context_normalize_collapses_case_and_whitespace", [] {
                     require(c::normalize_content("  Use   WAL\n\tMode ") == "use wal mode",
                             "normalized form");
                     require(c::normalize_content("") == "", "empty stays empty");
                   }});

  tests.push_back({"context_fingerprint_is_sha256_of_normalized_text", [] {
                     require(c::content_fingerprint("  ABC ") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc)");
                     require(c::content_fingerprint("Use  WAL") == c::content_fingerprint("use wal"),
                             "formatting does not change the fingerprint");
                     require(c::content_fingerprint("use wal") != c::content_fingerprint("use rollback"),
                             "different content differs");
                   }});

  tests.push_back({"context_levenshtein_distance", [] {
                     require(c::levenshtein_distance("kitten", "sitting") == 3, "classic pair");
                     require(c::levenshtein_distance("", "abc") == 3, "insertions only");
                     require(c::levenshtein_distance("same", "same") == 0, "identical");
                   }});

  tests.push_back({"context_title_similarity", [] {
                     require(c::title_similarity("Use WAL", "  use   wal ") == 1.0,
                             "equal after normalization");
                     require(c::title_similarity("", "") == 1.0, "two empty titles");
                     require(near(c::title_similarity("kitten", "sitting"), 1.0 - 3.0 / 7.0),
                             "distance over longer length");
                     require(c::title_similarity("abc", "xyz") == 0.0, "nothing in common");
                   }});

  tests.push_back({"context_find_duplicates_prefers_exact_hash", [] {
                     auto db = synmem::testing::open_memory_store();
                     synmem::storage::KnowledgeStore store(*db);
                     auto exact = knowledge("k1", "Database journal mode", "Use WAL for readers",
                                            "2024-05-01T00:00:00.000Z");
                     require(store.insert(exact).ok(), "insert k1");
                     require(store.insert(knowledge("k2", "Database journal mode!", "other text",
                                                    "2024-05-02T00:00:00.000Z"))
                                 .ok(),
                             "insert k2");

                     const auto found = c::find_duplicates(store, PROJECT, "Database journal mode",
                                                           "  use wal FOR readers ");
                     require(found.ok(), found.error());
                     require(found.value().size() == 1, "exact match is returned alone");
                     require(found.value()[0].existing.knowledge_id == "k1", "k1 matched");
                     require(found.value()[0].match == c::MatchType::ExactHash, "exact kind");
                     require(found.value()[0].similarity == 1.0, "exact similarity");
                     require(c::to_string(found.value()[0].match) == "exact_hash", "match name");
                   }});

  tests.push_back({"context_abbreviated_title_stays_below_threshold", [] {
                     const double similarity =
                         c::title_similarity("Use JWT for authentication", "Use JWT for auth");
                     require(near(similarity, 1.0 - 10.0 / 26.0),
                             "ten edits over 26 characters: " + std::to_string(similarity));
                     require(similarity < c::TITLE_SIMILARITY_THRESHOLD, "below the threshold");

                     auto db = synmem::testing::open_memory_store();
                     synmem::storage::KnowledgeStore store(*db);
                     require(store.insert(knowledge("k1", "Use JWT for authentication",
                                                    "Tokens signed with RS256",
                                                    "2024-05-01T00:00:00.000Z"))
                                 .ok(),
                             "insert k1");
                     const auto found = c::find_duplicates(store, PROJECT, "Use JWT for auth",
                                                           "Short-lived tokens");
                     require(found.ok(), found.error());
                     require(found.value().empty(), "abbreviated title is not a duplicate");
                   }});

  tests.push_back({"context_find_duplicates_by_title_best_first", [] {
                     auto db = synmem::testing::open_memory_store();
                     synmem::storage::KnowledgeStore store(*db);
                     require(store.insert(knowledge("k1", "Retry failed uploads twice", "a",
                                                    "2024-05-01T00:00:00.000Z"))
                                 .ok(),
                             "insert k1");
                     require(store.insert(knowledge("k2", "Retry failed uploads", "b",
                                                    "2024-05-02T00:00:00.000Z"))
                                 .ok(),
                             "insert k2");
                     require(store.insert(knowledge("k3", "Unrelated title", "c",
                                                    "2024-05-03T00:00:00.000Z"))
                                 .ok(),
                             "insert k3");

                     const auto found =
                         c::find_duplicates(store, PROJECT, "retry failed uploads.", "new content");
                     require(found.ok(), found.error());
                     require(found.value().size() == 1, "only the close title qualifies");
                     require(found.value()[0].existing.knowledge_id == "k2", "k2 matched");
                     require(found.value()[0].match == c::MatchType::TitleMatch, "title kind");
                     require(found.value()[0].similarity >= c::TITLE_SIMILARITY_THRESHOLD,
                             "above threshold");

                     require(c::mark_superseded(store, "k2", "k1").ok(), "supersede k2");
                     const auto after =
                         c::find_duplicates(store, PROJECT, "retry failed uploads.", "new content");
                     require(after.ok() && after.value().empty(),
                             "superseded items are not candidates");
                   }});

  tests.push_back({"context_branch_weight_buckets", [] {
                     require(c::branch_weight(std::string("feat/x"), "feat/x") == 1.0, "same branch");
                     require(c::branch_weight(std::string("main"), "feat/x") == 0.7, "main is trunk");
                     require(c::branch_weight(std::string("master"), "feat/x") == 0.7, "master");
                     require(c::branch_weight(std::string("feat/y"), "feat/x") == 0.3, "other");
                     require(c::branch_weight(std::nullopt, "feat/x") == 0.5, "missing branch");
                     require(c::branch_weight(std::string(""), "feat/x") == 0.5, "empty branch");
                     require(c::branch_weight(std::string("main"), "main") == 1.0,
                             "same branch beats trunk");
                   }});

  tests.push_back({"context_recency_weight_buckets", [] {
                     const auto now = at("2024-05-31T00:00:00.000Z");
                     require(c::recency_weight("2024-05-30T12:00:00.000Z", now) == 1.0, "hours old");
                     require(c::recency_weight("2024-05-30T00:00:00.000Z", now) == 0.8,
                             "exactly one day");
                     require(c::recency_weight("2024-05-20T00:00:00.000Z", now) == 0.5, "eleven days");
                     require(c::recency_weight("2024-04-01T00:00:00.000Z", now) == 0.3, "two months");
                     require(c::recency_weight("not a date", now) == 0.3, "unparseable");
                   }});

  tests.push_back({"context_usage_weight_grows_logarithmically", [] {
                     require(c::usage_weight(0) == 1.0, "unused");
                     require(near(c::usage_weight(9), 1.0 + std::log(10.0) * 0.1), "nine uses");
                     require(c::usage_weight(100) > c::usage_weight(10), "monotonic");
                   }});

  tests.push_back({"context_knowledge_relevance_formula", [] {
                     const auto now = at("2024-05-31T00:00:00.000Z");
                     auto item = knowledge("k1", "t", "c", "2024-05-30T12:00:00.000Z");
                     item.branch = "feat/x";
                     const auto scored = c::score_knowledge(item, "feat/x", now);
                     require(near(scored.relevance, 1.0), "fresh, same branch, unused");

                     item.branch = std::nullopt;
                     item.created_at = "2024-04-01T00:00:00.000Z";
                     item.usage_count = 4;
                     const auto older = c::score_knowledge(item, "feat/x", now);
                     require(near(older.branch_weight, 0.5) && near(older.recency_weight, 0.3),
                             "component weights");
                     require(near(older.relevance, 0.2 + 0.12 + std::log(5.0) * 0.1 * 0.2 + 0.2),
                             "weighted sum");
                   }});

  tests.push_back({"context_rank_knowledge_is_stable", [] {
                     const auto now = at("2024-05-31T00:00:00.000Z");
                     auto a = knowledge("a", "a", "a", "2024-05-01T00:00:00.000Z");
                     auto b = knowledge("b", "b", "b", "2024-05-01T00:00:00.000Z");
                     auto fresh = knowledge("fresh", "f", "f", "2024-05-30T23:00:00.000Z");
                     const auto ranked = c::rank_knowledge({a, b, fresh}, "main", now);
                     require(ranked.size() == 3, "all kept");
                     require(ranked[0].knowledge.knowledge_id == "fresh", "freshest first");
                     require(ranked[1].knowledge.knowledge_id == "a" &&
                                 ranked[2].knowledge.knowledge_id == "b",
                             "ties keep input order");
                   }});

  tests.push_back({"context_rank_sessions_prefers_current_branch", [] {
                     const auto now = at("2024-05-31T00:00:00.000Z");
                     m::Session trunk;
                     trunk.session_id = "trunk";
                     trunk.branch = "main";
                     trunk.started_at = "2024-05-30T20:00:00.000Z";
                     m::Session mine = trunk;
                     mine.session_id = "mine";
                     mine.branch = "feat/x";
                     mine.started_at = "2024-05-27T00:00:00.000Z";
                     m::Session stranger = trunk;
                     stranger.session_id = "stranger";
                     stranger.branch = "feat/y";

                     const auto ranked = c::rank_sessions({trunk, stranger, mine}, "feat/x", now);
                     require(ranked.size() == 3, "all kept");
                     require(ranked[0].session.session_id == "mine" && near(ranked[0].score, 0.9),
                             "current branch, days old");
                     require(ranked[1].session.session_id == "trunk" && near(ranked[1].score, 0.85),
                             "fresh trunk session");
                     require(ranked[2].session.session_id == "stranger" && near(ranked[2].score, 0.65),
                             "other branch last");
                   }});
}
