#include "test_framework.hpp"

#include "synmem/observability/observer.hpp"
#include "synmem/storage/database.hpp"
#include "synmem/storage/schema.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <sqlite3.h>

namespace {

std::int64_t count_rows(synmem::storage::Database &db, const char *sql) {
  synmem::storage::Statement stmt(db, sql);
  synmem::tests::require(stmt.ok(), stmt.error());
  synmem::tests::require(stmt.step() == SQLITE_ROW, "count query returned no row");
  return stmt.column_int64(0);
}

bool table_exists(synmem::storage::Database &db, const std::string &name) {
  synmem::storage::Statement stmt(db,
                                  "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND "
                                  "name = ?1");
  synmem::tests::require(stmt.ok(), stmt.error());
  stmt.bind(1, name);
  synmem::tests::require(stmt.step() == SQLITE_ROW, "sqlite_master query failed");
  return stmt.column_int64(0) == 1;
}

} // namespace

void register_schema_tests(std::vector<synmem::tests::TestCase> &tests) {
  using synmem::tests::require;
  namespace s = synmem::storage;
  namespace c = synmem::common;

  tests.push_back({"schema_fresh_store_applies_every_migration", [] {
                     synmem::testing::ObserverScope scope;
                     auto opened = s::Database::open(":memory:");
                     require(opened.ok(), opened.error());
                     auto &db = *opened.value();

                     const auto applied = s::ensure_current(db);
                     require(applied.ok(), applied.error());
                     require(applied.value() == std::vector<int>({1, 2, 3}),
                             "versions 1..3 should apply in order");
                     const auto version = s::schema_version(db);
                     require(version.ok() && version.value() == s::CURRENT_SCHEMA_VERSION,
                             "schema should be current");
                     require(scope.observer().count<synmem::observability::MigrationAppliedEvent>() ==
                                 3,
                             "one event per migration");
                     for (const auto *table :
                          {"sessions", "session_events", "promoted_knowledge", "agents",
                           "file_importance", "knowledge_usage", "value_metrics"}) {
                       require(table_exists(db, table), std::string("missing table ") + table);
                     }
                   }});

  tests.push_back({"schema_reopen_is_idempotent", [] {
                     synmem::testing::TempDir dir;
                     const auto path = dir.path() / "nested" / "memory.db";
                     {
                       auto first = s::open_store(path);
                       require(first.ok(), first.error());
                     }
                     auto reopened = s::Database::open(path);
                     require(reopened.ok(), reopened.error());
                     const auto applied = s::ensure_current(*reopened.value());
                     require(applied.ok(), applied.error());
                     require(applied.value().empty(), "nothing should apply twice");
                     require(count_rows(*reopened.value(), "SELECT COUNT(*) FROM schema_version") ==
                                 3,
                             "one version row per migration");
                   }});

  tests.push_back({"schema_gap_fails_before_any_step", [] {
                     auto opened = s::Database::open(":memory:");
                     require(opened.ok(), opened.error());
                     auto &db = *opened.value();
                     const s::MigrationTable table = {
                         {1, "CREATE TABLE first_table (id INTEGER);"},
                         {3, "CREATE TABLE third_table (id INTEGER);"},
                     };
                     const auto applied = s::apply_migrations(db, table, 3);
                     require(!applied.ok(), "gap should fail");
                     require(applied.code() == c::ErrorCode::Integrity, "integrity error expected");
                     require(applied.error() == "Missing migration for version 2",
                             "unexpected message: " + applied.error());
                     require(!table_exists(db, "first_table"), "no step should have run");
                     require(s::schema_version(db).value() == 0, "version unchanged");
                   }});

  tests.push_back({"schema_failed_step_rolls_back_only_that_step", [] {
                     auto opened = s::Database::open(":memory:");
                     require(opened.ok(), opened.error());
                     auto &db = *opened.value();
                     const s::MigrationTable table = {
                         {1, "CREATE TABLE good (id INTEGER);"},
                         {2, "CREATE TABLE half (id INTEGER); INSERT INTO nowhere VALUES (1);"},
                     };
                     const auto applied = s::apply_migrations(db, table, 2);
                     require(!applied.ok(), "broken step should fail");
                     require(table_exists(db, "good"), "step 1 should stay applied");
                     require(!table_exists(db, "half"), "step 2 should roll back");
                     require(s::schema_version(db).value() == 1, "version should stop at 1");
                   }});

  tests.push_back({"schema_transaction_rolls_back_when_not_committed", [] {
                     auto db = synmem::testing::open_memory_store();
                     {
                       s::Transaction tx(*db);
                       require(tx.status().ok(), tx.status().error());
                       require(db->exec("INSERT INTO agents (agent_type, display_name, "
                                        "first_seen_at, last_seen_at) VALUES ('cursor', 'Cursor', "
                                        "'t', 't')")
                                   .ok(),
                               "insert inside transaction");
                     }
                     require(count_rows(*db, "SELECT COUNT(*) FROM agents") == 0,
                             "uncommitted insert should roll back");

                     {
                       s::Transaction outer(*db);
                       {
                         s::Transaction inner(*db);
                         require(db->exec("INSERT INTO agents (agent_type, display_name, "
                                          "first_seen_at, last_seen_at) VALUES ('aider', "
                                          "'Aider', 't', 't')")
                                     .ok(),
                                 "insert inside nested transaction");
                         require(inner.commit().ok(), "inner commit joins outer");
                       }
                       require(db->in_transaction(), "outer should still be open");
                       require(outer.commit().ok(), "outer commit");
                     }
                     require(count_rows(*db, "SELECT COUNT(*) FROM agents") == 1,
                             "committed insert should persist");
                   }});
}
