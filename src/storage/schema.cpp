#include "synmem/storage/schema.hpp"

#include "synmem/observability/global.hpp"

namespace synmem::storage {

namespace {

constexpr const char *MIGRATION_V1 = R"(
CREATE TABLE IF NOT EXISTS sessions (
  session_id TEXT PRIMARY KEY,
  project_path TEXT NOT NULL,
  branch TEXT NOT NULL DEFAULT 'main',
  started_at TEXT NOT NULL,
  ended_at TEXT,
  status TEXT NOT NULL DEFAULT 'active',
  summary TEXT,
  git_commit_start TEXT,
  git_commit_end TEXT,
  created_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE TABLE IF NOT EXISTS session_events (
  event_id TEXT PRIMARY KEY,
  session_id TEXT NOT NULL REFERENCES sessions(session_id),
  timestamp TEXT NOT NULL,
  event_type TEXT NOT NULL,
  category TEXT NOT NULL DEFAULT 'other',
  detail_json TEXT NOT NULL,
  created_at TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_events_session ON session_events(session_id);
CREATE INDEX IF NOT EXISTS idx_events_type ON session_events(event_type);
CREATE INDEX IF NOT EXISTS idx_sessions_project ON sessions(project_path);
CREATE INDEX IF NOT EXISTS idx_sessions_branch ON sessions(project_path, branch);
CREATE INDEX IF NOT EXISTS idx_sessions_status ON sessions(status);
)";

// Promoted knowledge plus the (unused) remote sync configuration.
constexpr const char *MIGRATION_V2 = R"(
CREATE TABLE IF NOT EXISTS promoted_knowledge (
  knowledge_id TEXT PRIMARY KEY,
  project_path TEXT NOT NULL,
  session_id TEXT REFERENCES sessions(session_id),
  source_event_id TEXT REFERENCES session_events(event_id),
  title TEXT NOT NULL,
  content TEXT NOT NULL,
  knowledge_type TEXT NOT NULL DEFAULT 'decision',
  tags TEXT NOT NULL DEFAULT '[]',
  created_at TEXT NOT NULL DEFAULT (datetime('now')),
  synced_at TEXT,
  synapse_knowledge_id TEXT
);
CREATE INDEX IF NOT EXISTS idx_knowledge_project ON promoted_knowledge(project_path);
CREATE INDEX IF NOT EXISTS idx_knowledge_type ON promoted_knowledge(knowledge_type);
CREATE INDEX IF NOT EXISTS idx_knowledge_synced ON promoted_knowledge(synced_at);
CREATE TABLE IF NOT EXISTS synapse_sync_config (
  project_path TEXT PRIMARY KEY,
  synapse_endpoint TEXT,
  synapse_project_id TEXT,
  tenant_id TEXT,
  api_key_env_var TEXT NOT NULL DEFAULT 'SYNAPSE_API_KEY',
  auto_sync_promoted BOOLEAN NOT NULL DEFAULT 0,
  last_synced_at TEXT,
  created_at TEXT NOT NULL DEFAULT (datetime('now'))
);
)";

// Agent identity, file importance, usage tracking, value metrics, dedup columns.
constexpr const char *MIGRATION_V3 = R"(
ALTER TABLE sessions ADD COLUMN agent_type TEXT NOT NULL DEFAULT 'unknown';
ALTER TABLE sessions ADD COLUMN agent_version TEXT;
CREATE TABLE IF NOT EXISTS agents (
  agent_type TEXT PRIMARY KEY,
  display_name TEXT NOT NULL,
  first_seen_at TEXT NOT NULL DEFAULT (datetime('now')),
  last_seen_at TEXT NOT NULL DEFAULT (datetime('now')),
  total_sessions INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS file_importance (
  project_path TEXT NOT NULL,
  file_path TEXT NOT NULL,
  read_count INTEGER NOT NULL DEFAULT 0,
  edit_count INTEGER NOT NULL DEFAULT 0,
  last_accessed_at TEXT NOT NULL,
  importance_score REAL NOT NULL DEFAULT 0.0,
  PRIMARY KEY (project_path, file_path)
);
CREATE INDEX IF NOT EXISTS idx_file_importance_project ON file_importance(project_path);
CREATE INDEX IF NOT EXISTS idx_file_importance_score
  ON file_importance(project_path, importance_score DESC);
CREATE TABLE IF NOT EXISTS knowledge_usage (
  usage_id TEXT PRIMARY KEY,
  knowledge_id TEXT NOT NULL,
  session_id TEXT NOT NULL,
  usage_type TEXT NOT NULL,
  timestamp TEXT NOT NULL DEFAULT (datetime('now'))
);
CREATE INDEX IF NOT EXISTS idx_knowledge_usage_knowledge ON knowledge_usage(knowledge_id);
CREATE INDEX IF NOT EXISTS idx_knowledge_usage_session ON knowledge_usage(session_id);
CREATE TABLE IF NOT EXISTS value_metrics (
  project_path TEXT PRIMARY KEY,
  total_sessions INTEGER NOT NULL DEFAULT 0,
  context_reuse_count INTEGER NOT NULL DEFAULT 0,
  knowledge_surfaced_count INTEGER NOT NULL DEFAULT 0,
  decisions_recalled_count INTEGER NOT NULL DEFAULT 0,
  patterns_applied_count INTEGER NOT NULL DEFAULT 0,
  errors_prevented_count INTEGER NOT NULL DEFAULT 0,
  estimated_time_saved_secs INTEGER NOT NULL DEFAULT 0,
  updated_at TEXT NOT NULL DEFAULT (datetime('now'))
);
ALTER TABLE promoted_knowledge ADD COLUMN branch TEXT;
ALTER TABLE promoted_knowledge ADD COLUMN content_hash TEXT;
ALTER TABLE promoted_knowledge ADD COLUMN usage_count INTEGER NOT NULL DEFAULT 0;
ALTER TABLE promoted_knowledge ADD COLUMN superseded_by TEXT;
CREATE INDEX IF NOT EXISTS idx_knowledge_hash ON promoted_knowledge(content_hash);
CREATE INDEX IF NOT EXISTS idx_knowledge_branch ON promoted_knowledge(project_path, branch);
)";

common::Status ensure_version_table(Database &db) {
  return db.exec(R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL DEFAULT (datetime('now'))
);
)");
}

common::Status apply_step(Database &db, const int version, const std::string &sql) {
  Transaction tx(db);
  if (!tx.status().ok()) {
    return tx.status();
  }

  auto status = db.exec(sql);
  if (!status.ok()) {
    return common::Status::error("migration " + std::to_string(version) +
                                 " failed: " + status.error());
  }

  Statement stmt(db, "INSERT INTO schema_version (version) VALUES (?1)");
  if (!stmt.ok()) {
    return common::Status::error(stmt.error());
  }
  stmt.bind(1, static_cast<std::int64_t>(version));
  status = stmt.run();
  if (!status.ok()) {
    return status;
  }
  return tx.commit();
}

} // namespace

const MigrationTable &builtin_migrations() {
  static const MigrationTable table{
      {1, MIGRATION_V1},
      {2, MIGRATION_V2},
      {3, MIGRATION_V3},
  };
  return table;
}

common::Result<int> schema_version(Database &db) {
  std::lock_guard<std::recursive_mutex> lock(db.mutex());
  auto status = ensure_version_table(db);
  if (!status.ok()) {
    return common::Result<int>::failure(status);
  }

  Statement stmt(db, "SELECT COALESCE(MAX(version), 0) FROM schema_version");
  if (!stmt.ok()) {
    return common::Result<int>::failure(stmt.error());
  }
  if (stmt.step() != SQLITE_ROW) {
    return common::Result<int>::failure(stmt.error());
  }
  return common::Result<int>::success(static_cast<int>(stmt.column_int64(0)));
}

common::Result<std::vector<int>> apply_migrations(Database &db, const MigrationTable &table,
                                                  const int target) {
  std::lock_guard<std::recursive_mutex> lock(db.mutex());
  const auto current = schema_version(db);
  if (!current.ok()) {
    return common::Result<std::vector<int>>::failure(current.status());
  }

  for (int version = current.value() + 1; version <= target; ++version) {
    if (table.find(version) == table.end()) {
      return common::Result<std::vector<int>>::failure(
          "Missing migration for version " + std::to_string(version),
          common::ErrorCode::Integrity);
    }
  }

  std::vector<int> applied;
  for (int version = current.value() + 1; version <= target; ++version) {
    const auto status = apply_step(db, version, table.at(version));
    if (!status.ok()) {
      observability::record_error("schema", status.error());
      return common::Result<std::vector<int>>::failure(status);
    }
    applied.push_back(version);
    observability::record_migration_applied(version);
  }
  return common::Result<std::vector<int>>::success(std::move(applied));
}

common::Result<std::vector<int>> ensure_current(Database &db) {
  return apply_migrations(db, builtin_migrations(), CURRENT_SCHEMA_VERSION);
}

common::Result<std::unique_ptr<Database>> open_store(const std::filesystem::path &path) {
  auto opened = Database::open(path);
  if (!opened.ok()) {
    return opened;
  }

  auto db = std::move(opened.value());
  const auto migrated = ensure_current(*db);
  if (!migrated.ok()) {
    return common::Result<std::unique_ptr<Database>>::failure(migrated.status());
  }
  return common::Result<std::unique_ptr<Database>>::success(std::move(db));
}

} // namespace synmem::storage
