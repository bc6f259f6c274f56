#pragma once

#include "synmem/common/result.hpp"
#include "synmem/storage/database.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace synmem::storage {

inline constexpr int CURRENT_SCHEMA_VERSION = 3;

/// Version number -> self-contained, guarded SQL batch. Never edit a shipped entry.
using MigrationTable = std::map<int, std::string>;

[[nodiscard]] const MigrationTable &builtin_migrations();

/// Highest logged version, 0 for a fresh store.
[[nodiscard]] common::Result<int> schema_version(Database &db);

/// Applies `current+1 .. target` from `table`, one transaction per step.
/// A number missing from `table` fails with ErrorCode::Integrity before anything runs.
/// Returns the versions applied by this call.
[[nodiscard]] common::Result<std::vector<int>>
apply_migrations(Database &db, const MigrationTable &table, int target);

[[nodiscard]] common::Result<std::vector<int>> ensure_current(Database &db);

/// Opens the store and brings it to CURRENT_SCHEMA_VERSION.
[[nodiscard]] common::Result<std::unique_ptr<Database>>
open_store(const std::filesystem::path &path);

} // namespace synmem::storage
