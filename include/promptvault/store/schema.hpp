#pragma once

#include <span>
#include <string_view>

#include "promptvault/core/error.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

/// One forward step of the on-disk layout.
struct SchemaMigration {
    int version;
    std::string_view description;
    std::string_view sql;
};

/// Newest layout this build understands.
inline constexpr int kSchemaVersion = 2;

auto schema_migrations() -> std::span<const SchemaMigration>;

/// Brings the database up to kSchemaVersion. Each pending step runs in its
/// own transaction and bumps PRAGMA user_version; already-applied steps are
/// skipped, so calling this repeatedly is harmless. A file written by a
/// newer build fails with Conflict.
auto ensure_schema(Database& db) -> Result<int>;

auto schema_version(Database& db) -> Result<int>;

} // namespace promptvault::store
