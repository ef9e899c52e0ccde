#include "promptvault/store/schema.hpp"
#include "promptvault/core/logger.hpp"

#include <array>
#include <string>

namespace promptvault::store {

namespace {

constexpr std::string_view kPromptsV1 = R"SQL(
    CREATE TABLE IF NOT EXISTS prompts (
        id                   TEXT PRIMARY KEY,
        content              TEXT NOT NULL,
        content_hash         TEXT NOT NULL,
        phase                TEXT NOT NULL,
        provider             TEXT NOT NULL,
        model                TEXT NOT NULL,
        temperature          REAL NOT NULL DEFAULT 0.7,
        max_tokens           INTEGER NOT NULL DEFAULT 2000,
        actual_tokens        INTEGER NOT NULL DEFAULT 0,
        tags                 TEXT NOT NULL DEFAULT '[]',
        embedding            BLOB,
        embedding_model      TEXT,
        embedding_dimensions INTEGER,
        relevance_score      REAL NOT NULL DEFAULT 1.0
                             CHECK (relevance_score >= 0.0 AND relevance_score <= 1.0),
        usage_count          INTEGER NOT NULL DEFAULT 0 CHECK (usage_count >= 0),
        last_used_at         INTEGER,
        created_at           INTEGER NOT NULL,
        updated_at           INTEGER NOT NULL,
        CHECK ((embedding IS NULL AND embedding_model IS NULL
                    AND embedding_dimensions IS NULL)
            OR (embedding IS NOT NULL AND embedding_model IS NOT NULL
                    AND embedding_dimensions = length(embedding) / 4))
    );

    CREATE INDEX IF NOT EXISTS idx_prompts_phase ON prompts(phase);
    CREATE INDEX IF NOT EXISTS idx_prompts_provider ON prompts(provider);
    CREATE INDEX IF NOT EXISTS idx_prompts_model ON prompts(model);
    CREATE INDEX IF NOT EXISTS idx_prompts_created_at ON prompts(created_at);
    CREATE INDEX IF NOT EXISTS idx_prompts_content_hash ON prompts(content_hash);
    CREATE INDEX IF NOT EXISTS idx_prompts_embedding_model
        ON prompts(embedding_model, embedding_dimensions);
    CREATE INDEX IF NOT EXISTS idx_prompts_relevance
        ON prompts(relevance_score, created_at);

    CREATE TABLE IF NOT EXISTS database_config (
        key        TEXT PRIMARY KEY,
        value      TEXT NOT NULL,
        updated_at INTEGER NOT NULL
    );
)SQL";

constexpr std::string_view kRelationshipsV2 = R"SQL(
    CREATE TABLE IF NOT EXISTS prompt_relationships (
        id                INTEGER PRIMARY KEY AUTOINCREMENT,
        source_id         TEXT NOT NULL REFERENCES prompts(id) ON DELETE CASCADE,
        target_id         TEXT NOT NULL REFERENCES prompts(id) ON DELETE CASCADE,
        relationship_type TEXT NOT NULL CHECK (relationship_type IN
                              ('derived_from', 'similar_to', 'inspired_by', 'merged_with')),
        strength          REAL NOT NULL DEFAULT 0.5
                              CHECK (strength >= 0.0 AND strength <= 1.0),
        context           TEXT NOT NULL DEFAULT '',
        created_at        INTEGER NOT NULL,
        UNIQUE (source_id, target_id, relationship_type)
    );

    CREATE INDEX IF NOT EXISTS idx_relationships_source ON prompt_relationships(source_id);
    CREATE INDEX IF NOT EXISTS idx_relationships_target ON prompt_relationships(target_id);

    CREATE TABLE IF NOT EXISTS embedding_migrations (
        target_model      TEXT NOT NULL,
        target_dimensions INTEGER NOT NULL,
        cursor            TEXT NOT NULL DEFAULT '',
        status            TEXT NOT NULL DEFAULT 'running',
        scanned           INTEGER NOT NULL DEFAULT 0,
        cleared           INTEGER NOT NULL DEFAULT 0,
        started_at        INTEGER NOT NULL,
        updated_at        INTEGER NOT NULL,
        PRIMARY KEY (target_model, target_dimensions)
    );
)SQL";

constexpr std::array<SchemaMigration, 2> kMigrations = {{
    {1, "prompts and database_config", kPromptsV1},
    {2, "relationships and embedding migration bookkeeping", kRelationshipsV2},
}};

static_assert(kMigrations.back().version == kSchemaVersion);

auto read_user_version(SQLite::Database& conn) -> int {
    SQLite::Statement stmt(conn, "PRAGMA user_version");
    stmt.executeStep();
    return stmt.getColumn(0).getInt();
}

} // anonymous namespace

auto schema_migrations() -> std::span<const SchemaMigration> {
    return kMigrations;
}

auto schema_version(Database& db) -> Result<int> {
    auto guard = db.lock();
    try {
        return read_user_version(db.connection());
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read schema version: {}", e.what());
        return std::unexpected(to_error(e, "Failed to read schema version"));
    }
}

auto ensure_schema(Database& db) -> Result<int> {
    auto guard = db.lock();
    auto& conn = db.connection();

    int current = 0;
    try {
        current = read_user_version(conn);
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to read schema version: {}", e.what());
        return std::unexpected(to_error(e, "Failed to read schema version"));
    }

    if (current > kSchemaVersion) {
        LOG_ERROR("Database {} has schema version {}, newer than supported {}",
                  db.path(), current, kSchemaVersion);
        return std::unexpected(make_error(
            ErrorCode::Conflict, "Database schema is newer than this build",
            "found v" + std::to_string(current) +
                ", supported v" + std::to_string(kSchemaVersion)));
    }

    for (const auto& step : kMigrations) {
        if (step.version <= current) continue;
        try {
            SQLite::Transaction txn(conn);
            conn.exec(std::string(step.sql));
            conn.exec("PRAGMA user_version = " + std::to_string(step.version));
            txn.commit();
            current = step.version;
            LOG_INFO("Applied schema v{}: {}", step.version, step.description);
        } catch (const SQLite::Exception& e) {
            LOG_ERROR("Schema step v{} failed: {}", step.version, e.what());
            return std::unexpected(to_error(
                e, "Failed to apply schema v" + std::to_string(step.version)));
        }
    }

    return current;
}

} // namespace promptvault::store
