#include "promptvault/store/embedding_migrator.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"

namespace promptvault::store {

namespace {

constexpr int kDefaultBatchSize = 10;

} // anonymous namespace

void to_json(json& j, const MigrationReport& r) {
    j = json{
        {"target_model", r.target_model},
        {"target_dimensions", r.target_dimensions},
        {"scanned", r.scanned},
        {"cleared", r.cleared},
        {"batches", r.batches},
        {"resumed", r.resumed},
        {"completed", r.completed},
        {"dry_run", r.dry_run},
    };
}

void to_json(json& j, const ModelUsage& m) {
    j = json{{"model", m.model}, {"dimensions", m.dimensions}, {"count", m.count}};
}

void to_json(json& j, const EmbeddingStats& s) {
    j = json{
        {"total", s.total},
        {"with_embeddings", s.with_embeddings},
        {"coverage_percent", s.coverage_percent},
        {"models", s.models},
    };
}

EmbeddingMigrator::EmbeddingMigrator(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto EmbeddingMigrator::migrate(const MigrationOptions& options)
    -> awaitable<Result<MigrationReport>> {
    if (options.target_model.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Migration target model must not be empty"));
    }
    if (options.target_dimensions <= 0 ||
        static_cast<size_t>(options.target_dimensions) > kMaxEmbeddingDimensions) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
            "Migration target dimensions out of range",
            std::to_string(options.target_dimensions)));
    }

    if (options.dry_run) {
        co_return dry_run(options);
    }

    MigrationReport report;
    report.target_model = options.target_model;
    report.target_dimensions = options.target_dimensions;

    auto cursor = begin_run(options, report);
    if (!cursor) co_return make_fail(cursor.error());

    int batch_size = options.batch_size > 0 ? options.batch_size : kDefaultBatchSize;
    while (!report.completed) {
        if (options.max_batches > 0 &&
            report.batches >= static_cast<size_t>(options.max_batches)) {
            LOG_INFO("Migration to {} ({}D) paused after {} batch(es) at cursor '{}'",
                     options.target_model, options.target_dimensions,
                     report.batches, *cursor);
            break;
        }
        auto done = run_batch(options, batch_size, *cursor, report);
        if (!done) co_return make_fail(done.error());
        report.completed = *done;
    }

    if (report.completed) {
        LOG_INFO("Migration to {} ({}D) complete: scanned {}, cleared {}",
                 options.target_model, options.target_dimensions,
                 report.scanned, report.cleared);
    }
    co_return report;
}

auto EmbeddingMigrator::dry_run(const MigrationOptions& options) -> Result<MigrationReport> {
    MigrationReport report;
    report.target_model = options.target_model;
    report.target_dimensions = options.target_dimensions;
    report.dry_run = true;

    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT COUNT(*), "
            "COALESCE(SUM(embedding IS NOT NULL AND "
            "(embedding_model != ? OR embedding_dimensions != ?)), 0) "
            "FROM prompts");
        stmt.bind(1, options.target_model);
        stmt.bind(2, options.target_dimensions);
        stmt.executeStep();
        report.scanned = static_cast<size_t>(stmt.getColumn(0).getInt64());
        report.cleared = static_cast<size_t>(stmt.getColumn(1).getInt64());
        LOG_INFO("DRY RUN: migration to {} ({}D) would clear {} of {} record(s)",
                 options.target_model, options.target_dimensions,
                 report.cleared, report.scanned);
        return report;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Migration dry run failed: {}", e.what());
        return std::unexpected(to_error(e, "Migration dry run failed"));
    }
}

auto EmbeddingMigrator::begin_run(const MigrationOptions& options, MigrationReport& report)
    -> Result<std::string> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);

        SQLite::Statement find(conn,
            "SELECT cursor FROM embedding_migrations "
            "WHERE target_model = ? AND target_dimensions = ? AND status = 'running'");
        find.bind(1, options.target_model);
        find.bind(2, options.target_dimensions);
        if (find.executeStep()) {
            auto cursor = find.getColumn(0).getString();
            report.resumed = true;
            LOG_INFO("Resuming migration to {} ({}D) after '{}'",
                     options.target_model, options.target_dimensions, cursor);
            return cursor;
        }
        find.reset();

        // A run toward any other target is superseded.
        conn.exec("DELETE FROM embedding_migrations WHERE status = 'running'");

        auto now = utils::timestamp_ms();
        SQLite::Statement start(conn,
            "INSERT OR REPLACE INTO embedding_migrations "
            "(target_model, target_dimensions, cursor, status, scanned, cleared, "
            "started_at, updated_at) VALUES (?, ?, '', 'running', 0, 0, ?, ?)");
        start.bind(1, options.target_model);
        start.bind(2, options.target_dimensions);
        start.bind(3, now);
        start.bind(4, now);
        start.exec();

        txn.commit();
        LOG_INFO("Starting migration to {} ({}D)",
                 options.target_model, options.target_dimensions);
        return std::string{};
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to start migration: {}", e.what());
        return std::unexpected(to_error(e, "Failed to start migration"));
    }
}

auto EmbeddingMigrator::run_batch(const MigrationOptions& options, int batch_size,
                                  std::string& cursor, MigrationReport& report)
    -> Result<bool> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);

        std::vector<std::string> stale;
        std::string last = cursor;
        int rows = 0;
        {
            SQLite::Statement scan(conn,
                "SELECT id, embedding_model, embedding_dimensions FROM prompts "
                "WHERE id > ? ORDER BY id ASC LIMIT ?");
            scan.bind(1, cursor);
            scan.bind(2, batch_size);
            while (scan.executeStep()) {
                ++rows;
                last = scan.getColumn(0).getString();
                if (scan.getColumn(1).isNull()) continue;
                if (scan.getColumn(1).getString() != options.target_model ||
                    scan.getColumn(2).getInt() != options.target_dimensions) {
                    stale.push_back(last);
                }
            }
        }

        auto now = utils::timestamp_ms();
        if (!stale.empty()) {
            SQLite::Statement clear(conn,
                "UPDATE prompts SET embedding = NULL, embedding_model = NULL, "
                "embedding_dimensions = NULL, updated_at = ? WHERE id = ?");
            for (const auto& id : stale) {
                clear.bind(1, now);
                clear.bind(2, id);
                clear.exec();
                clear.reset();
            }
        }

        bool done = rows < batch_size;
        SQLite::Statement progress(conn,
            "UPDATE embedding_migrations SET cursor = ?, scanned = scanned + ?, "
            "cleared = cleared + ?, status = ?, updated_at = ? "
            "WHERE target_model = ? AND target_dimensions = ?");
        progress.bind(1, last);
        progress.bind(2, rows);
        progress.bind(3, static_cast<int64_t>(stale.size()));
        progress.bind(4, done ? "completed" : "running");
        progress.bind(5, now);
        progress.bind(6, options.target_model);
        progress.bind(7, options.target_dimensions);
        progress.exec();

        txn.commit();

        cursor = last;
        report.scanned += static_cast<size_t>(rows);
        report.cleared += stale.size();
        if (rows > 0) ++report.batches;
        LOG_DEBUG("Migration batch: scanned {}, cleared {}, cursor '{}'",
                  rows, stale.size(), cursor);
        return done;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Migration batch after '{}' failed: {}", cursor, e.what());
        return std::unexpected(to_error(e, "Migration batch failed"));
    }
}

auto EmbeddingMigrator::embedding_stats() -> awaitable<Result<EmbeddingStats>> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        EmbeddingStats stats;
        {
            SQLite::Statement totals(conn,
                "SELECT COUNT(*), COALESCE(SUM(embedding IS NOT NULL), 0) FROM prompts");
            totals.executeStep();
            stats.total = totals.getColumn(0).getInt64();
            stats.with_embeddings = totals.getColumn(1).getInt64();
        }
        if (stats.total > 0) {
            stats.coverage_percent =
                100.0 * static_cast<double>(stats.with_embeddings) / static_cast<double>(stats.total);
        }

        SQLite::Statement models(conn,
            "SELECT embedding_model, embedding_dimensions, COUNT(*) FROM prompts "
            "WHERE embedding IS NOT NULL "
            "GROUP BY embedding_model, embedding_dimensions "
            "ORDER BY COUNT(*) DESC, embedding_model ASC");
        while (models.executeStep()) {
            stats.models.push_back(ModelUsage{
                models.getColumn(0).getString(),
                models.getColumn(1).getInt(),
                models.getColumn(2).getInt64(),
            });
        }
        co_return stats;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to compute embedding stats: {}", e.what());
        co_return make_fail(to_error(e, "Failed to compute embedding stats"));
    }
}

auto EmbeddingMigrator::needs_migration(std::string_view model, int dimensions)
    -> awaitable<Result<bool>> {
    auto guard = db_->lock();
    try {
        SQLite::Statement stmt(db_->connection(),
            "SELECT EXISTS (SELECT 1 FROM prompts WHERE embedding IS NOT NULL "
            "AND (embedding_model != ? OR embedding_dimensions != ?))");
        stmt.bind(1, std::string(model));
        stmt.bind(2, dimensions);
        stmt.executeStep();
        co_return stmt.getColumn(0).getInt() != 0;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to check migration status: {}", e.what());
        co_return make_fail(to_error(e, "Failed to check migration status"));
    }
}

} // namespace promptvault::store
