#include "promptvault/store/statistics.hpp"
#include "promptvault/core/logger.hpp"

#include "candidate_rows.hpp"

namespace promptvault::store {

namespace {

auto group_counts(SQLite::Database& conn, const std::string& column)
    -> std::map<std::string, int64_t> {
    SQLite::Statement stmt(conn,
        "SELECT " + column + ", COUNT(*) FROM prompts GROUP BY " + column);
    std::map<std::string, int64_t> counts;
    while (stmt.executeStep()) {
        counts.emplace(stmt.getColumn(0).getString(), stmt.getColumn(1).getInt64());
    }
    return counts;
}

} // anonymous namespace

void to_json(json& j, const UsageStats& u) {
    j = json{
        {"total_usage_count", u.total_usage_count},
        {"average_usage", u.average_usage},
        {"prompts_with_usage", u.prompts_with_usage},
    };
}

void to_json(json& j, const StoreStats& s) {
    j = json{
        {"total_prompts", s.total_prompts},
        {"prompts_with_embeddings", s.prompts_with_embeddings},
        {"embedding_coverage_percent", s.embedding_coverage_percent},
        {"average_relevance", s.average_relevance},
        {"by_phase", s.by_phase},
        {"by_provider", s.by_provider},
        {"configuration", s.configuration},
    };
    if (s.relationships) j["relationships"] = *s.relationships;
    if (s.usage) j["usage"] = *s.usage;
}

Statistics::Statistics(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

auto Statistics::store_stats(const StatsOptions& options) -> awaitable<Result<StoreStats>> {
    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        // Deferred read transaction: every query sees the same snapshot.
        SQLite::Transaction txn(conn);
        StoreStats stats;

        {
            SQLite::Statement totals(conn,
                "SELECT COUNT(*), COALESCE(SUM(embedding IS NOT NULL), 0), "
                "COALESCE(AVG(relevance_score), 0.0) FROM prompts");
            totals.executeStep();
            stats.total_prompts = totals.getColumn(0).getInt64();
            stats.prompts_with_embeddings = totals.getColumn(1).getInt64();
            stats.average_relevance = totals.getColumn(2).getDouble();
        }
        if (stats.total_prompts > 0) {
            stats.embedding_coverage_percent = 100.0 *
                static_cast<double>(stats.prompts_with_embeddings) /
                static_cast<double>(stats.total_prompts);
        }

        stats.by_phase = group_counts(conn, "phase");
        stats.by_provider = group_counts(conn, "provider");

        {
            SQLite::Statement config(conn,
                "SELECT key, value FROM database_config ORDER BY key");
            while (config.executeStep()) {
                stats.configuration.emplace(config.getColumn(0).getString(),
                                            config.getColumn(1).getString());
            }
        }

        if (options.include_relationships) {
            stats.relationships = detail::count_edges_by_type(conn);
        }

        if (options.include_usage) {
            SQLite::Statement usage(conn,
                "SELECT COALESCE(SUM(usage_count), 0), COALESCE(AVG(usage_count), 0.0), "
                "COALESCE(SUM(usage_count > 0), 0) FROM prompts");
            usage.executeStep();
            stats.usage = UsageStats{
                usage.getColumn(0).getInt64(),
                usage.getColumn(1).getDouble(),
                usage.getColumn(2).getInt64(),
            };
        }

        txn.commit();
        co_return stats;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Failed to compute store statistics: {}", e.what());
        co_return make_fail(to_error(e, "Failed to compute store statistics"));
    }
}

} // namespace promptvault::store
