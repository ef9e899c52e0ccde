#include "promptvault/store/lifecycle_manager.hpp"
#include "promptvault/core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "candidate_rows.hpp"

namespace promptvault::store {

namespace {

constexpr double kMsPerDay = 86'400'000.0;
constexpr double kScoreEpsilon = 1e-9;

} // anonymous namespace

auto compute_relevance(double age_days, int64_t usage_count,
                       double half_life_days, double recency_weight) -> double {
    age_days = std::max(age_days, 0.0);
    double uses = static_cast<double>(std::max<int64_t>(usage_count, 0));

    double recency = std::exp2(-age_days / half_life_days);
    double usage = 1.0 - 1.0 / (1.0 + std::log1p(uses));
    double score = recency_weight * recency + (1.0 - recency_weight) * usage;
    return std::clamp(score, 0.0, 1.0);
}

void to_json(json& j, const LifecyclePolicy& p) {
    j = json{
        {"max_prompts", p.max_prompts},
        {"min_relevance_score", p.min_relevance_score},
        {"protect_threshold", p.protect_threshold},
        {"half_life_days", p.half_life_days},
        {"recency_weight", p.recency_weight},
        {"batch_size", p.batch_size},
    };
}

void to_json(json& j, const CleanupReport& r) {
    j = json{
        {"current_count", r.current_count},
        {"max_prompts", r.max_prompts},
        {"min_relevance_score", r.min_relevance_score},
        {"protect_threshold", r.protect_threshold},
        {"below_min_relevance", r.below_min_relevance},
        {"selected", r.selected},
        {"deleted", r.deleted},
        {"protected_blocked", r.protected_blocked},
        {"dry_run", r.dry_run},
    };
}

void to_json(json& j, const MaintenanceReport& r) {
    j = json{
        {"relevance_updated", r.relevance_updated},
        {"dry_run", r.dry_run},
    };
    if (r.cleanup) j["cleanup"] = *r.cleanup;
}

LifecycleManager::LifecycleManager(std::shared_ptr<Database> db,
                                   std::shared_ptr<ConfigStore> config)
    : db_(std::move(db)), config_(std::move(config)) {}

auto LifecycleManager::load_policy() -> awaitable<Result<LifecyclePolicy>> {
    namespace keys = config_keys;
    namespace defaults = config_defaults;

    LifecyclePolicy policy;

    auto max_prompts = co_await config_->get_int(keys::kMaxPrompts, defaults::kMaxPrompts);
    if (!max_prompts) co_return make_fail(max_prompts.error());
    auto min_relevance = co_await config_->get_float(keys::kMinRelevanceScore,
                                                     defaults::kMinRelevanceScore);
    if (!min_relevance) co_return make_fail(min_relevance.error());
    auto protect = co_await config_->get_float(keys::kCleanupProtectScore,
                                               defaults::kCleanupProtectScore);
    if (!protect) co_return make_fail(protect.error());
    auto half_life = co_await config_->get_float(keys::kRelevanceHalfLifeDays,
                                                 defaults::kRelevanceHalfLifeDays);
    if (!half_life) co_return make_fail(half_life.error());
    auto weight = co_await config_->get_float(keys::kRelevanceRecencyWeight,
                                              defaults::kRelevanceRecencyWeight);
    if (!weight) co_return make_fail(weight.error());
    auto batch = co_await config_->get_int(keys::kMaintenanceBatchSize,
                                           defaults::kMaintenanceBatchSize);
    if (!batch) co_return make_fail(batch.error());

    policy.max_prompts = *max_prompts;
    if (policy.max_prompts < 0) {
        LOG_WARN("max_prompts={} is negative, using {}", policy.max_prompts, defaults::kMaxPrompts);
        policy.max_prompts = defaults::kMaxPrompts;
    }

    policy.min_relevance_score = std::clamp(*min_relevance, 0.0, 1.0);
    policy.protect_threshold = *protect;
    if (policy.protect_threshold <= policy.min_relevance_score) {
        double raised = defaults::kCleanupProtectScore;
        if (raised <= policy.min_relevance_score) raised = 1.0;
        LOG_WARN("cleanup_protect_score={} is not above min_relevance_score={}, raising to {}",
                 policy.protect_threshold, policy.min_relevance_score, raised);
        policy.protect_threshold = raised;
    }

    policy.half_life_days = *half_life;
    if (!(policy.half_life_days > 0.0)) {
        LOG_WARN("relevance_half_life_days={} must be positive, using {}",
                 policy.half_life_days, defaults::kRelevanceHalfLifeDays);
        policy.half_life_days = defaults::kRelevanceHalfLifeDays;
    }

    policy.recency_weight = *weight;
    if (!(policy.recency_weight > 0.0 && policy.recency_weight < 1.0)) {
        LOG_WARN("relevance_recency_weight={} must be within (0, 1), using {}",
                 policy.recency_weight, defaults::kRelevanceRecencyWeight);
        policy.recency_weight = defaults::kRelevanceRecencyWeight;
    }

    policy.batch_size = *batch > 0 ? *batch : defaults::kMaintenanceBatchSize;
    co_return policy;
}

auto LifecycleManager::update_scores_locked(SQLite::Database& conn,
                                            const LifecyclePolicy& policy,
                                            int64_t now_ms) -> int64_t {
    SQLite::Statement scan(conn,
        "SELECT id, created_at, usage_count, relevance_score FROM prompts "
        "WHERE id > ? ORDER BY id ASC LIMIT ?");
    SQLite::Statement write(conn,
        "UPDATE prompts SET relevance_score = ?, updated_at = ? WHERE id = ?");

    struct Change {
        std::string id;
        double score;
    };

    int64_t updated = 0;
    std::string cursor;
    for (;;) {
        std::vector<Change> changes;
        int64_t rows = 0;

        scan.bind(1, cursor);
        scan.bind(2, policy.batch_size);
        while (scan.executeStep()) {
            ++rows;
            cursor = scan.getColumn(0).getString();
            double age_days = static_cast<double>(now_ms - scan.getColumn(1).getInt64()) / kMsPerDay;
            double score = compute_relevance(age_days, scan.getColumn(2).getInt64(),
                                             policy.half_life_days, policy.recency_weight);
            if (std::abs(score - scan.getColumn(3).getDouble()) > kScoreEpsilon) {
                changes.push_back({cursor, score});
            }
        }
        scan.reset();

        for (const auto& change : changes) {
            write.bind(1, change.score);
            write.bind(2, now_ms);
            write.bind(3, change.id);
            write.exec();
            write.reset();
        }
        updated += static_cast<int64_t>(changes.size());

        if (rows < policy.batch_size) break;
    }
    return updated;
}

auto LifecycleManager::cleanup_locked(SQLite::Database& conn, const LifecyclePolicy& policy,
                                      bool dry_run) -> CleanupReport {
    CleanupReport report;
    report.max_prompts = policy.max_prompts;
    report.min_relevance_score = policy.min_relevance_score;
    report.protect_threshold = policy.protect_threshold;
    report.dry_run = dry_run;

    {
        SQLite::Statement counts(conn,
            "SELECT COUNT(*), COALESCE(SUM(relevance_score < ?), 0) FROM prompts");
        counts.bind(1, policy.min_relevance_score);
        counts.executeStep();
        report.current_count = counts.getColumn(0).getInt64();
        report.below_min_relevance = counts.getColumn(1).getInt64();
    }

    if (report.current_count <= policy.max_prompts) {
        return report;
    }

    int64_t excess = report.current_count - policy.max_prompts;
    std::vector<std::string> victims;
    {
        SQLite::Statement pick(conn,
            "SELECT id FROM prompts WHERE relevance_score < ? "
            "ORDER BY relevance_score ASC, created_at ASC, id ASC LIMIT ?");
        pick.bind(1, policy.protect_threshold);
        pick.bind(2, excess);
        while (pick.executeStep()) {
            victims.push_back(pick.getColumn(0).getString());
        }
    }

    report.selected = static_cast<int64_t>(victims.size());
    report.protected_blocked = excess - report.selected;

    if (!dry_run) {
        for (const auto& id : victims) {
            report.deleted += detail::delete_candidate(conn, id);
        }
    }

    if (report.protected_blocked > 0) {
        LOG_WARN("Cleanup left {} record(s) over capacity: remaining records score >= {}",
                 report.protected_blocked, policy.protect_threshold);
    }
    return report;
}

auto LifecycleManager::update_relevance_scores(Timestamp now) -> awaitable<Result<int64_t>> {
    auto policy = co_await load_policy();
    if (!policy) co_return make_fail(policy.error());

    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);
        auto updated = update_scores_locked(conn, *policy, timestamp_to_ms(now));
        txn.commit();
        LOG_INFO("Relevance update changed {} record(s)", updated);
        co_return updated;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Relevance update failed: {}", e.what());
        co_return make_fail(to_error(e, "Relevance update failed"));
    }
}

auto LifecycleManager::cleanup_old_prompts(bool dry_run) -> awaitable<Result<CleanupReport>> {
    auto policy = co_await load_policy();
    if (!policy) co_return make_fail(policy.error());

    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);
        auto report = cleanup_locked(conn, *policy, dry_run);
        if (!dry_run) txn.commit();

        if (dry_run) {
            LOG_INFO("DRY RUN: would delete {} record(s) (current: {}, max: {}, min_relevance: {:.2f})",
                     report.selected, report.current_count, report.max_prompts,
                     report.min_relevance_score);
        } else if (report.deleted > 0) {
            LOG_INFO("Cleanup deleted {} record(s) (current: {}, max: {})",
                     report.deleted, report.current_count, report.max_prompts);
        }
        co_return report;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Cleanup failed: {}", e.what());
        co_return make_fail(to_error(e, "Cleanup failed"));
    }
}

auto LifecycleManager::run_maintenance(const MaintenanceOptions& options, Timestamp now)
    -> awaitable<Result<MaintenanceReport>> {
    auto policy = co_await load_policy();
    if (!policy) co_return make_fail(policy.error());

    MaintenanceReport report;
    report.dry_run = options.dry_run;

    auto guard = db_->lock();
    try {
        auto& conn = db_->connection();
        SQLite::Transaction txn(conn);

        if (options.update_relevance) {
            report.relevance_updated = update_scores_locked(conn, *policy, timestamp_to_ms(now));
        }
        if (options.cleanup) {
            report.cleanup = cleanup_locked(conn, *policy, false);
            if (options.dry_run) {
                report.cleanup->dry_run = true;
                report.cleanup->deleted = 0;
            }
        }

        // Without commit the transaction rolls back on scope exit.
        if (!options.dry_run) txn.commit();

        LOG_INFO("{}Maintenance: {} score(s) updated, {} record(s) {}",
                 options.dry_run ? "DRY RUN: " : "",
                 report.relevance_updated,
                 report.cleanup ? report.cleanup->selected : 0,
                 options.dry_run ? "would be deleted" : "deleted");
        co_return report;
    } catch (const SQLite::Exception& e) {
        LOG_ERROR("Maintenance failed: {}", e.what());
        co_return make_fail(to_error(e, "Maintenance failed"));
    }
}

} // namespace promptvault::store
