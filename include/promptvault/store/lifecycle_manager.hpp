#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/config_store.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

/// Maintenance thresholds, read from the ConfigStore on every run.
struct LifecyclePolicy {
    int64_t max_prompts = config_defaults::kMaxPrompts;
    double min_relevance_score = config_defaults::kMinRelevanceScore;
    double protect_threshold = config_defaults::kCleanupProtectScore;
    double half_life_days = config_defaults::kRelevanceHalfLifeDays;
    double recency_weight = config_defaults::kRelevanceRecencyWeight;
    int64_t batch_size = config_defaults::kMaintenanceBatchSize;
};

/// Relevance of a record given its age and usage:
///
///   recency = 2^(-age_days / half_life_days)
///   usage   = 1 - 1 / (1 + ln(1 + usage_count))
///   score   = clamp(w * recency + (1 - w) * usage, 0, 1)
///
/// Non-increasing in age, non-decreasing in usage, always within [0, 1].
/// Negative ages (clock skew) count as zero.
auto compute_relevance(double age_days, int64_t usage_count,
                       double half_life_days, double recency_weight) -> double;

struct CleanupReport {
    int64_t current_count = 0;
    int64_t max_prompts = 0;
    double min_relevance_score = 0.0;
    double protect_threshold = 0.0;
    int64_t below_min_relevance = 0;
    int64_t selected = 0;           // records chosen for eviction
    int64_t deleted = 0;            // records actually removed (0 on dry run)
    int64_t protected_blocked = 0;  // excess that only protected records could cover
    bool dry_run = false;
};

struct MaintenanceOptions {
    bool update_relevance = true;
    bool cleanup = true;
    bool dry_run = false;
};

struct MaintenanceReport {
    int64_t relevance_updated = 0;
    std::optional<CleanupReport> cleanup;
    bool dry_run = false;
};

void to_json(json& j, const LifecyclePolicy& p);
void to_json(json& j, const CleanupReport& r);
void to_json(json& j, const MaintenanceReport& r);

/// Keeps the store bounded: decays relevance scores and evicts the least
/// relevant records once the capacity ceiling is exceeded. Runs only when
/// called; scheduling belongs to the caller.
class LifecycleManager {
public:
    LifecycleManager(std::shared_ptr<Database> db, std::shared_ptr<ConfigStore> config);

    /// Reads and sanitizes the policy. A protect threshold not above the
    /// relevance floor is raised to its default.
    auto load_policy() -> awaitable<Result<LifecyclePolicy>>;

    /// Recomputes every score; returns how many rows changed.
    auto update_relevance_scores(Timestamp now = Clock::now()) -> awaitable<Result<int64_t>>;

    auto cleanup_old_prompts(bool dry_run = false) -> awaitable<Result<CleanupReport>>;

    /// Relevance update followed by cleanup in a single transaction. A dry
    /// run performs both and rolls back, so the cleanup numbers reflect the
    /// refreshed scores.
    auto run_maintenance(const MaintenanceOptions& options = {},
                         Timestamp now = Clock::now()) -> awaitable<Result<MaintenanceReport>>;

private:
    auto update_scores_locked(SQLite::Database& conn, const LifecyclePolicy& policy,
                              int64_t now_ms) -> int64_t;
    auto cleanup_locked(SQLite::Database& conn, const LifecyclePolicy& policy,
                        bool dry_run) -> CleanupReport;

    std::shared_ptr<Database> db_;
    std::shared_ptr<ConfigStore> config_;
};

} // namespace promptvault::store
