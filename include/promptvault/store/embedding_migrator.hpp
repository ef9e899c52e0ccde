#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "promptvault/core/error.hpp"
#include "promptvault/core/types.hpp"
#include "promptvault/store/database.hpp"

namespace promptvault::store {

using boost::asio::awaitable;

struct MigrationOptions {
    std::string target_model = "text-embedding-3-small";
    int target_dimensions = 1536;
    int batch_size = 10;   // <= 0 selects the default
    int max_batches = 0;   // 0 runs to completion
    bool dry_run = false;
};

/// Counts cover this invocation only.
struct MigrationReport {
    std::string target_model;
    int target_dimensions = 0;
    size_t scanned = 0;
    size_t cleared = 0;
    size_t batches = 0;
    bool resumed = false;
    bool completed = false;
    bool dry_run = false;
};

struct ModelUsage {
    std::string model;
    int dimensions = 0;
    int64_t count = 0;
};

struct EmbeddingStats {
    int64_t total = 0;
    int64_t with_embeddings = 0;
    double coverage_percent = 0.0;
    std::vector<ModelUsage> models;
};

void to_json(json& j, const MigrationReport& r);
void to_json(json& j, const ModelUsage& m);
void to_json(json& j, const EmbeddingStats& s);

/// Moves the store onto a single embedding standard by clearing every
/// embedding produced by a different model or dimensionality, so that the
/// caller can regenerate them. Work is split into id-ordered batches, each
/// committed with its cursor; an interrupted run for the same target picks
/// up where it stopped.
class EmbeddingMigrator {
public:
    explicit EmbeddingMigrator(std::shared_ptr<Database> db);

    auto migrate(const MigrationOptions& options) -> awaitable<Result<MigrationReport>>;

    auto embedding_stats() -> awaitable<Result<EmbeddingStats>>;

    /// True when any stored embedding differs from the given standard.
    auto needs_migration(std::string_view model, int dimensions) -> awaitable<Result<bool>>;

private:
    auto dry_run(const MigrationOptions& options) -> Result<MigrationReport>;
    auto begin_run(const MigrationOptions& options, MigrationReport& report)
        -> Result<std::string>;
    auto run_batch(const MigrationOptions& options, int batch_size,
                   std::string& cursor, MigrationReport& report) -> Result<bool>;

    std::shared_ptr<Database> db_;
};

} // namespace promptvault::store
