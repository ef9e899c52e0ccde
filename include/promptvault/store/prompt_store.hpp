#pragma once

#include <memory>
#include <string>

#include "promptvault/core/error.hpp"
#include "promptvault/store/candidate_repository.hpp"
#include "promptvault/store/config_store.hpp"
#include "promptvault/store/database.hpp"
#include "promptvault/store/embedding_migrator.hpp"
#include "promptvault/store/lifecycle_manager.hpp"
#include "promptvault/store/relationship_graph.hpp"
#include "promptvault/store/semantic_search.hpp"
#include "promptvault/store/statistics.hpp"
#include "promptvault/store/text_search.hpp"

namespace promptvault::store {

struct StoreOptions {
    int busy_timeout_ms = 5000;
};

/// Owns the database handle and every component that works on it.
class PromptStore {
public:
    /// Opens or creates the store at path and brings its schema up to date.
    static auto open(const std::string& path, const StoreOptions& options = {})
        -> Result<std::unique_ptr<PromptStore>>;

    ~PromptStore();

    PromptStore(const PromptStore&) = delete;
    PromptStore& operator=(const PromptStore&) = delete;

    [[nodiscard]] auto candidates() -> CandidateRepository&;
    [[nodiscard]] auto text_search() -> TextSearch&;
    [[nodiscard]] auto semantic_search() -> SemanticSearch&;
    [[nodiscard]] auto migrator() -> EmbeddingMigrator&;
    [[nodiscard]] auto lifecycle() -> LifecycleManager&;
    [[nodiscard]] auto relationships() -> RelationshipGraph&;
    [[nodiscard]] auto config() -> ConfigStore&;
    [[nodiscard]] auto statistics() -> Statistics&;

    [[nodiscard]] auto database() -> Database&;
    [[nodiscard]] auto schema_version() const -> int;

private:
    struct Impl;
    explicit PromptStore(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace promptvault::store
