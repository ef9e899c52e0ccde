#include "promptvault/store/prompt_store.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/store/schema.hpp"

namespace promptvault::store {

struct PromptStore::Impl {
    std::shared_ptr<Database> db;
    std::shared_ptr<ConfigStore> config;
    CandidateRepository candidates;
    TextSearch text_search;
    SemanticSearch semantic_search;
    EmbeddingMigrator migrator;
    LifecycleManager lifecycle;
    RelationshipGraph relationships;
    Statistics statistics;
    int schema_version = 0;

    explicit Impl(std::shared_ptr<Database> handle)
        : db(std::move(handle))
        , config(std::make_shared<ConfigStore>(db))
        , candidates(db)
        , text_search(db)
        , semantic_search(db)
        , migrator(db)
        , lifecycle(db, config)
        , relationships(db)
        , statistics(db) {}
};

auto PromptStore::open(const std::string& path, const StoreOptions& options)
    -> Result<std::unique_ptr<PromptStore>> {
    auto db = Database::open(path, DatabaseOptions{options.busy_timeout_ms});
    if (!db) {
        LOG_ERROR("Cannot open prompt store: {}", db.error().what());
        return std::unexpected(db.error());
    }

    auto version = ensure_schema(**db);
    if (!version) {
        return std::unexpected(version.error());
    }

    auto impl = std::make_unique<Impl>(std::move(*db));
    impl->schema_version = *version;
    LOG_INFO("Prompt store ready at {} (schema v{})", path, *version);
    return std::unique_ptr<PromptStore>(new PromptStore(std::move(impl)));
}

PromptStore::PromptStore(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

PromptStore::~PromptStore() = default;

auto PromptStore::candidates() -> CandidateRepository& { return impl_->candidates; }
auto PromptStore::text_search() -> TextSearch& { return impl_->text_search; }
auto PromptStore::semantic_search() -> SemanticSearch& { return impl_->semantic_search; }
auto PromptStore::migrator() -> EmbeddingMigrator& { return impl_->migrator; }
auto PromptStore::lifecycle() -> LifecycleManager& { return impl_->lifecycle; }
auto PromptStore::relationships() -> RelationshipGraph& { return impl_->relationships; }
auto PromptStore::config() -> ConfigStore& { return *impl_->config; }
auto PromptStore::statistics() -> Statistics& { return impl_->statistics; }
auto PromptStore::database() -> Database& { return *impl_->db; }
auto PromptStore::schema_version() const -> int { return impl_->schema_version; }

} // namespace promptvault::store
