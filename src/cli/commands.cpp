#include "promptvault/cli/commands.hpp"
#include "promptvault/core/logger.hpp"
#include "promptvault/core/utils.hpp"
#include "promptvault/store/schema.hpp"

#include <ostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#ifndef PROMPTVAULT_VERSION_STRING
#define PROMPTVAULT_VERSION_STRING "0.1.0-dev"
#endif

namespace promptvault::cli {

using json = nlohmann::json;

namespace {

auto report_error(CommandContext& ctx, const Error& error) -> int {
    return write_error(ctx.err, error);
}

// Stored content is not guaranteed to be valid UTF-8; bad bytes print as U+FFFD.
void print_json(CommandContext& ctx, const json& j) {
    ctx.out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

} // anonymous namespace

auto write_error(std::ostream& err, const Error& error) -> int {
    json j = {
        {"error", {
            {"code", std::string(error_code_to_string(error.code()))},
            {"message", std::string(error.message())},
            {"detail", std::string(error.detail())},
        }},
    };
    err << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    return 1;
}

auto seed_store_defaults(const Config& config, store::ConfigStore& settings)
    -> awaitable<Result<size_t>> {
    std::map<std::string, std::string> defaults{
        {std::string(store::config_keys::kMaxPrompts),
         json(config.lifecycle.max_prompts).dump()},
        {std::string(store::config_keys::kMinRelevanceScore),
         json(config.lifecycle.min_relevance_score).dump()},
    };
    co_return co_await settings.seed_defaults(defaults);
}

// ---------------------------------------------------------------------------
// stats command
// ---------------------------------------------------------------------------

void register_stats_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("stats", "Show store statistics");

    auto options = std::make_shared<store::StatsOptions>();
    sub->add_flag("!--no-relationships", options->include_relationships,
                  "Omit relationship counts");
    sub->add_flag("!--no-usage", options->include_usage, "Omit usage counters");

    sub->callback([&action, options]() {
        action = [options](CommandContext& ctx) -> awaitable<int> {
            auto stats = co_await ctx.store.statistics().store_stats(*options);
            if (!stats) co_return report_error(ctx, stats.error());
            print_json(ctx, *stats);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// embeddings command
// ---------------------------------------------------------------------------

void register_embeddings_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("embeddings", "Show embedding coverage by model");

    sub->callback([&action]() {
        action = [](CommandContext& ctx) -> awaitable<int> {
            const auto& standard = ctx.config.embeddings;
            auto stats = co_await ctx.store.migrator().embedding_stats();
            if (!stats) co_return report_error(ctx, stats.error());
            auto pending = co_await ctx.store.migrator().needs_migration(
                standard.standard_model, standard.standard_dimensions);
            if (!pending) co_return report_error(ctx, pending.error());

            json j = *stats;
            j["standard_model"] = standard.standard_model;
            j["standard_dimensions"] = standard.standard_dimensions;
            j["needs_migration"] = *pending;
            print_json(ctx, j);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// migrate command
// ---------------------------------------------------------------------------

void register_migrate_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("migrate",
        "Clear embeddings that do not match the standard model");

    struct Args {
        std::string model;
        int dimensions = 0;
        int batch_size = 0;
        int max_batches = 0;
        bool dry_run = false;
    };
    auto args = std::make_shared<Args>();

    sub->add_option("--model", args->model, "Target model (default: from config)");
    sub->add_option("--dimensions", args->dimensions,
                    "Target dimensions (default: from config)")
        ->check(CLI::Range(1, static_cast<int>(kMaxEmbeddingDimensions)));
    sub->add_option("--batch-size", args->batch_size, "Records per batch (default: from config)");
    sub->add_option("--max-batches", args->max_batches,
                    "Stop after this many batches; 0 runs to completion");
    sub->add_flag("--dry-run", args->dry_run, "Report what would be cleared");

    sub->callback([&action, args]() {
        action = [args](CommandContext& ctx) -> awaitable<int> {
            const auto& defaults = ctx.config.embeddings;
            store::MigrationOptions options;
            options.target_model = args->model.empty() ? defaults.standard_model : args->model;
            options.target_dimensions =
                args->dimensions > 0 ? args->dimensions : defaults.standard_dimensions;
            options.batch_size = args->batch_size > 0 ? args->batch_size : defaults.batch_size;
            options.max_batches = args->max_batches;
            options.dry_run = args->dry_run;

            auto report = co_await ctx.store.migrator().migrate(options);
            if (!report) co_return report_error(ctx, report.error());
            print_json(ctx, *report);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// maintain command
// ---------------------------------------------------------------------------

void register_maintain_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("maintain",
        "Decay relevance scores and evict records over capacity");

    auto options = std::make_shared<store::MaintenanceOptions>();
    sub->add_flag("!--skip-relevance", options->update_relevance,
                  "Do not recompute relevance scores");
    sub->add_flag("!--skip-cleanup", options->cleanup, "Do not evict records");
    sub->add_flag("--dry-run", options->dry_run, "Report without changing the store");

    sub->callback([&action, options]() {
        action = [options](CommandContext& ctx) -> awaitable<int> {
            auto report = co_await ctx.store.lifecycle().run_maintenance(*options);
            if (!report) co_return report_error(ctx, report.error());
            print_json(ctx, *report);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// search command
// ---------------------------------------------------------------------------

void register_search_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("search", "Search stored records");

    struct Args {
        std::string query;
        std::string phase;
        std::string provider;
        std::string model;
        std::vector<std::string> tags;
        std::string since;
        double min_relevance = -1.0;
        bool by_relevance = false;
        bool without_embedding = false;
        int limit = store::kDefaultSearchLimit;
    };
    auto args = std::make_shared<Args>();

    sub->add_option("query", args->query, "Substring of the content");
    sub->add_option("--phase", args->phase, "Phase name")
        ->check(CLI::IsMember({"prima-materia", "solutio", "coagulatio",
                               "idea", "human", "precision"}));
    sub->add_option("--provider", args->provider, "Provider name");
    sub->add_option("--model", args->model, "Model name");
    sub->add_option("--tags", args->tags, "Comma-separated tags; any may match")
        ->delimiter(',');
    sub->add_option("--since", args->since, "Only records created on or after YYYY-MM-DD");
    sub->add_option("--min-relevance", args->min_relevance,
                    "Only records with at least this relevance score")
        ->check(CLI::Range(0.0, 1.0));
    sub->add_flag("--by-relevance", args->by_relevance,
                  "Order by relevance, then most recent use");
    sub->add_flag("--without-embedding", args->without_embedding,
                  "Only records still missing an embedding");
    sub->add_option("-n,--limit", args->limit, "Maximum number of results");

    sub->callback([&action, args]() {
        action = [args](CommandContext& ctx) -> awaitable<int> {
            store::SearchFilter filter;
            if (!args->query.empty()) filter.query = args->query;
            if (!args->phase.empty()) filter.phase = parse_phase(args->phase);
            if (!args->provider.empty()) filter.provider = args->provider;
            if (!args->model.empty()) filter.model = args->model;
            for (const auto& tag : args->tags) {
                auto trimmed = utils::trim(tag);
                if (!trimmed.empty()) filter.tags.insert(std::move(trimmed));
            }
            if (!args->since.empty()) {
                auto ms = utils::parse_date_ms(args->since);
                if (!ms) {
                    co_return report_error(ctx, make_error(ErrorCode::InvalidArgument,
                        "Invalid --since date, expected YYYY-MM-DD", args->since));
                }
                filter.created_after = ms_to_timestamp(*ms);
            }
            if (args->min_relevance >= 0.0) filter.min_relevance = args->min_relevance;
            if (args->without_embedding) filter.has_embedding = false;
            filter.limit = args->limit;

            Result<std::vector<Candidate>> results;
            if (args->by_relevance) {
                results = co_await ctx.store.text_search().top_relevant(filter);
            } else {
                results = co_await ctx.store.text_search().search(filter);
            }
            if (!results) co_return report_error(ctx, results.error());
            print_json(ctx, *results);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// get / delete commands
// ---------------------------------------------------------------------------

void register_get_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("get", "Show one record and its relationships");

    auto id = std::make_shared<std::string>();
    sub->add_option("id", *id, "Record id")->required();

    sub->callback([&action, id]() {
        action = [id](CommandContext& ctx) -> awaitable<int> {
            auto candidate = co_await ctx.store.candidates().get(*id);
            if (!candidate) co_return report_error(ctx, candidate.error());
            auto edges = co_await ctx.store.relationships().list_for_record(*id);
            if (!edges) co_return report_error(ctx, edges.error());

            json j = *candidate;
            j["relationships"] = *edges;
            print_json(ctx, j);
            co_return 0;
        };
    });
}

void register_delete_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("delete", "Delete a record and its relationships");

    auto id = std::make_shared<std::string>();
    sub->add_option("id", *id, "Record id")->required();

    sub->callback([&action, id]() {
        action = [id](CommandContext& ctx) -> awaitable<int> {
            auto removed = co_await ctx.store.candidates().remove(*id);
            if (!removed) co_return report_error(ctx, removed.error());
            print_json(ctx, json{{"deleted", *id}});
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// relate command
// ---------------------------------------------------------------------------

void register_relate_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("relate", "Add a relationship between two records");

    auto edge = std::make_shared<Relationship>();
    auto type = std::make_shared<std::string>();
    sub->add_option("source", edge->source_id, "Source record id")->required();
    sub->add_option("target", edge->target_id, "Target record id")->required();
    sub->add_option("type", *type,
                    "derived_from, similar_to, inspired_by or merged_with")->required();
    sub->add_option("--strength", edge->strength, "Edge strength in [0, 1]")
        ->default_val(0.5);
    sub->add_option("--context", edge->context, "Free-form note");

    sub->callback([&action, edge, type]() {
        action = [edge, type](CommandContext& ctx) -> awaitable<int> {
            auto added = co_await ctx.store.relationships().add(
                edge->source_id, edge->target_id, *type, edge->strength, edge->context);
            if (!added) co_return report_error(ctx, added.error());
            print_json(ctx, json{
                {"source_id", edge->source_id},
                {"target_id", edge->target_id},
                {"relationship_type", *type},
                {"strength", edge->strength},
            });
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandAction& action) {
    auto* sub = app.add_subcommand("config", "Read or change persisted store settings");
    sub->require_subcommand(1);

    auto key = std::make_shared<std::string>();
    auto value = std::make_shared<std::string>();

    auto* get = sub->add_subcommand("get", "Print one setting");
    get->add_option("key", *key, "Setting name")->required();
    get->callback([&action, key]() {
        action = [key](CommandContext& ctx) -> awaitable<int> {
            auto entry = co_await ctx.store.config().get(*key);
            if (!entry) co_return report_error(ctx, entry.error());
            json j = {{"key", *key}, {"value", nullptr}};
            if (*entry) j["value"] = **entry;
            print_json(ctx, j);
            co_return 0;
        };
    });

    auto* set = sub->add_subcommand("set", "Change one setting");
    set->add_option("key", *key, "Setting name")->required();
    set->add_option("value", *value, "New value")->required();
    set->callback([&action, key, value]() {
        action = [key, value](CommandContext& ctx) -> awaitable<int> {
            auto stored = co_await ctx.store.config().set(*key, *value);
            if (!stored) co_return report_error(ctx, stored.error());
            print_json(ctx, json{{"key", *key}, {"value", *value}});
            co_return 0;
        };
    });

    auto* list = sub->add_subcommand("list", "Print every setting");
    list->callback([&action]() {
        action = [](CommandContext& ctx) -> awaitable<int> {
            auto entries = co_await ctx.store.config().all();
            if (!entries) co_return report_error(ctx, entries.error());
            print_json(ctx, *entries);
            co_return 0;
        };
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app, std::ostream& out) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([&out]() {
        out << "promptvault " << PROMPTVAULT_VERSION_STRING << "\n";
        out << "C++ standard: " << __cplusplus << "\n";
        out << "Schema version: " << store::kSchemaVersion << "\n";
    });
}

} // namespace promptvault::cli
