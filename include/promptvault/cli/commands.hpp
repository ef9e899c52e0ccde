#pragma once

#include <functional>
#include <ostream>

#include <boost/asio/awaitable.hpp>
#include <CLI/CLI.hpp>

#include "promptvault/core/config.hpp"
#include "promptvault/store/prompt_store.hpp"

namespace promptvault::cli {

using boost::asio::awaitable;

/// Everything a subcommand needs once arguments are parsed and the store is open.
struct CommandContext {
    Config& config;
    store::PromptStore& store;
    std::ostream& out;
    std::ostream& err;
};

/// Body of the selected subcommand; returns the process exit code.
using CommandAction = std::function<awaitable<int>(CommandContext&)>;

/// Writes the error as a single-line JSON object; returns exit code 1.
auto write_error(std::ostream& err, const Error& error) -> int;

/// First-run seeding of the persisted lifecycle thresholds from the
/// application config. Keys already present in the store are kept.
/// Returns the number of keys written.
auto seed_store_defaults(const Config& config, store::ConfigStore& settings)
    -> awaitable<Result<size_t>>;

/// Each register_* function adds one subcommand. When that subcommand is
/// selected on the command line its callback stores the work in `action`.

/// `stats`: store-wide statistics.
void register_stats_command(CLI::App& app, CommandAction& action);

/// `embeddings`: embedding coverage per model and dimensionality.
void register_embeddings_command(CLI::App& app, CommandAction& action);

/// `migrate`: clear embeddings that do not match the standard model.
void register_migrate_command(CLI::App& app, CommandAction& action);

/// `maintain`: relevance decay and capacity cleanup.
void register_maintain_command(CLI::App& app, CommandAction& action);

/// `search`: filtered text search.
void register_search_command(CLI::App& app, CommandAction& action);

void register_get_command(CLI::App& app, CommandAction& action);
void register_delete_command(CLI::App& app, CommandAction& action);

/// `relate`: add a typed edge between two records.
void register_relate_command(CLI::App& app, CommandAction& action);

/// `config get|set|list`: persisted store settings.
void register_config_command(CLI::App& app, CommandAction& action);

/// `version`: prints build information without opening the store.
void register_version_command(CLI::App& app, std::ostream& out);

} // namespace promptvault::cli
