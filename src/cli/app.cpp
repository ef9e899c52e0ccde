#include "promptvault/cli/app.hpp"
#include "promptvault/core/logger.hpp"

#include <exception>
#include <filesystem>
#include <iostream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

// Version string; typically injected by CMake via -DPROMPTVAULT_VERSION_STRING=...
#ifndef PROMPTVAULT_VERSION_STRING
#define PROMPTVAULT_VERSION_STRING "0.1.0-dev"
#endif

namespace promptvault::cli {

App::App()
    : App(std::cout, std::cerr) {}

App::App(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
    , cli_("promptvault", "Maintenance tool for the prompt candidate store")
{
    cli_.set_version_flag("--version", PROMPTVAULT_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("PROMPTVAULT_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--db", db_path_, "Database file (overrides config)");

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e, out_, err_);
    }

    // Commands such as `version` finish inside their parse callback.
    if (!action_) {
        return 0;
    }

    load_configuration();
    return execute();
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    register_stats_command(cli_, action_);
    register_embeddings_command(cli_, action_);
    register_migrate_command(cli_, action_);
    register_maintain_command(cli_, action_);
    register_search_command(cli_, action_);
    register_get_command(cli_, action_);
    register_delete_command(cli_, action_);
    register_relate_command(cli_, action_);
    register_config_command(cli_, action_);
    register_version_command(cli_, out_);
}

void App::load_configuration() {
    config_ = config_path_.empty()
        ? load_config_from_env()
        : load_config(std::filesystem::path(config_path_));

    if (!log_level_.empty()) config_.log_level = log_level_;
    if (!db_path_.empty()) config_.store.db_path = db_path_;

    Logger::init("promptvault", config_.log_level);
    if (!config_path_.empty()) {
        LOG_INFO("Loaded configuration from: {}", config_path_);
    }
}

auto App::execute() -> int {
    auto db_path = resolve_db_path(config_);
    auto opened = store::PromptStore::open(
        db_path.string(), store::StoreOptions{config_.store.busy_timeout_ms});
    if (!opened) {
        return write_error(err_, opened.error());
    }
    auto& prompt_store = **opened;

    CommandContext ctx{config_, prompt_store, out_, err_};
    int exit_code = 1;

    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto seeded = co_await seed_store_defaults(config_, prompt_store.config());
            if (!seeded) {
                exit_code = write_error(err_, seeded.error());
                co_return;
            }
            exit_code = co_await action_(ctx);
        },
        [this](std::exception_ptr ep) {
            if (!ep) return;
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("Command failed: {}", e.what());
                json j = {{"error", {{"message", "Command failed"}, {"detail", e.what()}}}};
                err_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
            }
        });
    ioc.run();

    Logger::flush();
    return exit_code;
}

} // namespace promptvault::cli
