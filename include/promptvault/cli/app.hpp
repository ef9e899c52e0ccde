#pragma once

#include <ostream>
#include <string>

#include <CLI/CLI.hpp>

#include "promptvault/cli/commands.hpp"
#include "promptvault/core/config.hpp"

namespace promptvault::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, loads the configuration,
/// opens the prompt store and runs the selected subcommand on an
/// io_context.
class App {
public:
    App();
    /// Command output goes to `out`, JSON errors and usage text to `err`.
    App(std::ostream& out, std::ostream& err);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();
    void load_configuration();
    auto execute() -> int;

    std::ostream& out_;
    std::ostream& err_;
    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string db_path_;
    std::string log_level_;
    CommandAction action_;
};

} // namespace promptvault::cli
