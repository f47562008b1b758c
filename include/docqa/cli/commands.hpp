#pragma once

#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "docqa/core/config.hpp"
#include "docqa/core/error.hpp"

namespace docqa::cli {

/// Options shared by every subcommand plus the exit code the selected
/// subcommand reports back to main().
struct CommandContext {
    std::string config_path;
    std::string env_file = ".env";
    std::string log_level;  // empty: use the configured level
    int exit_code = 0;
};

/// Loads the .env file, the config file (or defaults) and environment
/// overrides, initializes logging and validates the result.
auto load_runtime_config(const CommandContext& ctx) -> Result<Config>;

/// Replaces every non-empty string under a secret-looking key with a
/// placeholder, recursively.
void redact_config_json(nlohmann::json& j);

/// Register the `serve` subcommand.
/// Loads the corpus, connects the collaborators and serves the HTTP API.
void register_serve_command(CLI::App& app, CommandContext& ctx);

/// Register the `query` subcommand.
/// Runs a single retrieval and prints the response as JSON.
void register_query_command(CLI::App& app, CommandContext& ctx);

/// Register the `check` subcommand.
/// Verifies the corpus snapshot and every configured collaborator.
void register_check_command(CLI::App& app, CommandContext& ctx);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& ctx);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace docqa::cli
