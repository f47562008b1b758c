#include "docqa/cli/app.hpp"
#include "docqa/cli/commands.hpp"

// Version string; typically injected by CMake via -DDOCQA_VERSION_STRING=...
#ifndef DOCQA_VERSION_STRING
#define DOCQA_VERSION_STRING "0.1.0-dev"
#endif

namespace docqa::cli {

App::App()
    : cli_("docqa", "Hybrid retrieval and reranking service for documentation Q&A")
{
    cli_.set_version_flag("--version", DOCQA_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", ctx_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("DOCQA_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: dotenv file.
    cli_.add_option("--env-file", ctx_.env_file,
                    "Environment file loaded before configuration")
        ->capture_default_str();

    // Global option: log level override.
    cli_.add_option("--log-level", ctx_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                               "error", "critical", "off"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback has already run inside parse()
    // and recorded its outcome.
    return ctx_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

void App::setup_commands() {
    register_serve_command(cli_, ctx_);
    register_query_command(cli_, ctx_);
    register_check_command(cli_, ctx_);
    register_config_command(cli_, ctx_);
    register_version_command(cli_);
}

} // namespace docqa::cli
