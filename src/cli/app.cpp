#include "schedfmt/cli/app.hpp"
#include "schedfmt/cli/commands.hpp"
#include "schedfmt/core/logger.hpp"

#include <filesystem>

namespace schedfmt::cli {

App::App()
    : cli_("schedfmt", "Schedule format parser and validator")
{
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("SCHEDFMT_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(1);

    // Runs after all arguments are parsed and before subcommand callbacks.
    cli_.parse_complete_callback([this]() { load_configuration(); });

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Subcommands report failures as CLI::RuntimeError with their exit code.
        Logger::flush();
        return cli_.exit(e);
    }

    Logger::flush();
    return 0;
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

void App::load_configuration() {
    if (!config_path_.empty()) {
        config_ = load_config(std::filesystem::path(config_path_));
    }
    apply_env_overrides(config_);
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::set_level(config_.log_level);
    if (!config_path_.empty()) {
        LOG_DEBUG("Loaded configuration from: {}", config_path_);
    }
}

void App::setup_commands() {
    register_parse_command(cli_, config_);
    register_check_command(cli_, config_);
    register_bounds_command(cli_, config_);
    register_version_command(cli_);
}

} // namespace schedfmt::cli
