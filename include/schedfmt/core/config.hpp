#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace schedfmt {

using json = nlohmann::json;

struct Config {
    std::string log_level = "info";
    int json_indent = 2;               // -1 prints compact JSON
    bool show_error_location = true;   // input line plus caret on parse failure
    bool stop_on_first_error = false;  // `check` stops at the first invalid schedule
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, json_indent, show_error_location, stop_on_first_error)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays SCHEDFMT_* environment variables onto an existing config.
void apply_env_overrides(Config& config);

} // namespace schedfmt
