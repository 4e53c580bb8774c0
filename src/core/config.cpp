#include "schedfmt/core/config.hpp"
#include "schedfmt/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace schedfmt {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);

        if (j.contains("json_indent") && j["json_indent"].is_number_integer()) {
            auto indent = j["json_indent"].get<int>();
            if (indent < -1) {
                LOG_WARN("Config: json_indent {} clamped to -1 (compact)", indent);
                j["json_indent"] = -1;
            }
        }

        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("SCHEDFMT_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("SCHEDFMT_JSON_INDENT")) {
        std::string_view text(val);
        int indent = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), indent);
        if (ec == std::errc{} && ptr == text.data() + text.size() && indent >= -1) {
            config.json_indent = indent;
        } else {
            LOG_WARN("Ignoring invalid SCHEDFMT_JSON_INDENT '{}'", text);
        }
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

} // namespace schedfmt
