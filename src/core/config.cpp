#include "hearthfs/core/config.hpp"
#include "hearthfs/core/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace hearthfs {

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
        auto config = j.get<Config>();

        if (config.sandbox.data_dir) {
            auto expanded = resolve_env_refs(*config.sandbox.data_dir);
            if (expanded != *config.sandbox.data_dir) {
                LOG_DEBUG("Config: expanded sandbox.data_dir to '{}'", expanded);
            }
            config.sandbox.data_dir = std::move(expanded);
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("HEARTHFS_LOG_LEVEL"); val && *val) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("HEARTHFS_DATA_DIR"); val && *val) {
        config.sandbox.data_dir = val;
    }
    if (auto* val = std::getenv("HEARTHFS_ATTACHMENTS_DIR"); val && *val) {
        config.sandbox.attachments_dir = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace hearthfs
