#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <string>
#include <vector>

namespace gotfiles
{

    struct DotfilesConfig
    {
        std::vector<std::string> dotfiles; // paths relative to $HOME, in processing order
        std::string log_level{"info"};
    };

    /**
     * ConfigLoader loads the JSON tracking list ({"dotfiles": [...]}) and applies
     * environment overrides. A missing "dotfiles" key means there is nothing to
     * track; any other shape error is a ConfigError.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a JSON file path. Environment overrides take precedence. */
        static Result<DotfilesConfig> load(const std::string &path);

        /** Parse config from JSON string content. */
        static Result<DotfilesConfig> from_string(const std::string &json_content);

        /** Serialize config to JSON for debugging/inspection. */
        static nlohmann::json to_json(const DotfilesConfig &cfg);

    private:
        static Result<void> apply_env_overrides(DotfilesConfig &cfg);
    };

    /** Map a level name ("debug", "warn", ...) to spdlog's level. */
    Result<spdlog::level::level_enum> parse_log_level(const std::string &name);

} // namespace gotfiles
