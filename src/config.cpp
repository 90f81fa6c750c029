#include "gotfiles/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace gotfiles
{
    namespace
    {
        Result<std::vector<std::string>> parse_dotfiles(const nlohmann::json &node)
        {
            std::vector<std::string> items;
            if (node.is_null())
                return items;
            if (!node.is_array())
                return std::unexpected(GotfilesError::config("\"dotfiles\" must be an array of strings"));

            items.reserve(node.size());
            for (std::size_t i = 0; i < node.size(); ++i)
            {
                const auto &entry = node[i];
                if (!entry.is_string())
                {
                    return std::unexpected(GotfilesError::config(
                        "\"dotfiles\"[" + std::to_string(i) + "] is not a string"));
                }
                items.push_back(entry.get<std::string>());
            }
            return items;
        }
    } // namespace

    Result<spdlog::level::level_enum> parse_log_level(const std::string &name)
    {
        // from_str maps unknown names to off
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off")
            return std::unexpected(GotfilesError::config("Unknown log level: " + name));
        return level;
    }

    Result<DotfilesConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(GotfilesError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<DotfilesConfig> ConfigLoader::from_string(const std::string &json_content)
    {
        DotfilesConfig cfg{};

        nlohmann::json doc;
        try
        {
            doc = nlohmann::json::parse(json_content);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return std::unexpected(GotfilesError::config(std::string("Failed to parse JSON: ") + e.what()));
        }

        if (doc.is_null())
            doc = nlohmann::json::object();
        if (!doc.is_object())
            return std::unexpected(GotfilesError::config("Config root must be a JSON object"));

        if (auto it = doc.find("dotfiles"); it != doc.end())
        {
            auto items = parse_dotfiles(*it);
            if (!items)
                return std::unexpected(items.error());
            cfg.dotfiles = std::move(*items);
        }

        if (auto it = doc.find("log_level"); it != doc.end() && !it->is_null())
        {
            if (!it->is_string())
                return std::unexpected(GotfilesError::config("\"log_level\" must be a string"));
            cfg.log_level = it->get<std::string>();
        }
        if (auto level = parse_log_level(cfg.log_level); !level)
            return std::unexpected(level.error());

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(DotfilesConfig &cfg)
    {
        if (const char *level = std::getenv("GOTFILES_LOG_LEVEL"))
        {
            auto parsed = parse_log_level(level);
            if (!parsed)
                return std::unexpected(GotfilesError::config(
                    std::string("GOTFILES_LOG_LEVEL: ") + parsed.error().what()));
            cfg.log_level = level;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const DotfilesConfig &cfg)
    {
        nlohmann::json j;
        j["dotfiles"] = cfg.dotfiles;
        j["log_level"] = cfg.log_level;
        return j;
    }

} // namespace gotfiles
