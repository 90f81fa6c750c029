#include "gotfiles/cli.hpp"
#include "gotfiles/commands.hpp"
#include "gotfiles/config.hpp"
#include "gotfiles/git_driver.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>

namespace gotfiles::cli
{
	namespace
	{
		constexpr const char *kUsage = "Usage: gotfiles <init|sync>";

		void configure_logging(const DotfilesConfig &cfg, bool verbose)
		{
			auto level = verbose ? spdlog::level::debug : parse_log_level(cfg.log_level).value_or(spdlog::level::info);
			spdlog::set_level(level);
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		spdlog::set_pattern("[%l] %v");

		CLI::App app{"Back up dotfiles into a git repository and symlink them back home"};
		app.name("gotfiles");
		app.fallthrough();

		std::string config_path{"config.json"};
		bool verbose{false};
		app.add_option("-c,--config", config_path, "Path to config JSON (default ./config.json)");
		app.add_flag("-v,--verbose", verbose, "Log debug output");

		auto init_cmd = app.add_subcommand("init", "Move tracked paths into ./dotfiles, symlink them and push");
		auto sync_cmd = app.add_subcommand("sync", "Update an existing ./dotfiles repository and push");
		app.require_subcommand(1);

		try
		{
			app.parse(argc, argv);
		}
		catch (const CLI::Success &e)
		{
			return app.exit(e);
		}
		catch (const CLI::ParseError &e)
		{
			std::cerr << kUsage << std::endl;
			std::cerr << e.what() << std::endl;
			return 1;
		}

		auto cfg = ConfigLoader::load(config_path);
		if (!cfg)
		{
			spdlog::critical("Error loading config file ({}): {}", config_path, cfg.error().what());
			return 1;
		}
		configure_logging(*cfg, verbose);
		spdlog::debug("Loaded config: {}", ConfigLoader::to_json(*cfg).dump());

		auto ws = resolve_workspace();
		if (!ws)
		{
			spdlog::critical("{}", ws.error().what());
			return 1;
		}

		ProcessRunner runner;
		GitDriver git(runner, ws->repo_root);

		Result<std::vector<ItemReport>> result = std::unexpected(GotfilesError::internal("no command selected"));
		if (*init_cmd)
			result = run_init(*cfg, *ws, git);
		else if (*sync_cmd)
			result = run_sync(*cfg, *ws, git);

		if (!result)
		{
			spdlog::critical("{}", result.error().what());
			return 1;
		}
		return 0;
	}

} // namespace gotfiles::cli
