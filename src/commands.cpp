#include "gotfiles/commands.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gotfiles
{
    namespace
    {
        void log_summary(const std::vector<ItemReport> &reports)
        {
            std::size_t linked = 0;
            std::size_t failed = 0;
            for (const auto &r : reports)
            {
                if (r.linked)
                    ++linked;
                if (!r.ok())
                    ++failed;
            }
            spdlog::debug("Processed {} item(s): {} linked, {} with errors", reports.size(), linked, failed);
        }
    } // namespace

    Result<fs::path> resolve_home_dir()
    {
        if (const char *home = std::getenv("HOME"); home && *home)
            return fs::path(home);

        if (const passwd *pw = getpwuid(getuid()); pw && pw->pw_dir && *pw->pw_dir)
            return fs::path(pw->pw_dir);

        return std::unexpected(GotfilesError::not_found("Unable to determine home directory"));
    }

    Result<Workspace> resolve_workspace()
    {
        auto home = resolve_home_dir();
        if (!home)
            return std::unexpected(home.error());

        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec)
            return std::unexpected(GotfilesError::io("Unable to determine current directory: " + ec.message()));

        return Workspace{*home, cwd};
    }

    Result<std::vector<ItemReport>> run_init(const DotfilesConfig &cfg, const Workspace &ws, GitDriver &git)
    {
        const fs::path dotfiles_dir = ws.dotfiles_dir();
        std::error_code ec;
        fs::create_directories(dotfiles_dir, ec);
        if (ec)
        {
            return std::unexpected(GotfilesError::io("Unable to create " + dotfiles_dir.string() + ": " + ec.message()));
        }

        Reconciler reconciler(ws.home_dir, dotfiles_dir);
        auto reports = reconciler.process_all(cfg.dotfiles, false);
        log_summary(reports);

        git.publish(kInitCommitMessage);
        return reports;
    }

    Result<std::vector<ItemReport>> run_sync(const DotfilesConfig &cfg, const Workspace &ws, GitDriver &git)
    {
        const fs::path dotfiles_dir = ws.dotfiles_dir();
        std::error_code ec;
        if (!fs::is_directory(dotfiles_dir, ec))
        {
            return std::unexpected(GotfilesError::not_found(
                "dotfiles repository directory does not exist. Run 'gotfiles init' first"));
        }

        Reconciler reconciler(ws.home_dir, dotfiles_dir);
        auto reports = reconciler.process_all(cfg.dotfiles, true);
        log_summary(reports);

        git.publish(kSyncCommitMessage);
        return reports;
    }

} // namespace gotfiles
