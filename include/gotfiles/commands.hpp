#pragma once

#include "types.hpp"
#include "config.hpp"
#include "git_driver.hpp"
#include "reconciler.hpp"
#include <filesystem>
#include <vector>

namespace gotfiles
{

    inline constexpr const char *kDotfilesDirName = "dotfiles";

    struct Workspace
    {
        std::filesystem::path home_dir;
        std::filesystem::path repo_root; // git working tree, normally the cwd
        std::filesystem::path dotfiles_dir() const { return repo_root / kDotfilesDirName; }
    };

    /** Home directory from $HOME, falling back to the passwd entry. */
    Result<std::filesystem::path> resolve_home_dir();

    /** Home directory plus the current working directory as repository root. */
    Result<Workspace> resolve_workspace();

    /**
     * Create (or reuse) the dotfiles directory, migrate every item and
     * publish with the init commit message.
     */
    Result<std::vector<ItemReport>> run_init(const DotfilesConfig &cfg, const Workspace &ws, GitDriver &git);

    /**
     * Like run_init but requires an existing dotfiles directory; fails with
     * NotFound before touching anything otherwise.
     */
    Result<std::vector<ItemReport>> run_sync(const DotfilesConfig &cfg, const Workspace &ws, GitDriver &git);

} // namespace gotfiles
