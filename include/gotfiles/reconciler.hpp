#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace gotfiles
{

    /**
     * What the reconciler found at the home-side path of a tracked item
     */
    enum class SourceState
    {
        Symlink,      // already migrated, skipped
        Directory,    // tree copied into the repository, original removed
        File,         // file copied into the repository, original removed
        Missing,      // nothing in home; only the symlink step runs
        Inaccessible, // lstat failed for a reason other than absence
        Unsupported,  // fifo, socket or device node; left alone
        Invalid       // bad item path, or a directory holding the repository
    };

    std::string source_state_to_string(SourceState state);

    /**
     * Outcome of reconciling one tracked item. errors is empty when every
     * attempted step succeeded.
     */
    struct ItemReport
    {
        std::string item;
        SourceState state{SourceState::Missing};
        bool copied{false};
        bool removed_original{false};
        bool linked{false};
        bool backup_missing{false};
        std::vector<std::string> errors;

        bool ok() const { return errors.empty(); }
    };

    /**
     * Reconciler moves tracked items from the home directory into the
     * repository's dotfiles directory and leaves symlinks behind.
     *
     * Each item goes through two steps:
     *  1. migrate: a symlink is skipped outright; a directory or regular file
     *     is copied to the repository and the original deleted once the copy
     *     succeeded. A missing or unreadable source is logged and falls
     *     through.
     *  2. link: if nothing exists at the home path any more and the
     *     repository has a copy, a symlink home -> repository is created.
     *
     * Failures are logged and recorded in the report; they never stop the
     * remaining items. Nothing is rolled back.
     */
    class Reconciler
    {
    public:
        Reconciler(std::filesystem::path home_dir, std::filesystem::path dotfiles_dir);

        /** Reconcile one item. is_sync only changes the wording of log lines. */
        ItemReport process_path(const std::string &item, bool is_sync) const;

        /** Reconcile every item in order. */
        std::vector<ItemReport> process_all(const std::vector<std::string> &items, bool is_sync) const;

        /**
         * Join item onto base as a relative path. A leading '/' is dropped and
         * the result is lexically normalized; empty items and items that
         * resolve to base itself or escape it via ".." are rejected.
         */
        static Result<std::filesystem::path> resolve_item(const std::filesystem::path &base,
                                                          const std::string &item);

        const std::filesystem::path &home_dir() const { return home_dir_; }
        const std::filesystem::path &dotfiles_dir() const { return dotfiles_dir_; }

    private:
        void migrate(ItemReport &report, const std::filesystem::path &source,
                     const std::filesystem::path &dest, bool is_sync) const;
        void link_into_home(ItemReport &report, const std::filesystem::path &source,
                            const std::filesystem::path &dest) const;

        std::filesystem::path home_dir_;
        std::filesystem::path dotfiles_dir_;
    };

} // namespace gotfiles
