#include "gotfiles/reconciler.hpp"
#include "gotfiles/fs_copy.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace gotfiles
{

    std::string source_state_to_string(SourceState state)
    {
        switch (state)
        {
        case SourceState::Symlink:
            return "symlink";
        case SourceState::Directory:
            return "directory";
        case SourceState::File:
            return "file";
        case SourceState::Missing:
            return "missing";
        case SourceState::Inaccessible:
            return "inaccessible";
        case SourceState::Unsupported:
            return "unsupported";
        case SourceState::Invalid:
            return "invalid";
        }
        return "unknown";
    }

    namespace
    {
        // true if inner is outer or lies below it, after resolving symlinks
        bool is_within(const fs::path &inner, const fs::path &outer)
        {
            std::error_code ec;
            const fs::path in = fs::weakly_canonical(inner, ec);
            if (ec)
                return false;
            const fs::path out = fs::weakly_canonical(outer, ec);
            if (ec)
                return false;

            auto it = in.begin();
            for (const auto &part : out)
            {
                if (part.empty())
                    continue; // trailing separator
                if (it == in.end() || *it != part)
                    return false;
                ++it;
            }
            return true;
        }
    } // namespace

    Reconciler::Reconciler(fs::path home_dir, fs::path dotfiles_dir)
        : home_dir_(std::move(home_dir)), dotfiles_dir_(std::move(dotfiles_dir))
    {
    }

    Result<fs::path> Reconciler::resolve_item(const fs::path &base, const std::string &item)
    {
        if (item.empty())
            return std::unexpected(GotfilesError::invalid_input("Empty path in dotfiles list"));

        fs::path rel = fs::path(item).relative_path().lexically_normal();
        if (!rel.empty() && !rel.has_filename())
            rel = rel.parent_path(); // "dir/" -> "dir"

        if (rel.empty() || rel == ".")
            return std::unexpected(GotfilesError::invalid_input("Path refers to the base directory itself: " + item));
        if (*rel.begin() == "..")
            return std::unexpected(GotfilesError::invalid_input("Path escapes the base directory: " + item));

        return base / rel;
    }

    ItemReport Reconciler::process_path(const std::string &item, bool is_sync) const
    {
        ItemReport report;
        report.item = item;

        auto source = resolve_item(home_dir_, item);
        auto dest = resolve_item(dotfiles_dir_, item);
        if (!source || !dest)
        {
            report.state = SourceState::Invalid;
            const std::string msg = source ? dest.error().what() : source.error().what();
            spdlog::error("Ignoring '{}': {}", item, msg);
            report.errors.push_back(msg);
            return report;
        }

        std::error_code ec;
        const auto st = fs::symlink_status(*source, ec);
        if (ec == std::errc::not_a_directory)
        {
            // a parent component is a file; not the same as absent
            report.state = SourceState::Inaccessible;
            spdlog::error("Error accessing {}: {}", item, ec.message());
            report.errors.push_back("Error accessing " + item + ": " + ec.message());
            return report;
        }
        if (st.type() == fs::file_type::not_found)
        {
            report.state = SourceState::Missing;
            spdlog::info("{} does not exist in home.", item);
        }
        else if (ec)
        {
            report.state = SourceState::Inaccessible;
            spdlog::error("Error accessing {}: {}", item, ec.message());
            report.errors.push_back("Error accessing " + item + ": " + ec.message());
        }
        else if (fs::is_symlink(st))
        {
            report.state = SourceState::Symlink;
            spdlog::info("Skipping backup for {} as it is already a symlink.", item);
            return report;
        }
        else if (fs::is_directory(st) && is_within(dotfiles_dir_, *source))
        {
            report.state = SourceState::Invalid;
            spdlog::error("Ignoring {}: it contains the repository at {}", item, dotfiles_dir_.string());
            report.errors.push_back("Tracked directory contains the repository: " + item);
            return report;
        }
        else if (fs::is_directory(st) || fs::is_regular_file(st))
        {
            report.state = fs::is_directory(st) ? SourceState::Directory : SourceState::File;
            migrate(report, *source, *dest, is_sync);
        }
        else
        {
            report.state = SourceState::Unsupported;
            spdlog::error("Skipping {}: not a regular file or directory.", item);
            report.errors.push_back("Unsupported file type: " + item);
        }

        link_into_home(report, *source, *dest);
        return report;
    }

    std::vector<ItemReport> Reconciler::process_all(const std::vector<std::string> &items, bool is_sync) const
    {
        std::vector<ItemReport> reports;
        reports.reserve(items.size());
        for (const auto &item : items)
            reports.push_back(process_path(item, is_sync));
        return reports;
    }

    void Reconciler::migrate(ItemReport &report, const fs::path &source, const fs::path &dest, bool is_sync) const
    {
        const bool is_dir = report.state == SourceState::Directory;
        const char *kind = is_dir ? "directory" : "file";

        auto copied = fsutil::copy_path(source, dest);
        if (!copied)
        {
            // keep the original: it may be the only intact copy
            spdlog::error("Error copying {} {}: {}", kind, report.item, copied.error().what());
            report.errors.push_back(copied.error().what());
            return;
        }
        report.copied = true;
        if (is_sync)
            spdlog::info("Updated {} {} in repository.", kind, report.item);
        else
            spdlog::info("Copied {} {} to repository.", kind, report.item);

        std::error_code ec;
        if (is_dir)
            fs::remove_all(source, ec);
        else
            fs::remove(source, ec);
        if (ec)
        {
            spdlog::error("Error removing original {} {}: {}", kind, report.item, ec.message());
            report.errors.push_back("Error removing original " + source.string() + ": " + ec.message());
            return;
        }
        report.removed_original = true;
    }

    void Reconciler::link_into_home(ItemReport &report, const fs::path &source, const fs::path &dest) const
    {
        std::error_code ec;
        if (fs::symlink_status(source, ec).type() != fs::file_type::not_found)
            return;

        if (!fs::exists(dest, ec))
        {
            spdlog::warn("No backup for {} found in repository.", report.item);
            report.backup_missing = true;
            return;
        }

        const fs::path target = fs::absolute(dest, ec);
        if (ec)
        {
            spdlog::error("Error creating symlink for {}: {}", report.item, ec.message());
            report.errors.push_back("Unable to resolve " + dest.string() + ": " + ec.message());
            return;
        }

        const fs::path parent = source.parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
            {
                spdlog::error("Error creating symlink for {}: {}", report.item, ec.message());
                report.errors.push_back("Unable to create " + parent.string() + ": " + ec.message());
                return;
            }
        }

        fs::create_symlink(target, source, ec);
        if (ec)
        {
            spdlog::error("Error creating symlink for {}: {}", report.item, ec.message());
            report.errors.push_back("Unable to link " + source.string() + ": " + ec.message());
            return;
        }
        report.linked = true;
        spdlog::info("Created symlink for {}.", report.item);
    }

} // namespace gotfiles
