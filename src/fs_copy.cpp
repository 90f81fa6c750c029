#include "gotfiles/fs_copy.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace gotfiles::fsutil
{
    namespace
    {
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        GotfilesError io_error(const std::string &what, const fs::path &p, const std::error_code &ec)
        {
            return GotfilesError::io(what + " " + p.string() + ": " + ec.message());
        }

        Result<void> copy_directory(const fs::path &src, const fs::path &dst)
        {
            if (auto made = create_directories_like(dst, src); !made)
                return made;

            std::error_code ec;
            std::vector<fs::directory_entry> entries;
            for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec))
                entries.push_back(*it);
            if (ec)
                return std::unexpected(io_error("Unable to read directory", src, ec));

            // deterministic order so the first failure is reproducible
            std::sort(entries.begin(), entries.end(),
                      [](const fs::directory_entry &a, const fs::directory_entry &b)
                      { return a.path().filename() < b.path().filename(); });

            for (const auto &entry : entries)
            {
                const fs::path target = dst / entry.path().filename();
                // symlink_status: a link to a directory is copied as a file
                auto st = entry.symlink_status(ec);
                if (ec)
                    return std::unexpected(io_error("Unable to stat", entry.path(), ec));

                auto copied = fs::is_directory(st) ? copy_directory(entry.path(), target)
                                                   : fsutil::copy_file(entry.path(), target);
                if (!copied)
                    return copied;
            }
            return {};
        }
    } // namespace

    Result<void> create_directories_like(const fs::path &dir, const fs::path &attributes_from)
    {
        std::error_code ec;
        if (fs::is_directory(dir, ec))
            return {};

        const fs::path parent = dir.parent_path();
        if (!parent.empty() && parent != dir)
        {
            if (auto made = create_directories_like(parent, attributes_from); !made)
                return made;
        }

        fs::create_directory(dir, attributes_from, ec);
        if (ec)
            return std::unexpected(io_error("Unable to create directory", dir, ec));
        return {};
    }

    Result<void> copy_file(const fs::path &src, const fs::path &dst)
    {
        std::error_code ec;
        if (fs::is_directory(src, ec))
            return std::unexpected(GotfilesError::io("Unable to copy " + src.string() + ": is a directory"));

        std::ifstream in(src, std::ios::binary);
        if (!in.is_open())
            return std::unexpected(GotfilesError::io("Unable to open " + src.string() + " for reading"));

        const fs::path parent = dst.parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent, ec);
            if (ec)
                return std::unexpected(io_error("Unable to create directory", parent, ec));
        }

        std::ofstream out(dst, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return std::unexpected(GotfilesError::io("Unable to open " + dst.string() + " for writing"));

        std::array<char, kCopyBufferSize> buffer;
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize n = in.gcount();
            if (n > 0 && !out.write(buffer.data(), n))
                return std::unexpected(GotfilesError::io("Write failed for " + dst.string()));
        }
        if (in.bad())
            return std::unexpected(GotfilesError::io("Read failed for " + src.string()));

        out.close();
        if (!out)
            return std::unexpected(GotfilesError::io("Write failed for " + dst.string()));
        return {};
    }

    Result<void> copy_path(const fs::path &src, const fs::path &dst)
    {
        std::error_code ec;
        auto st = fs::status(src, ec);
        if (ec)
            return std::unexpected(io_error("Unable to stat", src, ec));

        if (fs::is_directory(st))
            return copy_directory(src, dst);
        return fsutil::copy_file(src, dst);
    }

} // namespace gotfiles::fsutil
