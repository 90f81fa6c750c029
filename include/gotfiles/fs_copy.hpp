#pragma once

#include "types.hpp"
#include <filesystem>

namespace gotfiles::fsutil
{
    /**
     * Copy the bytes of a single file. Missing parent directories of dst are
     * created with default permissions and an existing dst is truncated. The
     * new file gets default permissions, not the source's.
     */
    Result<void> copy_file(const std::filesystem::path &src, const std::filesystem::path &dst);

    /**
     * Copy a file or a whole directory tree. Directories are created with the
     * permission bits of the source directory; entries that are not
     * directories (symlinks included) are copied by content. Stops at the
     * first failure.
     */
    Result<void> copy_path(const std::filesystem::path &src, const std::filesystem::path &dst);

    /**
     * Create dir and any missing ancestors, each with the permission bits of
     * attributes_from. Existing directories are left as they are.
     */
    Result<void> create_directories_like(const std::filesystem::path &dir,
                                         const std::filesystem::path &attributes_from);

} // namespace gotfiles::fsutil
