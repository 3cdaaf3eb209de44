#include "common.h"


//==============================================================================
// struct local_filesystem_probe
//==============================================================================

bool fanmv::local_filesystem_probe::exists(const stdfs::path& path) /*override*/
{
    return stdfs::exists(path);
}

bool fanmv::local_filesystem_probe::is_mount_point(const stdfs::path& path) /*override*/
{
    return infra::is_mount_point(path);
}

uint64_t fanmv::local_filesystem_probe::free_space(const stdfs::path& path) /*override*/
{
    // rsync creates a missing destination directory: measure the filesystem it will be created on
    stdfs::path existing = stdfs::absolute(path);
    while (!stdfs::exists(existing) && existing.has_relative_path()) {
        existing = existing.parent_path();
    }
    if (existing != path) {
        LOG_DEBUG("{} doesn't exist, measuring free space on {}", path.string(), existing.string());
    }
    return infra::get_free_space(existing);
}

uint64_t fanmv::local_filesystem_probe::file_size(const stdfs::path& path) /*override*/
{
    return static_cast<uint64_t>(stdfs::file_size(path));
}
