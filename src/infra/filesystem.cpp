#include "infra.h"


bool infra::is_mount_point(const stdfs::path& path)
{
    struct stat64 st { };
    if (lstat64(path.c_str(), &st) != 0) {
        const int err = errno;
        LOG_DEBUG("lstat64() {} failed. errno = {} ({})", path.c_str(), err, strerror(err));
        THROW_SYSTEM_ERROR(err, lstat64);
    }

    if (S_ISLNK(st.st_mode)) {
        return false;
    }
    if (!S_ISDIR(st.st_mode)) {
        return false;
    }

    const stdfs::path parent = path / "..";
    struct stat64 parent_st { };
    if (lstat64(parent.c_str(), &parent_st) != 0) {
        const int err = errno;
        LOG_DEBUG("lstat64() {} failed. errno = {} ({})", parent.c_str(), err, strerror(err));
        THROW_SYSTEM_ERROR(err, lstat64);
    }

    if (st.st_dev != parent_st.st_dev) {
        return true;
    }
    if (st.st_ino == parent_st.st_ino) {
        return true;
    }
    return false;
}


uint64_t infra::get_free_space(const stdfs::path& path)
{
    struct statvfs64 vfs { };
    if (statvfs64(path.c_str(), &vfs) != 0) {
        const int err = errno;
        LOG_DEBUG("statvfs64() {} failed. errno = {} ({})", path.c_str(), err, strerror(err));
        THROW_SYSTEM_ERROR(err, statvfs64);
    }

    return static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);
}


bool infra::walk_directory_tree(
    const stdfs::path& dir,
    const std::function<void(const stdfs::directory_entry&)>& visit,
    std::error_code& ec)
{
    ec.clear();

    std::vector<stdfs::path> pending { dir };
    bool is_top = true;
    while (!pending.empty()) {
        const stdfs::path current = std::move(pending.back());
        pending.pop_back();

        std::error_code list_ec;
        stdfs::directory_iterator it(current, stdfs::directory_options::skip_permission_denied, list_ec);
        if (list_ec) {
            if (is_top) {
                ec = list_ec;
                return false;
            }
            LOG_WARN("Can't list {} (skipped): {}", current.string(), list_ec.message());
            continue;
        }
        is_top = false;

        for (const stdfs::directory_iterator end { }; it != end; it.increment(list_ec)) {
            const stdfs::directory_entry& entry = *it;
            visit(entry);

            std::error_code type_ec;
            if (entry.is_symlink(type_ec) || type_ec) {
                continue;
            }
            if (entry.is_directory(type_ec)) {
                pending.push_back(entry.path());
            }
        }

        // The iterator is at its end after an error: only this directory's remaining entries are lost
        if (list_ec) {
            LOG_WARN("Listing {} stopped early: {}", current.string(), list_ec.message());
        }
    }

    return true;
}
