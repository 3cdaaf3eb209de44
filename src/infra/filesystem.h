#if !defined(_FANMV_INFRA_FILESYSTEM_H_INCLUDED_)
#define _FANMV_INFRA_FILESYSTEM_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // A path is a mount point if it is a directory living on a different
    // device than its parent, or if it is the same inode as its parent (/).
    // A symbolic link is never a mount point.
    // Throws std::system_error if the path (or its parent) can't be stat'ed.
    //
    bool is_mount_point(const stdfs::path& path);

    // Bytes available to an unprivileged user. Throws std::system_error.
    uint64_t get_free_space(const stdfs::path& path);

    //
    // Calls visit() on every entry below dir, depth first. Symbolic links to
    // directories are not followed.
    // A subdirectory that can't be listed (removed meanwhile, permission denied)
    // is logged and skipped; its siblings are still walked.
    // Returns false with ec set only if dir itself can't be listed.
    //
    bool walk_directory_tree(
        const stdfs::path& dir,
        const std::function<void(const stdfs::directory_entry&)>& visit,
        std::error_code& ec);

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_FILESYSTEM_H_INCLUDED_)
