#if !defined(_FANMV_DESTINATION_H_INCLUDED_)
#define _FANMV_DESTINATION_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    struct destination
    {
    public:
        host_path target { };

        // Only local destinations can be checked for mount and free space
        [[nodiscard]]
        bool is_local() const noexcept { return !target.is_remote(); }

        [[nodiscard]]
        std::string to_string() const { return target.to_string(); }
    };


    //
    // Questions a destination worker asks the filesystem before a transfer.
    // Every method may throw std::system_error (std::filesystem::filesystem_error
    // included) when the answer can't be found out.
    //
    struct filesystem_probe
    {
    public:
        virtual ~filesystem_probe() noexcept = default;

        virtual bool exists(const stdfs::path& path) = 0;
        virtual bool is_mount_point(const stdfs::path& path) = 0;
        virtual uint64_t free_space(const stdfs::path& path) = 0;
        virtual uint64_t file_size(const stdfs::path& path) = 0;
    };


    //
    // free_space() of a path that doesn't exist yet is the free space of its
    // nearest existing ancestor.
    //
    struct local_filesystem_probe : filesystem_probe
    {
    public:
        bool exists(const stdfs::path& path) override;
        bool is_mount_point(const stdfs::path& path) override;
        uint64_t free_space(const stdfs::path& path) override;
        uint64_t file_size(const stdfs::path& path) override;
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_DESTINATION_H_INCLUDED_)
