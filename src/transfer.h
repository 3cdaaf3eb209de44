#if !defined(_FANMV_TRANSFER_H_INCLUDED_)
#define _FANMV_TRANSFER_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)

namespace fanmv
{
    struct transfer_options
    {
    public:
        bool remove_source = false;
        bool preallocate = false;
        bool whole_file = false;

        // Passed through as-is
        std::optional<std::string> bwlimit { };
        std::optional<std::string> ionice_class { };
    };

    struct transfer_result
    {
    public:
        int exit_status = -1;
        std::string stdout_text { };
        std::string stderr_text { };
        std::chrono::steady_clock::duration elapsed { };

    public:
        [[nodiscard]]
        bool succeeded() const noexcept { return exit_status == 0; }

        // stdout and stderr joined, surrounding whitespace trimmed
        [[nodiscard]]
        std::string output() const;
    };


    //
    // Moves the bytes of one file to a destination.
    // With remove_source set, the source is gone once a zero exit status is
    // returned. Implementations may be called concurrently from several
    // destination workers.
    //
    struct transfer_capability
    {
    public:
        virtual ~transfer_capability() noexcept = default;

        // Throws std::system_error if the transfer can't be started at all
        virtual transfer_result transfer(
            const stdfs::path& source,
            const host_path& destination,
            const transfer_options& options) = 0;
    };


    struct rsync_transfer : transfer_capability
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(rsync_transfer)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(rsync_transfer)

        explicit rsync_transfer(std::string rsync_executable)
            : _rsync_executable(std::move(rsync_executable))
        { }

        transfer_result transfer(
            const stdfs::path& source,
            const host_path& destination,
            const transfer_options& options) override;

        [[nodiscard]]
        std::vector<std::string> build_command_line(
            const stdfs::path& source,
            const host_path& destination,
            const transfer_options& options) const;

    private:
        static constexpr const char IONICE_EXECUTABLE[] = "ionice";

        const std::string _rsync_executable;
    };

}  // namespace fanmv

#endif  // !defined(_FANMV_TRANSFER_H_INCLUDED_)
