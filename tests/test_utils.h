#if !defined(_FANMV_TESTS_TEST_UTILS_H_INCLUDED_)
#define _FANMV_TESTS_TEST_UTILS_H_INCLUDED_

#include "common.h"

#undef NDEBUG
#include <cassert>


namespace fanmv::test
{
    //
    // A fresh directory under the system temp directory, removed with everything in it
    //
    class temp_dir
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(temp_dir)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(temp_dir)

        explicit temp_dir(const std::string& tag)
        {
            static std::atomic_int __counter { 0 };
            path = stdfs::temp_directory_path() /
                ("fanmv_test_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(++__counter));
            stdfs::remove_all(path);
            stdfs::create_directories(path);
        }

        ~temp_dir()
        {
            std::error_code ec;
            stdfs::remove_all(path, ec);
        }

        stdfs::path path;
    };


    inline void write_file(const stdfs::path& path, const size_t size, const char fill = 'x')
    {
        stdfs::create_directories(path.parent_path());
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        const std::string data(size, fill);
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.close();
        assert(ofs);
    }

    template<typename TPred>
    bool wait_for_condition(TPred pred, const std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    // Options with short backoffs, already post_process()ed
    inline std::shared_ptr<fanmv_program_options> make_options(
        const std::vector<stdfs::path>& sources,
        const std::vector<std::string>& destinations)
    {
        std::shared_ptr<fanmv_program_options> options = std::make_shared<fanmv_program_options>();
        for (const stdfs::path& src : sources) {
            options->arg_sources.push_back(src.string());
        }
        for (const std::string& dest : destinations) {
            host_path hp;
            const bool parsed = hp.parse(dest);
            assert(parsed);
            options->arg_destinations.push_back(hp);
        }
        options->arg_short_backoff_seconds = 0.02;
        options->arg_long_backoff_seconds = 0.2;
        options->arg_escalate_after = 3;

        const bool processed = options->post_process();
        assert(processed);
        return options;
    }


    //
    // Transfer capability that moves files with the filesystem instead of rsync,
    // and records what it was asked to do.
    //
    class recording_transfer : public transfer_capability
    {
    public:
        struct call
        {
            stdfs::path source;
            std::string destination;
            bool remove_source;
        };

        transfer_result transfer(
            const stdfs::path& source,
            const host_path& destination,
            const transfer_options& options) override
        {
            // Connectivity checks all share the probe file's directory: only real moves count per directory
            const std::string dir = options.remove_source ? source.parent_path().string() : std::string();
            {
                std::lock_guard<std::mutex> lock(_mutex);
                calls.push_back(call { source, destination.to_string(), options.remove_source });

                ++_active;
                max_active = std::max(max_active, _active);
                if (!dir.empty()) {
                    const int dir_active = ++_active_per_dir[dir];
                    max_active_per_dir = std::max(max_active_per_dir, dir_active);
                }
            }
            const infra::sweeper leave = [&]() {
                std::lock_guard<std::mutex> lock(_mutex);
                --_active;
                if (!dir.empty()) {
                    --_active_per_dir[dir];
                }
            };

            if (hold_time.count() > 0) {
                std::this_thread::sleep_for(hold_time);
            }

            transfer_result result;
            result.elapsed = hold_time;

            if (!options.remove_source) {
                const bool unreachable = fail_probe_destinations.count(destination.to_string()) > 0;
                result.exit_status = unreachable ? 255 : 0;
                if (unreachable) {
                    result.stderr_text = "ssh: connect to host: Connection refused";
                }
                return result;
            }

            std::error_code ec;
            const bool failing = fail_move_destinations.count(destination.to_string()) > 0;
            if (failing || !stdfs::exists(source, ec)) {
                result.exit_status = 23;
                result.stderr_text = "rsync: link_stat \"" + source.string() + "\" failed: No such file or directory (2)";
                return result;
            }

            const stdfs::path target_dir(destination.path);
            stdfs::create_directories(target_dir);
            stdfs::copy_file(source, target_dir / source.filename(), stdfs::copy_options::overwrite_existing);
            stdfs::remove(source);

            std::lock_guard<std::mutex> lock(_mutex);
            moved.push_back(source);
            result.exit_status = 0;
            return result;
        }

        [[nodiscard]]
        size_t move_count() const
        {
            std::lock_guard<std::mutex> lock(_mutex);
            return moved.size();
        }

        [[nodiscard]]
        size_t count_calls(const std::string& destination, const bool remove_source) const
        {
            std::lock_guard<std::mutex> lock(_mutex);
            size_t count = 0;
            for (const call& c : calls) {
                if (c.destination == destination && c.remove_source == remove_source) {
                    ++count;
                }
            }
            return count;
        }

    public:
        // Set before the workers start
        std::chrono::milliseconds hold_time { 0 };
        std::set<std::string> fail_probe_destinations { };
        std::set<std::string> fail_move_destinations { };

        // Guarded by _mutex
        std::vector<call> calls { };
        std::vector<stdfs::path> moved { };
        int max_active = 0;
        int max_active_per_dir = 0;

    private:
        mutable std::mutex _mutex { };
        int _active = 0;
        std::map<std::string, int> _active_per_dir { };
    };


    //
    // Filesystem probe with controllable mount state and free space.
    // File sizes come from the real file unless stale_file_size is set.
    // Sets and optionals are set before the workers start.
    //
    class mock_probe : public filesystem_probe
    {
    public:
        bool exists(const stdfs::path& path) override
        {
            std::error_code ec;
            return stdfs::exists(path, ec);
        }

        bool is_mount_point(const stdfs::path& /*path*/) override
        {
            ++mount_checks;
            return mounted;
        }

        uint64_t free_space(const stdfs::path& path) override
        {
            if (fail_free_space) {
                throw std::system_error(std::make_error_code(std::errc::io_error), "statvfs64() failed");
            }
            if (full_destinations.count(path.string()) > 0) {
                return 0;
            }
            return free_bytes;
        }

        uint64_t file_size(const stdfs::path& path) override
        {
            if (stale_file_size.has_value()) {
                return stale_file_size.value();
            }
            return static_cast<uint64_t>(stdfs::file_size(path));
        }

    public:
        std::atomic_bool mounted { true };
        std::atomic_uint64_t free_bytes { UINT64_MAX };
        std::optional<uint64_t> stale_file_size { };
        std::set<std::string> full_destinations { };
        std::atomic_bool fail_free_space { false };

        std::atomic_int mount_checks { 0 };
    };

}  // namespace fanmv::test


#endif  // !defined(_FANMV_TESTS_TEST_UTILS_H_INCLUDED_)
