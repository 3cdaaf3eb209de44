#include "common.h"

namespace fanmv
{
    //--------------------------------------------------------------------------
    // struct transfer_result
    //--------------------------------------------------------------------------
    std::string transfer_result::output() const
    {
        std::string result = stdout_text;
        if (!stderr_text.empty()) {
            if (!result.empty() && result.back() != '\n') {
                result += '\n';
            }
            result += stderr_text;
        }

        const size_t first = result.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::string();
        }
        const size_t last = result.find_last_not_of(" \t\r\n");
        return result.substr(first, last - first + 1);
    }


    //--------------------------------------------------------------------------
    // struct rsync_transfer
    //--------------------------------------------------------------------------
    std::vector<std::string> rsync_transfer::build_command_line(
        const stdfs::path& source,
        const host_path& destination,
        const transfer_options& options) const
    {
        std::vector<std::string> argv;

        if (options.ionice_class.has_value()) {
            argv.emplace_back(IONICE_EXECUTABLE);
            argv.emplace_back("-c");
            argv.push_back(options.ionice_class.value());
        }

        argv.push_back(_rsync_executable);
        if (options.remove_source) {
            argv.emplace_back("--remove-source-files");
        }
        if (options.preallocate) {
            argv.emplace_back("--preallocate");
        }
        if (options.whole_file) {
            argv.emplace_back("--whole-file");
        }
        if (options.bwlimit.has_value()) {
            argv.push_back("--bwlimit=" + options.bwlimit.value());
        }

        argv.push_back(source.string());

        // Trailing slash: always copy INTO the destination directory (rsync creates it if missing)
        std::string dst = destination.to_string();
        if (dst.empty() || dst.back() != '/') {
            dst += '/';
        }
        argv.push_back(std::move(dst));

        return argv;
    }

    transfer_result rsync_transfer::transfer(
        const stdfs::path& source,
        const host_path& destination,
        const transfer_options& options) /*override*/
    {
        const std::vector<std::string> argv = build_command_line(source, destination, options);
        LOG_DEBUG("Run: {}", infra::join_command_line(argv));

        infra::process_result proc = infra::run_process(argv);

        transfer_result result;
        result.exit_status = proc.exit_status;
        result.stdout_text = std::move(proc.stdout_text);
        result.stderr_text = std::move(proc.stderr_text);
        result.elapsed = proc.elapsed;
        return result;
    }

}  // namespace fanmv
