#include "common.h"


//==============================================================================
// struct host_path
//==============================================================================

bool fanmv::host_path::parse(const std::string& value)
{
    // Handle strings like:
    //  "relative"
    //  "relative/subpath"
    //  "/absolute/path"
    //  "hostname:/"
    //  "hostname:/absolute"
    //  "user@hostname:/absolute"
    //  "127.0.0.1:/mnt/disk0"
    //  "[::1]:/absolute"
    //  "[1:2:3:4:5:6:7:8]:/absolute"
    //
    // NOTE:
    //  Local path might be absolute or relative
    //  Remote path is passed to rsync as-is


    // See:
    //  https://stackoverflow.com/questions/53497/regular-expression-that-matches-valid-ipv6-addresses
    //  https://stackoverflow.com/questions/106179/regular-expression-to-match-dns-hostname-or-ip-address
    // NOTE: re_valid_hostname matches a superset of valid IPv4

    static const std::regex __re = []() {
        const std::string re_valid_hostname = R"((?:(?:(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9\-]*[a-zA-Z0-9])\.)*(?:[A-Za-z0-9]|[A-Za-z0-9][A-Za-z0-9\-]*[A-Za-z0-9])))";
        const std::string re_valid_ipv6 = R"((?:\[(?:(?:[0-9a-fA-F]{1,4}:){7,7}[0-9a-fA-F]{1,4}|(?:[0-9a-fA-F]{1,4}:){1,7}:|(?:[0-9a-fA-F]{1,4}:){1,6}:[0-9a-fA-F]{1,4}|(?:[0-9a-fA-F]{1,4}:){1,5}(?::[0-9a-fA-F]{1,4}){1,2}|(?:[0-9a-fA-F]{1,4}:){1,4}(?::[0-9a-fA-F]{1,4}){1,3}|(?:[0-9a-fA-F]{1,4}:){1,3}(?::[0-9a-fA-F]{1,4}){1,4}|(?:[0-9a-fA-F]{1,4}:){1,2}(?::[0-9a-fA-F]{1,4}){1,5}|[0-9a-fA-F]{1,4}:(?:(?::[0-9a-fA-F]{1,4}){1,6})|:(?:(?::[0-9a-fA-F]{1,4}){1,7}|:)|::(?:[Ff]{4}(?::0{1,4})?:)?(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\.){3,3}(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])|(?:[0-9a-fA-F]{1,4}:){1,4}:(?:(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9])\.){3,3}(?:25[0-5]|(?:2[0-4]|1?[0-9])?[0-9]))\]))";
        const std::string re_valid_host = "(?:" + re_valid_hostname + "|" + re_valid_ipv6 + ")";
        const std::string re_valid_host_path = "^(?:(?:([^@:/]+)@)?(" + re_valid_host + "):)?(.+)$";
        return std::regex(re_valid_host_path, std::regex::optimize);
    }();

    if (value.empty()) return false;

    std::smatch match;
    if (!std::regex_match(value, match, __re)) {
        return false;
    }

    {
        // The user part
        std::string tmp(match[1].str());
        if (tmp.empty())
            user.reset();
        else
            user = std::move(tmp);
    }

    {
        // The host part
        // NOTE: If host is IPv6 surrounded by '[' ']', DO NOT trim the beginning '[' and ending ']'
        std::string tmp(match[2].str());
        if (tmp.empty())
            host.reset();
        else
            host = std::move(tmp);
    }

    path = match[3].str();
    if (path.empty()) return false;

    if (user.has_value() && !host.has_value()) {
        return false;
    }

    return true;
}

std::string fanmv::host_path::to_string() const
{
    if (!host.has_value()) {
        return path;
    }

    std::string result;
    if (user.has_value()) {
        result += user.value();
        result += '@';
    }
    result += host.value();
    result += ':';
    result += path;
    return result;
}



//==============================================================================
// struct base_program_options
//==============================================================================

void fanmv::base_program_options::add_options(CLI::App& app)
{
    app.add_flag_function(
        "-V,--version",
        [&](const std::int64_t /*count*/) {
            printf("Version %d.%d.%d\n",
                FANMV_VERSION_MAJOR, FANMV_VERSION_MINOR, FANMV_VERSION_PATCH);
            exit(0);
        },
        "Print version and exit");

    app.add_flag_function(
        "-q,--quiet",
        [&](const std::int64_t count) { this->arg_verbosity -= static_cast<int>(count); },
        "Be more quiet");

    app.add_flag_function(
        "-v,--verbose",
        [&](const std::int64_t count) { this->arg_verbosity += static_cast<int>(count); },
        "Be more verbose");

    app.set_config(
        "-c,--config",
        "",
        "Read options from this TOML/INI file");
}

bool fanmv::base_program_options::post_process()
{
    // Set verbosity
    infra::set_logging_verbosity(this->arg_verbosity);

    return true;
}



//==============================================================================
// struct fanmv_program_options
//==============================================================================

void fanmv::fanmv_program_options::add_options(CLI::App& app)
{
    base_program_options::add_options(app);

    CLI::Option* opt_source = app.add_option(
        "-s,--source",
        this->arg_sources,
        "Source directory to pick up new files from (repeatable)");
    opt_source->type_name("<dir>");
    opt_source->required();

    CLI::Option* opt_dest = app.add_option(
        "-d,--dest",
        this->arg_destinations,
        "Destination to move files to: local path or [user@]host:path (repeatable)");
    opt_dest->type_name("<dest>");
    opt_dest->required();

    app.add_flag(
        "--shuffle",
        this->arg_shuffle,
        "Shuffle destination order at startup");

    CLI::Option* opt_bwlimit = app.add_option(
        "--bwlimit",
        this->arg_bwlimit,
        "Bandwidth limit passed to rsync --bwlimit");
    opt_bwlimit->type_name("<rate>");

    CLI::Option* opt_ionice = app.add_option(
        "--ionice",
        this->arg_ionice_class,
        "Run transfers under ionice with this scheduling class");
    opt_ionice->type_name("<class>");

    app.add_flag(
        "--global-lock",
        this->arg_global_lock,
        "Allow only one transfer at a time across all destinations");

    app.add_flag(
        "--per-source-lock",
        this->arg_per_source_lock,
        "Allow only one transfer at a time per source directory");

    CLI::Option* opt_short_backoff = app.add_option(
        "--short-backoff",
        this->arg_short_backoff_seconds,
        "Seconds to wait before retrying after a recoverable failure");
    opt_short_backoff->type_name("<sec>");
    opt_short_backoff->check(CLI::PositiveNumber);
    opt_short_backoff->check(CLI::Range(0.0, program_options_defaults::MAX_BACKOFF_SECONDS));

    CLI::Option* opt_long_backoff = app.add_option(
        "--long-backoff",
        this->arg_long_backoff_seconds,
        "Seconds to wait once a destination stayed unmounted for a while");
    opt_long_backoff->type_name("<sec>");
    opt_long_backoff->check(CLI::PositiveNumber);
    opt_long_backoff->check(CLI::Range(0.0, program_options_defaults::MAX_BACKOFF_SECONDS));

    CLI::Option* opt_escalate = app.add_option(
        "--escalate-after",
        this->arg_escalate_after,
        "Unmounted retries before switching to the long backoff (0: never)");
    opt_escalate->type_name("<count>");

    CLI::Option* opt_probe = app.add_option(
        "--probe-file",
        this->arg_probe_file,
        "Small file sent to a destination to check connectivity before each transfer");
    opt_probe->type_name("<file>");

    CLI::Option* opt_rsync = app.add_option(
        "--rsync",
        this->arg_rsync,
        "rsync executable");
    opt_rsync->type_name("<path>");
}

bool fanmv::fanmv_program_options::post_process()
{
    if (!base_program_options::post_process()) {
        return false;
    }

    //----------------------------------------------------------------
    // arg_sources
    //----------------------------------------------------------------
    if (arg_sources.empty()) {
        LOG_ERROR("No source directory specified");
        return false;
    }

    sources.clear();
    for (const std::string& src : arg_sources) {
        if (src.empty()) {
            LOG_ERROR("Empty source directory is invalid");
            return false;
        }
        sources.emplace_back(src);
        LOG_DEBUG("Source directory: {}", src);
    }


    //----------------------------------------------------------------
    // arg_destinations
    //----------------------------------------------------------------
    if (arg_destinations.empty()) {
        LOG_ERROR("No destination specified");
        return false;
    }

    for (const host_path& dest : arg_destinations) {
        if (dest.is_remote()) {
            LOG_DEBUG("Destination: remote host {} path {}", dest.host.value(), dest.path);
        }
        else {
            LOG_DEBUG("Destination: local path {}", dest.path);
        }
    }


    //----------------------------------------------------------------
    // arg_short_backoff_seconds, arg_long_backoff_seconds
    //----------------------------------------------------------------
    if (!(arg_short_backoff_seconds > 0)) {
        LOG_ERROR("Short backoff must be positive: {}", arg_short_backoff_seconds);
        return false;
    }
    if (!(arg_long_backoff_seconds <= program_options_defaults::MAX_BACKOFF_SECONDS)) {
        LOG_ERROR("Long backoff can't exceed {} seconds: {}",
                  program_options_defaults::MAX_BACKOFF_SECONDS, arg_long_backoff_seconds);
        return false;
    }
    if (arg_long_backoff_seconds < arg_short_backoff_seconds) {
        LOG_ERROR("Long backoff {} is shorter than short backoff {}", arg_long_backoff_seconds, arg_short_backoff_seconds);
        return false;
    }

    short_backoff = std::chrono::milliseconds(static_cast<int64_t>(arg_short_backoff_seconds * 1000));
    long_backoff = std::chrono::milliseconds(static_cast<int64_t>(arg_long_backoff_seconds * 1000));
    if (short_backoff.count() == 0) {
        short_backoff = std::chrono::milliseconds(1);
    }
    if (long_backoff < short_backoff) {
        long_backoff = short_backoff;
    }
    LOG_TRACE("Backoff: short {} ms, long {} ms after {} unmounted retries",
              short_backoff.count(), long_backoff.count(), arg_escalate_after);


    //----------------------------------------------------------------
    // arg_bwlimit, arg_ionice_class
    //----------------------------------------------------------------
    if (arg_bwlimit.has_value() && arg_bwlimit->empty()) {
        arg_bwlimit.reset();
    }
    if (arg_ionice_class.has_value() && arg_ionice_class->empty()) {
        arg_ionice_class.reset();
    }


    //----------------------------------------------------------------
    // arg_rsync
    //----------------------------------------------------------------
    if (arg_rsync.empty()) {
        LOG_ERROR("rsync executable can't be empty");
        return false;
    }

    if (arg_global_lock) {
        LOG_DEBUG("Global lock enabled: one transfer at a time");
    }
    if (arg_per_source_lock) {
        LOG_DEBUG("Per-source lock enabled: one transfer at a time per source directory");
    }

    return true;
}
