#include "test_utils.h"

using namespace fanmv;

namespace {

bool parse_command_line(fanmv_program_options& options, std::vector<std::string> args) {
    CLI::App app("test", "fanmv");
    options.add_options(app);

    std::vector<char*> argv;
    for (std::string& arg : args) {
        argv.push_back(arg.data());
    }
    try {
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError&) {
        return false;
    }
    return options.post_process();
}

void test_host_path_local() {
    host_path hp;
    assert(hp.parse("/mnt/disk0"));
    assert(!hp.is_remote());
    assert(!hp.user.has_value());
    assert(hp.path == "/mnt/disk0");
    assert(hp.to_string() == "/mnt/disk0");

    assert(hp.parse("relative/dir"));
    assert(!hp.is_remote());
    assert(hp.path == "relative/dir");
}

void test_host_path_remote() {
    host_path hp;
    assert(hp.parse("storage01:/data/incoming"));
    assert(hp.is_remote());
    assert(hp.host.value() == "storage01");
    assert(!hp.user.has_value());
    assert(hp.path == "/data/incoming");

    assert(hp.parse("backup@10.0.0.7:/srv/drop"));
    assert(hp.user.value() == "backup");
    assert(hp.host.value() == "10.0.0.7");
    assert(hp.to_string() == "backup@10.0.0.7:/srv/drop");

    assert(hp.parse("[::1]:/tmp/x"));
    assert(hp.host.value() == "[::1]");
    assert(hp.path == "/tmp/x");
}

void test_host_path_invalid() {
    host_path hp;
    assert(!hp.parse(""));
}

void test_command_line_defaults() {
    fanmv_program_options options;
    assert(parse_command_line(options, { "fanmv", "-s", "/incoming", "-d", "/mnt/a", "-d", "host:/mnt/b" }));

    assert(options.sources.size() == 1);
    assert(options.sources[0] == stdfs::path("/incoming"));
    assert(options.arg_destinations.size() == 2);
    assert(!options.arg_destinations[0].is_remote());
    assert(options.arg_destinations[1].is_remote());

    assert(!options.arg_shuffle);
    assert(!options.arg_global_lock);
    assert(!options.arg_per_source_lock);
    assert(!options.arg_bwlimit.has_value());
    assert(!options.arg_ionice_class.has_value());
    assert(options.short_backoff == std::chrono::seconds(10));
    assert(options.long_backoff == std::chrono::seconds(300));
    assert(options.arg_escalate_after == 5);
    assert(options.arg_rsync == "rsync");
}

void test_command_line_everything() {
    fanmv_program_options options;
    assert(parse_command_line(options, {
        "fanmv", "-s", "/in/a", "--source", "/in/b", "-d", "/mnt/a",
        "--shuffle", "--bwlimit", "50M", "--ionice", "3",
        "--global-lock", "--per-source-lock",
        "--short-backoff", "1.5", "--long-backoff", "60", "--escalate-after", "0",
        "--probe-file", "/etc/hostname", "--rsync", "/usr/local/bin/rsync",
    }));

    assert(options.sources.size() == 2);
    assert(options.arg_shuffle);
    assert(options.arg_bwlimit.value() == "50M");
    assert(options.arg_ionice_class.value() == "3");
    assert(options.arg_global_lock);
    assert(options.arg_per_source_lock);
    assert(options.short_backoff == std::chrono::milliseconds(1500));
    assert(options.long_backoff == std::chrono::seconds(60));
    assert(options.arg_escalate_after == 0);
    assert(options.arg_probe_file.value() == "/etc/hostname");
    assert(options.arg_rsync == "/usr/local/bin/rsync");
}

void test_command_line_rejected() {
    {
        fanmv_program_options options;
        assert(!parse_command_line(options, { "fanmv", "-d", "/mnt/a" }));  // no source
    }
    {
        fanmv_program_options options;
        assert(!parse_command_line(options, { "fanmv", "-s", "/in" }));  // no destination
    }
    {
        fanmv_program_options options;
        assert(!parse_command_line(options, {
            "fanmv", "-s", "/in", "-d", "/mnt/a", "--short-backoff", "30", "--long-backoff", "10" }));
    }
    {
        fanmv_program_options options;
        assert(!parse_command_line(options, { "fanmv", "-s", "/in", "-d", "/mnt/a", "--short-backoff", "0" }));
    }
    {
        fanmv_program_options options;
        assert(!parse_command_line(options, { "fanmv", "-s", "/in", "-d", "/mnt/a", "--long-backoff", "1e300" }));
    }
    {
        // Set without the command line: too large to count in milliseconds
        fanmv_program_options options;
        options.arg_sources.push_back("/in");
        host_path dest;
        assert(dest.parse("/mnt/a"));
        options.arg_destinations.push_back(dest);
        options.arg_short_backoff_seconds = 1e300;
        options.arg_long_backoff_seconds = 1e300;
        assert(!options.post_process());

        options.arg_short_backoff_seconds = 1;
        options.arg_long_backoff_seconds = program_options_defaults::MAX_BACKOFF_SECONDS;
        assert(options.post_process());
        assert(options.long_backoff == std::chrono::hours(24));
    }
}

void test_config_file() {
    test::temp_dir dir("options");
    const stdfs::path config = dir.path / "fanmv.ini";
    {
        std::ofstream ofs(config);
        ofs << "source=/in/from_config\n"
            << "dest=/mnt/from_config\n"
            << "global-lock=true\n";
    }

    fanmv_program_options options;
    assert(parse_command_line(options, { "fanmv", "-c", config.string() }));
    assert(options.sources.size() == 1);
    assert(options.sources[0] == stdfs::path("/in/from_config"));
    assert(options.arg_destinations.size() == 1);
    assert(options.arg_destinations[0].path == "/mnt/from_config");
    assert(options.arg_global_lock);
}

} // namespace

int main() {
    [[maybe_unused]] const infra::global_initialize_finalize_t init_fin;

    test_host_path_local();
    test_host_path_remote();
    test_host_path_invalid();
    test_command_line_defaults();
    test_command_line_everything();
    test_command_line_rejected();
    test_config_file();
    return 0;
}
