#include "test_utils.h"

using namespace fanmv;

namespace {

host_path make_host_path(const std::string& value) {
    host_path hp;
    const bool parsed = hp.parse(value);
    assert(parsed);
    return hp;
}

void test_move_command_line() {
    rsync_transfer rsync("rsync");

    transfer_options options;
    options.remove_source = true;
    options.preallocate = true;
    options.whole_file = true;

    const std::vector<std::string> argv = rsync.build_command_line(
        "/in/postdata_1.bin", make_host_path("/mnt/disk0"), options);
    const std::vector<std::string> expected {
        "rsync", "--remove-source-files", "--preallocate", "--whole-file", "/in/postdata_1.bin", "/mnt/disk0/" };
    assert(argv == expected);
}

void test_probe_command_line_with_limits() {
    rsync_transfer rsync("/opt/rsync/bin/rsync");

    transfer_options options;
    options.whole_file = true;
    options.bwlimit = "20M";
    options.ionice_class = "3";

    const std::vector<std::string> argv = rsync.build_command_line(
        "/tmp/probe", make_host_path("backup@store:/data/"), options);
    const std::vector<std::string> expected {
        "ionice", "-c", "3", "/opt/rsync/bin/rsync", "--whole-file", "--bwlimit=20M", "/tmp/probe", "backup@store:/data/" };
    assert(argv == expected);
}

void test_output_joins_streams() {
    transfer_result result;
    assert(result.output().empty());
    assert(!result.succeeded());

    result.exit_status = 0;
    result.stdout_text = "  sent 10 bytes\n";
    result.stderr_text = "warning: something\n\n";
    assert(result.succeeded());
    assert(result.output() == "sent 10 bytes\nwarning: something");
}

// A stand-in executable with rsync's calling convention, to run the real capability end to end
void test_runs_executable(const stdfs::path& work) {
    const stdfs::path fake = work / "fake-rsync";
    {
        std::ofstream ofs(fake);
        ofs << "#!/bin/sh\n"
            << "echo \"args: $*\"\n"
            << "case \"$*\" in *fail*) echo 'rsync error: some files could not be transferred' 1>&2; exit 23;; esac\n"
            << "exit 0\n";
    }
    stdfs::permissions(fake, stdfs::perms::owner_all);

    rsync_transfer rsync(fake.string());
    transfer_options options;
    options.whole_file = true;

    const transfer_result ok = rsync.transfer("/in/postdata_ok.bin", make_host_path("/mnt/a"), options);
    assert(ok.succeeded());
    assert(ok.output() == "args: --whole-file /in/postdata_ok.bin /mnt/a/");

    const transfer_result failed = rsync.transfer("/in/postdata_fail.bin", make_host_path("/mnt/a"), options);
    assert(failed.exit_status == 23);
    assert(failed.output().find("rsync error") != std::string::npos);
}

void test_missing_executable_throws() {
    rsync_transfer rsync("/nonexistent/rsync");
    bool thrown = false;
    try {
        (void)rsync.transfer("/in/postdata_1.bin", make_host_path("/mnt/a"), transfer_options());
    }
    catch (const std::system_error&) {
        thrown = true;
    }
    assert(thrown);
}

} // namespace

int main() {
    [[maybe_unused]] const infra::global_initialize_finalize_t init_fin;

    test_move_command_line();
    test_probe_command_line_with_limits();
    test_output_joins_streams();
    {
        test::temp_dir work("transfer");
        test_runs_executable(work.path);
    }
    test_missing_executable_throws();
    return 0;
}
