#include "test_utils.h"

using namespace fanmv;

namespace {

void test_mount_point() {
    assert(infra::is_mount_point("/"));

    test::temp_dir dir("fs");
    const stdfs::path plain = dir.path / "plain";
    stdfs::create_directories(plain);
    assert(!infra::is_mount_point(plain));

    // A symlink to / is still not a mount point
    const stdfs::path link = dir.path / "link";
    stdfs::create_directory_symlink("/", link);
    assert(!infra::is_mount_point(link));
}

void test_missing_path_throws() {
    bool thrown = false;
    try {
        (void)infra::is_mount_point("/nonexistent/fanmv/dir");
    }
    catch (const std::system_error& ex) {
        thrown = true;
        assert(ex.code().value() == ENOENT);
    }
    assert(thrown);

    thrown = false;
    try {
        (void)infra::get_free_space("/nonexistent/fanmv/dir");
    }
    catch (const std::system_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_free_space() {
    test::temp_dir dir("fs");
    assert(infra::get_free_space(dir.path) > 0);
}

void test_local_probe() {
    test::temp_dir dir("fs");
    const stdfs::path file = dir.path / "postdata_1.bin";
    test::write_file(file, 1234);

    local_filesystem_probe probe;
    assert(probe.exists(file));
    assert(!probe.exists(dir.path / "postdata_2.bin"));
    assert(probe.file_size(file) == 1234);
    assert(probe.free_space(dir.path) > 0);
    assert(probe.is_mount_point("/"));

    // Not created yet: measured on the nearest existing ancestor
    assert(probe.free_space(dir.path / "not" / "yet") == infra::get_free_space(dir.path));

    bool thrown = false;
    try {
        (void)probe.file_size(dir.path / "postdata_2.bin");
    }
    catch (const stdfs::filesystem_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_walk_visits_whole_tree() {
    test::temp_dir dir("fs");
    test::write_file(dir.path / "a.bin", 1);
    test::write_file(dir.path / "x" / "b.bin", 1);
    test::write_file(dir.path / "x" / "y" / "c.bin", 1);
    stdfs::create_directory_symlink(dir.path / "x", dir.path / "link");

    std::set<stdfs::path> seen;
    std::error_code ec;
    const bool listed = infra::walk_directory_tree(dir.path, [&](const stdfs::directory_entry& entry) {
        seen.insert(entry.path());
    }, ec);
    assert(listed);
    assert(!ec);

    // The symlink is reported but not descended into
    const std::set<stdfs::path> expected {
        dir.path / "a.bin",
        dir.path / "x",
        dir.path / "x" / "b.bin",
        dir.path / "x" / "y",
        dir.path / "x" / "y" / "c.bin",
        dir.path / "link",
    };
    assert(seen == expected);
}

// A subdirectory removed between being listed and being opened doesn't end the walk
void test_walk_skips_vanished_subdirectory() {
    test::temp_dir dir("fs");
    for (const char* name : { "d1", "d2", "d3", "d4" }) {
        test::write_file(dir.path / name / "postdata_1.bin", 1);
    }

    stdfs::path removed;
    std::set<stdfs::path> files;
    std::error_code ec;
    const bool listed = infra::walk_directory_tree(dir.path, [&](const stdfs::directory_entry& entry) {
        if (entry.path().parent_path() == dir.path && removed.empty()) {
            removed = entry.path();
            stdfs::remove_all(removed);
            return;
        }
        if (entry.path().filename() == "postdata_1.bin") {
            files.insert(entry.path());
        }
    }, ec);

    assert(listed);
    assert(!removed.empty());
    assert(files.size() == 3);
    assert(files.count(removed / "postdata_1.bin") == 0);
}

void test_walk_missing_top_directory() {
    std::error_code ec;
    int visited = 0;
    const bool listed = infra::walk_directory_tree("/nonexistent/fanmv/dir", [&](const stdfs::directory_entry&) { ++visited; }, ec);
    assert(!listed);
    assert(ec.value() == ENOENT);
    assert(visited == 0);
}

} // namespace

int main() {
    [[maybe_unused]] const infra::global_initialize_finalize_t init_fin;

    test_mount_point();
    test_missing_path_throws();
    test_free_space();
    test_local_probe();
    test_walk_visits_whole_tree();
    test_walk_skips_vanished_subdirectory();
    test_walk_missing_top_directory();
    return 0;
}
