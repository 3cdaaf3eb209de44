#include "test_utils.h"

using namespace fanmv;

namespace {

// Runs `threads` threads that each enter a critical region under the locks;
// returns the highest number of threads seen inside at once.
int max_concurrency(lock_manager& locks, const std::vector<std::string>& dirs) {
    std::mutex mutex;
    int inside = 0;
    int max_inside = 0;

    std::vector<std::thread> threads;
    for (const std::string& dir : dirs) {
        threads.emplace_back([&, dir]() {
            for (int round = 0; round < 5; ++round) {
                locks.acquire_global();
                locks.acquire_per_source(dir);
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    ++inside;
                    max_inside = std::max(max_inside, inside);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    --inside;
                }
                locks.release_per_source(dir);
                locks.release_global();
            }
        });
    }
    for (std::thread& thr : threads) {
        thr.join();
    }
    return max_inside;
}

void test_disabled_is_noop() {
    lock_manager locks(false, false);
    assert(!locks.global_enabled());
    assert(!locks.per_source_enabled());

    // Neither call blocks when disabled, even repeated
    locks.acquire_global();
    locks.acquire_global();
    locks.acquire_per_source("/a");
    locks.acquire_per_source("/a");
    locks.release_per_source("/a");
    locks.release_per_source("/a");
    locks.release_global();
    locks.release_global();

    assert(max_concurrency(locks, { "/a", "/a", "/b", "/b" }) > 1);
}

void test_global_serializes_everything() {
    lock_manager locks(true, false);
    assert(max_concurrency(locks, { "/a", "/b", "/c", "/d" }) == 1);
}

void test_per_source_serializes_same_directory_only() {
    lock_manager same(false, true);
    assert(max_concurrency(same, { "/a", "/a", "/a" }) == 1);

    lock_manager different(false, true);
    assert(max_concurrency(different, { "/a", "/b", "/c" }) > 1);
}

void test_combined() {
    lock_manager locks(true, true);
    assert(max_concurrency(locks, { "/a", "/a", "/b" }) == 1);
}

} // namespace

int main() {
    [[maybe_unused]] const infra::global_initialize_finalize_t init_fin;

    test_disabled_is_noop();
    test_global_serializes_everything();
    test_per_source_serializes_same_directory_only();
    test_combined();
    return 0;
}
