#include "test_utils.h"

int main() {
    [[maybe_unused]] const infra::global_initialize_finalize_t init_fin;

    infra::sighandle::setup_signal_handler();
    assert(!infra::sighandle::is_exit_required());

    // A broken pipe must not kill the process
    int fds[2];
    assert(pipe(fds) == 0);
    (void)close(fds[0]);
    const char byte = 'x';
    assert(write(fds[1], &byte, 1) == -1);
    assert(errno == EPIPE);
    (void)close(fds[1]);

    // Waiting from another thread, as main() does
    std::atomic_bool woke { false };
    std::thread waiter([&]() {
        infra::sighandle::wait_for_exit_required();
        woke = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(!woke);

    assert(raise(SIGTERM) == 0);
    waiter.join();
    assert(woke);
    assert(infra::sighandle::is_exit_required());

    // Once required, later waits and requests return at once
    infra::sighandle::require_exit();
    infra::sighandle::wait_for_exit_required();
    return 0;
}
