#include "infra.h"


namespace
{
    void close_fd(int& fd) noexcept
    {
        if (fd != -1) {
            (void)close(fd);
            fd = -1;
        }
    }

    // Read whatever is available once. Returns false on EOF.
    bool drain_fd(const int fd, /*inout*/ std::string& out)
    {
        char buffer[4096];
        while (true) {
            const ssize_t cnt = read(fd, buffer, sizeof(buffer));
            if (cnt > 0) {
                out.append(buffer, static_cast<size_t>(cnt));
                return true;
            }
            if (cnt == 0) {
                return false;
            }

            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            LOG_ERROR("read() child output pipe failed. errno = {} ({})", err, strerror(err));
            THROW_SYSTEM_ERROR(err, read);
        }
    }

    int wait_child(const pid_t pid)
    {
        int stat = 0;
        while (waitpid(pid, &stat, 0) == -1) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            LOG_ERROR("waitpid() for pid {} failed. errno = {} ({})", pid, err, strerror(err));
            THROW_SYSTEM_ERROR(err, waitpid);
        }

        if (WIFEXITED(stat)) {
            return WEXITSTATUS(stat);
        }
        if (WIFSIGNALED(stat)) {
            return 128 + WTERMSIG(stat);
        }
        return -1;
    }

}  // namespace



//==============================================================================
// run_process
//==============================================================================

infra::process_result infra::run_process(const std::vector<std::string>& argv)
{
    ASSERT(!argv.empty());

    int out_pipe[2] = { -1, -1 };
    int err_pipe[2] = { -1, -1 };
    const infra::sweeper pipe_cleanup = [&]() {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
    };

    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        LOG_ERROR("pipe2() failed. errno = {} ({})", err, strerror(err));
        THROW_SYSTEM_ERROR(err, pipe2);
    }

    posix_spawn_file_actions_t actions { };
    int rc = posix_spawn_file_actions_init(&actions);
    if (rc != 0) {
        LOG_ERROR("posix_spawn_file_actions_init() failed. errno = {} ({})", rc, strerror(rc));
        THROW_SYSTEM_ERROR(rc, posix_spawn_file_actions_init);
    }
    const infra::sweeper actions_cleanup = [&]() {
        (void)posix_spawn_file_actions_destroy(&actions);
    };

    // dup2() clears O_CLOEXEC on the child's stdout/stderr; every other pipe end is closed on exec
    rc = posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    if (rc == 0) {
        rc = posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);
    }
    if (rc != 0) {
        LOG_ERROR("posix_spawn_file_actions_adddup2() failed. errno = {} ({})", rc, strerror(rc));
        THROW_SYSTEM_ERROR(rc, posix_spawn_file_actions_adddup2);
    }

    // We ignore SIGPIPE; the child gets it back at its default
    posix_spawnattr_t attr { };
    rc = posix_spawnattr_init(&attr);
    if (rc != 0) {
        LOG_ERROR("posix_spawnattr_init() failed. errno = {} ({})", rc, strerror(rc));
        THROW_SYSTEM_ERROR(rc, posix_spawnattr_init);
    }
    const infra::sweeper attr_cleanup = [&]() {
        (void)posix_spawnattr_destroy(&attr);
    };

    sigset_t default_signals;
    (void)sigemptyset(&default_signals);
    (void)sigaddset(&default_signals, SIGPIPE);
    rc = posix_spawnattr_setsigdefault(&attr, &default_signals);
    if (rc == 0) {
        rc = posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);
    }
    if (rc != 0) {
        LOG_ERROR("posix_spawnattr_setsigdefault() failed. errno = {} ({})", rc, strerror(rc));
        THROW_SYSTEM_ERROR(rc, posix_spawnattr_setsigdefault);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const std::string& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    const std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    pid_t pid = -1;
    rc = posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(), environ);
    if (rc != 0) {
        LOG_ERROR("posix_spawnp() {} failed. errno = {} ({})", argv[0], rc, strerror(rc));
        THROW_SYSTEM_ERROR(rc, posix_spawnp);
    }
    LOG_TRACE("Spawned child pid {}: {}", pid, join_command_line(argv));

    // Parent keeps only the read ends, so EOF shows up when the child exits
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    process_result result;

    std::exception_ptr read_error = nullptr;
    try {
        bool out_open = true;
        bool err_open = true;
        while (out_open || err_open) {
            struct pollfd fds[2] { };
            std::string* targets[2] { };
            bool* open_flags[2] { };
            nfds_t count = 0;

            if (out_open) {
                fds[count] = { out_pipe[0], POLLIN, 0 };
                targets[count] = &result.stdout_text;
                open_flags[count] = &out_open;
                ++count;
            }
            if (err_open) {
                fds[count] = { err_pipe[0], POLLIN, 0 };
                targets[count] = &result.stderr_text;
                open_flags[count] = &err_open;
                ++count;
            }

            const int ready = poll(fds, count, -1);
            if (ready < 0) {
                const int err = errno;
                if (err == EINTR) {
                    continue;
                }
                LOG_ERROR("poll() child output pipes failed. errno = {} ({})", err, strerror(err));
                THROW_SYSTEM_ERROR(err, poll);
            }

            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    if (!drain_fd(fds[i].fd, *targets[i])) {
                        *open_flags[i] = false;
                    }
                }
            }
        }
    }
    catch (const std::system_error&) {
        // Reap the child below before reporting
        read_error = std::current_exception();
    }

    result.exit_status = wait_child(pid);
    result.elapsed = std::chrono::steady_clock::now() - start_time;

    if (read_error) {
        std::rethrow_exception(read_error);
    }

    LOG_TRACE("Child pid {} exited with status {}", pid, result.exit_status);
    return result;
}


std::string infra::join_command_line(const std::vector<std::string>& argv)
{
    std::string result;
    for (const std::string& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            result += '\'';
            result += arg;
            result += '\'';
        }
        else {
            result += arg;
        }
    }
    return result;
}
