#include "infra.h"


//==============================================================================
// class dir_watcher
//==============================================================================

infra::dir_watcher::dir_watcher()
{
    _inotify_fd = inotify_init1(IN_CLOEXEC);
    if (_inotify_fd == -1) {
        const int err = errno;
        LOG_ERROR("inotify_init1() failed. errno = {} ({})", err, strerror(err));
        THROW_SYSTEM_ERROR(err, inotify_init1);
    }

    _stop_fd = eventfd(0, EFD_CLOEXEC);
    if (_stop_fd == -1) {
        const int err = errno;
        LOG_ERROR("eventfd() failed. errno = {} ({})", err, strerror(err));
        (void)close(_inotify_fd);
        _inotify_fd = -1;
        THROW_SYSTEM_ERROR(err, eventfd);
    }
}

infra::dir_watcher::~dir_watcher() noexcept
{
    if (_inotify_fd != -1) {
        (void)close(_inotify_fd);
        _inotify_fd = -1;
    }
    if (_stop_fd != -1) {
        (void)close(_stop_fd);
        _stop_fd = -1;
    }
}

void infra::dir_watcher::add_watch(const stdfs::path& dir)
{
    const int wd = inotify_add_watch(_inotify_fd, dir.c_str(), WATCH_MASK);
    if (wd == -1) {
        const int err = errno;
        if (err != ENOENT) {
            LOG_ERROR("inotify_add_watch() {} failed. errno = {} ({})", dir.c_str(), err, strerror(err));
        }
        THROW_SYSTEM_ERROR(err, inotify_add_watch);
    }

    // Identifies the directory when it is moved. Zero if it vanished meanwhile.
    struct stat64 st { };
    if (stat64(dir.c_str(), &st) != 0) {
        st.st_dev = 0;
        st.st_ino = 0;
    }

    std::lock_guard<std::mutex> lock(_watches_mutex);
    _watches[wd] = watch { dir, st.st_dev, st.st_ino };
    LOG_TRACE("inotify watch #{} added: {}", wd, dir.c_str());
}

void infra::dir_watcher::remove_moved_watch(const int wd)
{
    const auto moved = _watches.find(wd);
    if (moved == _watches.end()) {
        return;
    }

    // Moved within the tree and already watched again under its new path
    struct stat64 st { };
    if (stat64(moved->second.path.c_str(), &st) == 0 &&
        st.st_dev == moved->second.dev && st.st_ino == moved->second.ino) {
        return;
    }

    const stdfs::path old_path = moved->second.path;
    for (auto it = _watches.begin(); it != _watches.end(); ) {
        bool below = true;
        auto part = it->second.path.begin();
        for (const stdfs::path& old_part : old_path) {
            if (part == it->second.path.end() || *part != old_part) {
                below = false;
                break;
            }
            ++part;
        }

        if (!below) {
            ++it;
            continue;
        }

        if (inotify_rm_watch(_inotify_fd, it->first) != 0) {
            const int err = errno;
            LOG_DEBUG("inotify_rm_watch() #{} failed. errno = {} ({})", it->first, err, strerror(err));
        }
        LOG_DEBUG("inotify watch #{} removed, directory moved away: {}", it->first, it->second.path.c_str());
        it = _watches.erase(it);
    }
}

bool infra::dir_watcher::wait_events(/*out*/ std::vector<event>& events)
{
    events.clear();

    while (!_stopped) {
        struct pollfd fds[2] { };
        fds[0] = { _inotify_fd, POLLIN, 0 };
        fds[1] = { _stop_fd, POLLIN, 0 };

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            const int err = errno;
            if (err == EINTR) {
                continue;
            }
            LOG_ERROR("poll() inotify fd failed. errno = {} ({})", err, strerror(err));
            THROW_SYSTEM_ERROR(err, poll);
        }

        if (fds[1].revents != 0 || _stopped) {
            return false;
        }

        if (fds[0].revents & POLLIN) {
            alignas(struct inotify_event) char buffer[64 * 1024];
            const ssize_t cnt = read(_inotify_fd, buffer, sizeof(buffer));
            if (cnt < 0) {
                const int err = errno;
                if (err == EINTR || err == EAGAIN) {
                    continue;
                }
                LOG_ERROR("read() inotify fd failed. errno = {} ({})", err, strerror(err));
                THROW_SYSTEM_ERROR(err, read);
            }

            parse_events(buffer, static_cast<size_t>(cnt), events);
            if (!events.empty()) {
                return true;
            }
        }
        else if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
            LOG_ERROR("poll() inotify fd got revents {}", fds[0].revents);
            THROW_SYSTEM_ERROR(EIO, poll);
        }
    }

    return false;
}

void infra::dir_watcher::parse_events(const char* const buffer, const size_t length, /*out*/ std::vector<event>& events)
{
    size_t offset = 0;
    while (offset + sizeof(struct inotify_event) <= length) {
        const auto* const ev = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += sizeof(struct inotify_event) + ev->len;

        if (ev->mask & IN_Q_OVERFLOW) {
            event e { event_kind::overflow };
            events.push_back(std::move(e));
            continue;
        }

        std::lock_guard<std::mutex> lock(_watches_mutex);

        if (ev->mask & IN_IGNORED) {
            // Watched directory was removed (or unmounted)
            const auto it = _watches.find(ev->wd);
            if (it != _watches.end()) {
                LOG_DEBUG("inotify watch #{} removed: {}", ev->wd, it->second.path.c_str());
                _watches.erase(it);
            }
            continue;
        }

        if (ev->mask & IN_MOVE_SELF) {
            remove_moved_watch(ev->wd);
            continue;
        }

        if (ev->len == 0) {
            continue;
        }

        const auto it = _watches.find(ev->wd);
        if (it == _watches.end()) {
            LOG_TRACE("inotify event for unknown watch #{}, ignored", ev->wd);
            continue;
        }

        event e { (ev->mask & IN_MOVED_TO) ? event_kind::moved_in : event_kind::created };
        e.directory = it->second.path;
        e.name = ev->name;  // NUL-padded by the kernel
        e.is_directory = ((ev->mask & IN_ISDIR) != 0);
        events.push_back(std::move(e));
    }
}

void infra::dir_watcher::stop() noexcept
{
    _stopped = true;

    const uint64_t one = 1;
    if (write(_stop_fd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
        LOG_WARN("write() eventfd to stop dir_watcher failed. errno = {} ({})", errno, strerror(errno));
    }
}

size_t infra::dir_watcher::watch_count() const
{
    std::lock_guard<std::mutex> lock(_watches_mutex);
    return _watches.size();
}
