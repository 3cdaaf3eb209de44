#include "common.h"


//==============================================================================
// struct discoverer
//==============================================================================

bool fanmv::discoverer::is_eligible(const std::string& file_name)
{
    const size_t prefix_len = sizeof(ELIGIBLE_PREFIX) - 1;
    const size_t suffix_len = sizeof(ELIGIBLE_SUFFIX) - 1;

    if (file_name.size() < prefix_len + suffix_len) {
        return false;
    }
    if (file_name.compare(0, prefix_len, ELIGIBLE_PREFIX) != 0) {
        return false;
    }
    if (file_name.compare(file_name.size() - suffix_len, suffix_len, ELIGIBLE_SUFFIX) != 0) {
        return false;
    }
    return true;
}

bool fanmv::discoverer::init()
{
    try {
        watcher = std::make_unique<infra::dir_watcher>();
    }
    catch (const std::system_error& ex) {
        LOG_ERROR("Can't create directory watcher: {}", ex.what());
        return false;
    }

    thread_work = std::thread([this]() {
        try {
            this->fn_thread_work();
        }
        catch (const std::exception& ex) {
            PANIC_TERMINATE("discoverer fn_thread_work() exception: {}", ex.what());
        }
    });

    return true;
}

void fanmv::discoverer::dispose_impl() noexcept /*override*/
{
    if (watcher) {
        watcher->stop();
    }

    if (thread_work.joinable()) {
        thread_work.join();
    }
}

void fanmv::discoverer::enqueue(const stdfs::path& path)
{
    ++discovered_count;
    state.queue.put(work_item { path });
    LOG_DEBUG("Discovered {}", path.string());
}

size_t fanmv::discoverer::scan(const stdfs::path& root)
{
    size_t count = 0;
    std::error_code ec;
    const bool listed = infra::walk_directory_tree(root, [&](const stdfs::directory_entry& entry) {
        if (!is_eligible(entry.path().filename().string())) {
            return;
        }

        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            return;
        }

        enqueue(entry.path());
        ++count;
    }, ec);

    if (!listed) {
        LOG_WARN("Can't scan source directory {} (skipped): {}", root.string(), ec.message());
        return 0;
    }

    LOG_DEBUG("Scanned {}: {} file(s) enqueued", root.string(), count);
    return count;
}

void fanmv::discoverer::watch_tree(const stdfs::path& dir)
{
    // The top directory: ENOENT and anything else goes to the caller
    watcher->add_watch(dir);

    std::error_code ec;
    const bool listed = infra::walk_directory_tree(dir, [&](const stdfs::directory_entry& entry) {
        std::error_code type_ec;
        if (entry.is_symlink(type_ec) || !entry.is_directory(type_ec)) {
            return;
        }

        try {
            watcher->add_watch(entry.path());
        }
        catch (const std::system_error& ex) {
            if (ex.code().value() == ENOENT) {
                return;  // removed meanwhile
            }
            if (ex.code().value() == EACCES) {
                LOG_WARN("Can't watch {} (skipped): {}", entry.path().string(), ex.what());
                return;
            }
            throw;
        }
    }, ec);

    if (!listed) {
        LOG_WARN("Can't list {} to watch its subdirectories: {}", dir.string(), ec.message());
    }
}

void fanmv::discoverer::handle_event(const infra::dir_watcher::event& ev)
{
    switch (ev.kind) {
        case infra::dir_watcher::event_kind::overflow: {
            LOG_WARN("Directory watch event queue overflowed: some new files may be missed until restart");
            break;
        }

        case infra::dir_watcher::event_kind::created:
        case infra::dir_watcher::event_kind::moved_in: {
            const stdfs::path path = ev.full_path();

            if (ev.is_directory) {
                // Watch it first, then pick up whatever landed before the watch was armed
                try {
                    watch_tree(path);
                }
                catch (const std::system_error& ex) {
                    if (ex.code().value() != ENOENT) {
                        throw;
                    }
                    LOG_DEBUG("New directory {} vanished before it could be watched", path.string());
                    break;
                }
                LOG_INFO("Watching started: {}", path.string());
                (void)scan(path);
                break;
            }

            if (ev.kind == infra::dir_watcher::event_kind::moved_in && is_eligible(ev.name)) {
                enqueue(path);
            }
            break;
        }
    }
}

void fanmv::discoverer::fn_thread_work()
{
    try {
        const std::vector<stdfs::path>& roots = state.program_options->sources;

        // Phase 1: every root is scanned before any is watched
        for (const stdfs::path& root : roots) {
            (void)scan(root);
        }
        LOG_INFO("Initial scan done: {} file(s) enqueued", discovered_count.load());

        // Phase 2: live watch
        for (const stdfs::path& root : roots) {
            std::error_code ec;
            if (!stdfs::is_directory(root, ec)) {
                LOG_WARN("Source directory {} doesn't exist (not watched)", root.string());
                continue;
            }

            try {
                watch_tree(root);
            }
            catch (const std::system_error& ex) {
                if (ex.code().value() != ENOENT) {
                    throw;
                }
                LOG_WARN("Source directory {} vanished (not watched)", root.string());
                continue;
            }
            LOG_INFO("Watching started: {}", root.string());
        }
        LOG_DEBUG("{} directories watched", watcher->watch_count());
        watching_started.set();

        std::vector<infra::dir_watcher::event> events;
        while (watcher->wait_events(events)) {
            for (const infra::dir_watcher::event& ev : events) {
                handle_event(ev);
            }
        }

        LOG_DEBUG("Discoverer stopped");
    }
    catch (const std::exception& ex) {
        LOG_ERROR("Error: file discovery failed: {}", ex.what());
        failed = true;
        watching_started.set();
        if (fatal_error_callback) {
            fatal_error_callback(std::current_exception());
        }
    }
}
