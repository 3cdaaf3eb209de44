#include "common.h"


//==============================================================================
// struct destination_worker
//==============================================================================

bool fanmv::destination_worker::init()
{
    ++state.running_workers;

    thread_work = std::thread([this]() {
        try {
            this->fn_thread_work();
        }
        catch (const std::exception& ex) {
            PANIC_TERMINATE("destination_worker fn_thread_work() exception: {}", ex.what());
        }
    });

    return true;
}

void fanmv::destination_worker::dispose_impl() noexcept /*override*/
{
    state.request_stop();

    if (thread_work.joinable()) {
        thread_work.join();
    }
}

fanmv::transfer_options fanmv::destination_worker::make_move_options() const
{
    transfer_options options;
    options.remove_source = true;
    options.preallocate = true;
    options.whole_file = true;
    options.bwlimit = state.program_options->arg_bwlimit;
    options.ionice_class = state.program_options->arg_ionice_class;
    return options;
}

fanmv::transfer_options fanmv::destination_worker::make_probe_options() const
{
    transfer_options options;
    options.remove_source = false;  // the probe file is reused by every check
    options.whole_file = true;
    options.bwlimit = state.program_options->arg_bwlimit;
    options.ionice_class = state.program_options->arg_ionice_class;
    return options;
}

void fanmv::destination_worker::requeue(const work_item& item)
{
    state.queue.put(item);
    ++requeued_count;
}

void fanmv::destination_worker::drop(const work_item& item, const char* reason)
{
    ++dropped_count;
    LOG_WARN("Worker #{} ({}): dropped {}: {}", id, dest.to_string(), item.path.string(), reason);
}

void fanmv::destination_worker::become_terminated()
{
    status = STATUS_TERMINATED;
    LOG_ERROR("Worker #{}: destination {} is out of service until restart", id, dest.to_string());

    const size_t remaining = --state.running_workers;
    if (remaining == 0) {
        LOG_ERROR("Error: no destination remains in service, {} queued file(s) wait for a restart",
                  state.queue.size());
    }
}

fanmv::destination_worker::loop_action fanmv::destination_worker::unmounted_retry(const work_item& item)
{
    ++_unmounted_retries;

    const uint32_t escalate_after = state.program_options->arg_escalate_after;
    const bool escalated = (escalate_after > 0 && _unmounted_retries > escalate_after);
    const std::chrono::milliseconds delay =
        escalated ? state.program_options->long_backoff : state.program_options->short_backoff;

    LOG_WARN("Worker #{}: destination {} exists but is not mounted (retry #{}), retry in {} ms",
             id, dest.to_string(), _unmounted_retries, delay.count());

    requeue(item);
    return state.sleep_for(delay) ? loop_action::next_item : loop_action::stop;
}

fanmv::destination_worker::loop_action fanmv::destination_worker::recover_item(const work_item& item)
{
    std::error_code ec;
    const bool source_exists = stdfs::exists(item.path, ec);
    if (ec) {
        // Can't tell: keep the item rather than lose it
        LOG_WARN("Worker #{}: can't check {}: {}", id, item.path.string(), ec.message());
    }

    if (source_exists || ec) {
        requeue(item);
        return state.sleep_for(state.program_options->short_backoff) ? loop_action::next_item : loop_action::stop;
    }

    drop(item, "source file no longer exists");
    return loop_action::next_item;
}

fanmv::destination_worker::loop_action fanmv::destination_worker::process_item(const work_item& item)
{
    const stdfs::path dest_path(dest.target.path);
    const bool is_local = dest.is_local();

    //
    // Mounted?
    //
    if (is_local && state.probe->exists(dest_path)) {
        if (!state.probe->is_mount_point(dest_path)) {
            return unmounted_retry(item);
        }
    }
    _unmounted_retries = 0;

    //
    // Enough space?
    // Throws if the file vanished since it was discovered
    //
    const uint64_t file_size = state.probe->file_size(item.path);
    if (is_local) {
        const uint64_t free_space = state.probe->free_space(dest_path);
        if (free_space < file_size) {
            LOG_ERROR("Worker #{}: destination {} has {} bytes free, {} needs {} bytes",
                      id, dest.to_string(), free_space, item.path.string(), file_size);
            requeue(item);
            return loop_action::terminate;
        }
    }

    //
    // Pre-flight and transfer, under locks
    //
    transfer_result result;
    {
        const std::string source_dir = item.source_directory();

        state.locks.acquire_global();
        infra::sweeper release_global = [&]() {
            state.locks.release_global();
        };

        state.locks.acquire_per_source(source_dir);
        infra::sweeper release_per_source = [&]() {
            state.locks.release_per_source(source_dir);
        };

        const transfer_result check = state.transfer->transfer(state.probe_file, dest.target, make_probe_options());
        if (!check.succeeded()) {
            LOG_ERROR("Transfer failed: connectivity check to {} exited with {}: {}",
                      dest.to_string(), check.exit_status, check.output());
            requeue(item);
            return loop_action::terminate;
        }

        LOG_INFO("Transfer started: {} -> {} ({} bytes)", item.path.string(), dest.to_string(), file_size);
        result = state.transfer->transfer(item.path, dest.target, make_move_options());
    }

    if (result.succeeded()) {
        ++transferred_count;
        LOG_INFO("Transfer succeeded: {} -> {} in {:.3f} s",
                 item.path.string(), dest.to_string(),
                 std::chrono::duration<double>(result.elapsed).count());

        const std::string output = result.output();
        if (!output.empty()) {
            LOG_INFO("rsync output: {}", output);
        }
        return loop_action::next_item;
    }

    LOG_ERROR("Transfer failed: {} -> {} exited with {}: {}",
              item.path.string(), dest.to_string(), result.exit_status, result.output());

    // Re-enqueued even if shutdown interrupts the sleep
    (void)state.sleep_for(state.program_options->short_backoff);
    requeue(item);
    return loop_action::terminate;
}

void fanmv::destination_worker::fn_thread_work()
{
    LOG_DEBUG("Worker #{} for {} started", id, dest.to_string());

    while (true) {
        std::optional<work_item> item = state.queue.get();
        if (!item.has_value()) {
            break;  // queue closed
        }
        ++dequeued_count;

        loop_action action;
        try {
            action = process_item(item.value());
        }
        catch (const std::exception& ex) {
            LOG_ERROR("Error: worker #{} ({}) on {}: {}", id, dest.to_string(), item->path.string(), ex.what());
            action = recover_item(item.value());
        }

        if (action == loop_action::terminate) {
            become_terminated();
            return;
        }
        if (action == loop_action::stop) {
            break;
        }
    }

    LOG_DEBUG("Worker #{} for {} stopped", id, dest.to_string());
}
