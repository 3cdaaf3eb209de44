#include "common.h"


//==============================================================================
// struct pipeline_state
//==============================================================================

void fanmv::pipeline_state::request_stop()
{
    stop_event.set();
    queue.close();
}

bool fanmv::pipeline_state::sleep_for(const std::chrono::milliseconds duration)
{
    return !stop_event.wait_for(duration);
}


//==============================================================================
// struct pipeline
//==============================================================================

fanmv::pipeline::pipeline(
    std::shared_ptr<fanmv_program_options> program_options,
    std::shared_ptr<transfer_capability> transfer,
    std::shared_ptr<filesystem_probe> probe)
    : state(
        program_options,
        transfer ? std::move(transfer) : std::shared_ptr<transfer_capability>(std::make_shared<rsync_transfer>(program_options->arg_rsync)),
        probe ? std::move(probe) : std::shared_ptr<filesystem_probe>(std::make_shared<local_filesystem_probe>()))
{ }

bool fanmv::pipeline::prepare_probe_file()
{
    const std::optional<std::string>& given = state.program_options->arg_probe_file;
    if (given.has_value()) {
        std::error_code ec;
        if (!stdfs::is_regular_file(given.value(), ec)) {
            LOG_ERROR("Probe file {} is not a regular file", given.value());
            return false;
        }
        state.probe_file = given.value();
        return true;
    }

    std::error_code ec;
    const stdfs::path temp_dir = stdfs::temp_directory_path(ec);
    if (ec) {
        LOG_ERROR("Can't find a temporary directory for the probe file: {}", ec.message());
        return false;
    }

    static std::atomic_int __instance_counter { 0 };
    _generated_probe_dir = temp_dir /
        ("fanmv-" + std::to_string(getpid()) + "-" + std::to_string(++__instance_counter));
    stdfs::create_directories(_generated_probe_dir, ec);
    if (ec) {
        LOG_ERROR("Can't create directory {}: {}", _generated_probe_dir.string(), ec.message());
        return false;
    }

    const stdfs::path probe_path = _generated_probe_dir / PROBE_FILE_NAME;
    std::ofstream ofs(probe_path, std::ios::out | std::ios::trunc);
    ofs << "fanmv connectivity check\n";
    ofs.close();
    if (!ofs) {
        LOG_ERROR("Can't write probe file {}", probe_path.string());
        return false;
    }

    state.probe_file = probe_path;
    LOG_DEBUG("Generated probe file {}", probe_path.string());
    return true;
}

bool fanmv::pipeline::init()
{
    if (!prepare_probe_file()) {
        return false;
    }

    std::vector<destination> destinations;
    for (const host_path& hp : state.program_options->arg_destinations) {
        destinations.push_back(destination { hp });
    }
    if (state.program_options->arg_shuffle) {
        std::random_device rd;
        std::mt19937 rng(rd());
        std::shuffle(destinations.begin(), destinations.end(), rng);
    }

    //
    // Start the discoverer
    //
    source_discoverer = std::make_shared<discoverer>(state);
    source_discoverer->fatal_error_callback = [this](std::exception_ptr) {
        if (fatal_error_callback) {
            fatal_error_callback();
        }
    };
    if (!source_discoverer->init()) {
        LOG_ERROR("discoverer init() failed");
        return false;
    }

    //
    // Start one worker per destination
    //
    for (size_t i = 0; i < destinations.size(); ++i) {
        LOG_INFO("Destination #{}: {}", i, destinations[i].to_string());
        std::shared_ptr<destination_worker> worker = std::make_shared<destination_worker>(state, destinations[i], i);
        if (!worker->init()) {
            LOG_ERROR("destination_worker init() failed for {}", destinations[i].to_string());
            worker->dispose();
            return false;
        }
        workers.push_back(std::move(worker));
    }

    return true;
}

bool fanmv::pipeline::has_fatal_error() const noexcept
{
    return source_discoverer && source_discoverer->failed;
}

void fanmv::pipeline::dispose_impl() noexcept /*override*/
{
    state.request_stop();

    if (source_discoverer) {
        source_discoverer->dispose();
    }

    for (std::shared_ptr<destination_worker>& worker : workers) {
        worker->dispose();
    }
    LOG_DEBUG("All destination workers stopped");

    if (!_generated_probe_dir.empty()) {
        std::error_code ec;
        stdfs::remove_all(_generated_probe_dir, ec);
        if (ec) {
            LOG_WARN("Can't remove {}: {}", _generated_probe_dir.string(), ec.message());
        }
    }
}
