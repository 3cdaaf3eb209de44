#include "common.h"


//==============================================================================
// class lock_manager
//==============================================================================

void fanmv::lock_manager::acquire_global()
{
    if (!_global_enabled) return;

    LOG_TRACE("Acquiring global lock");
    _global_mutex.lock();
}

void fanmv::lock_manager::release_global()
{
    if (!_global_enabled) return;

    _global_mutex.unlock();
    LOG_TRACE("Released global lock");
}

void fanmv::lock_manager::acquire_per_source(const std::string& directory)
{
    if (!_per_source_enabled) return;

    LOG_TRACE("Acquiring per-source lock: {}", directory);
    per_source_mutex(directory).lock();
}

void fanmv::lock_manager::release_per_source(const std::string& directory)
{
    if (!_per_source_enabled) return;

    per_source_mutex(directory).unlock();
    LOG_TRACE("Released per-source lock: {}", directory);
}

std::mutex& fanmv::lock_manager::per_source_mutex(const std::string& directory)
{
    std::lock_guard<std::mutex> lock(_per_source_map_mutex);

    std::unique_ptr<std::mutex>& mtx = _per_source_mutexes[directory];
    if (!mtx) {
        mtx = std::make_unique<std::mutex>();
    }
    return *mtx;
}
