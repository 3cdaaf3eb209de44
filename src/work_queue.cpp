#include "common.h"


//==============================================================================
// class work_queue
//==============================================================================

void fanmv::work_queue::put(work_item item)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _items.push_back(std::move(item));
    }
    _cond.notify_one();
}

std::optional<fanmv::work_item> fanmv::work_queue::get()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _cond.wait(lock, [this]() { return _closed || !_items.empty(); });

    if (_closed) {
        return std::nullopt;
    }

    work_item item = std::move(_items.front());
    _items.pop_front();
    return item;
}

std::optional<fanmv::work_item> fanmv::work_queue::try_get()
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_items.empty()) {
        return std::nullopt;
    }

    work_item item = std::move(_items.front());
    _items.pop_front();
    return item;
}

void fanmv::work_queue::close()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _closed = true;
    }
    _cond.notify_all();
}

bool fanmv::work_queue::is_closed() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _closed;
}

size_t fanmv::work_queue::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _items.size();
}
