#if !defined(_FANMV_WORK_QUEUE_H_INCLUDED_)
#define _FANMV_WORK_QUEUE_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    //
    // A discovered file waiting to be moved.
    // Its size is deliberately not recorded: the file may grow, shrink or
    // vanish before a worker gets to it.
    //
    struct work_item
    {
    public:
        stdfs::path path { };

        // Key of the per-source lock
        [[nodiscard]]
        std::string source_directory() const { return path.parent_path().string(); }
    };


    //
    // Unbounded FIFO shared by the discoverer (producer) and every
    // destination worker (consumers). No deduplication: the same path put
    // twice is handed out twice.
    //
    class work_queue
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(work_queue)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(work_queue)
        work_queue() = default;

        // Never blocks. Still accepted after close() so in-flight items are not lost.
        void put(work_item item);

        // Blocks until an item is available. Returns std::nullopt once closed.
        std::optional<work_item> get();

        std::optional<work_item> try_get();

        // Wake every blocked get() and make further get() return std::nullopt
        void close();

        [[nodiscard]]
        bool is_closed() const;

        [[nodiscard]]
        size_t size() const;

    private:
        mutable std::mutex _mutex { };
        std::condition_variable _cond { };
        std::deque<work_item> _items { };
        bool _closed = false;
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_WORK_QUEUE_H_INCLUDED_)
