#if !defined(_FANMV_DESTINATION_WORKER_H_INCLUDED_)
#define _FANMV_DESTINATION_WORKER_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    struct pipeline_state;

    //
    // Pulls work items and moves them to one destination.
    //
    // A worker stops using its destination for good (TERMINATED) when the
    // destination lacks free space, fails the connectivity check, or a
    // transfer fails. The item in hand is always re-enqueued first so
    // another worker can take it.
    //
    struct destination_worker : infra::disposable
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(destination_worker)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(destination_worker)

        destination_worker(pipeline_state& state, destination dest, const size_t id)
            : state(state),
              dest(std::move(dest)),
              id(id)
        { }

        bool init();

        void dispose_impl() noexcept override final;
        ~destination_worker() noexcept override final { this->dispose(); }

        [[nodiscard]]
        bool is_terminated() const noexcept { return status == STATUS_TERMINATED; }

    private:
        enum class loop_action
        {
            next_item,
            terminate,
            stop,  // shutdown requested during a backoff
        };

        void fn_thread_work();
        loop_action process_item(const work_item& item);
        loop_action recover_item(const work_item& item);
        loop_action unmounted_retry(const work_item& item);

        void requeue(const work_item& item);
        void drop(const work_item& item, const char* reason);
        void become_terminated();

        [[nodiscard]] transfer_options make_move_options() const;
        [[nodiscard]] transfer_options make_probe_options() const;

    public:
        static constexpr const int STATUS_RUNNING = 1;
        static constexpr const int STATUS_TERMINATED = 2;

        pipeline_state& state;
        const destination dest;
        const size_t id;

        std::thread thread_work { };
        std::atomic_int status { STATUS_RUNNING };

        // Once the worker is idle: dequeued == transferred + requeued + dropped
        std::atomic_uint64_t dequeued_count { 0 };
        std::atomic_uint64_t transferred_count { 0 };
        std::atomic_uint64_t requeued_count { 0 };
        std::atomic_uint64_t dropped_count { 0 };

    private:
        // Consecutive times this destination was found unmounted
        uint32_t _unmounted_retries = 0;
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_DESTINATION_WORKER_H_INCLUDED_)
