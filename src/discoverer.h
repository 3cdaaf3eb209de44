#if !defined(_FANMV_DISCOVERER_H_INCLUDED_)
#define _FANMV_DISCOVERER_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    struct pipeline_state;

    //
    // Feeds the work queue: first a recursive scan of every source root, then
    // a recursive inotify watch of every root that exists.
    //
    // NOTE:
    //  The scan completes before any watch is armed. A file moved into an
    //  already-scanned directory in between is not seen until next start.
    //
    struct discoverer : infra::disposable
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(discoverer)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(discoverer)

        explicit discoverer(pipeline_state& state)
            : state(state)
        { }

        bool init();

        void dispose_impl() noexcept override final;
        ~discoverer() noexcept override final { this->dispose(); }

        // "postdata_*.bin", case-sensitive
        [[nodiscard]]
        static bool is_eligible(const std::string& file_name);

        // Enqueue every eligible regular file under root. Returns the count.
        size_t scan(const stdfs::path& root);

    private:
        void fn_thread_work();
        void watch_tree(const stdfs::path& dir);
        void handle_event(const infra::dir_watcher::event& ev);
        void enqueue(const stdfs::path& path);

    public:
        pipeline_state& state;

        // NOTE: called on the discoverer thread
        std::function<void(std::exception_ptr)> fatal_error_callback { nullptr };

        std::thread thread_work { };
        std::unique_ptr<infra::dir_watcher> watcher { nullptr };

        // Set once every root is watched (or discovery failed)
        infra::manual_reset_event watching_started { false };

        std::atomic_uint64_t discovered_count { 0 };
        std::atomic_bool failed { false };

    private:
        static constexpr const char ELIGIBLE_PREFIX[] = "postdata_";
        static constexpr const char ELIGIBLE_SUFFIX[] = ".bin";
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_DISCOVERER_H_INCLUDED_)
