#if !defined(_FANMV_INFRA_DIR_WATCHER_H_INCLUDED_)
#define _FANMV_INFRA_DIR_WATCHER_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // inotify based directory watcher.
    // Reports entries moved into, or created in, any watched directory.
    // A watched directory that is moved away loses its watch, together with
    // the watches below it, unless it has been watched again at its new path.
    // wait_events() blocks until events arrive or stop() is called from
    // another thread. Once stopped, the watcher can't be restarted.
    //
    class dir_watcher
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(dir_watcher)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(dir_watcher)

        enum class event_kind
        {
            moved_in,
            created,
            overflow,  // kernel event queue overflowed: some events are lost
        };

        struct event
        {
            event_kind kind;
            stdfs::path directory { };
            std::string name { };
            bool is_directory = false;

            [[nodiscard]]
            stdfs::path full_path() const { return directory / name; }
        };

    public:
        dir_watcher();  // throws std::system_error
        ~dir_watcher() noexcept;

        // Throws std::system_error. Error code is ENOENT if the directory doesn't exist.
        void add_watch(const stdfs::path& dir);

        // Returns false once stop() has been called
        bool wait_events(/*out*/ std::vector<event>& events);

        void stop() noexcept;

        [[nodiscard]]
        size_t watch_count() const;

    private:
        struct watch
        {
            stdfs::path path;
            dev_t dev = 0;
            ino64_t ino = 0;
        };

        void parse_events(const char* buffer, size_t length, /*out*/ std::vector<event>& events);
        void remove_moved_watch(int wd);  // requires _watches_mutex

    private:
        static constexpr const uint32_t WATCH_MASK = IN_MOVED_TO | IN_CREATE | IN_MOVE_SELF | IN_ONLYDIR;

        int _inotify_fd = -1;
        int _stop_fd = -1;
        std::atomic_bool _stopped { false };

        mutable std::mutex _watches_mutex { };
        std::unordered_map<int, watch> _watches { };
    };

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_DIR_WATCHER_H_INCLUDED_)
