#if !defined(_FANMV_LOCK_MANAGER_H_INCLUDED_)
#define _FANMV_LOCK_MANAGER_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    //
    // Bounds the number of concurrent transfers.
    //  global:     one transfer at a time, across every destination
    //  per-source: one transfer at a time per source directory
    // Both are optional and may be combined. When a policy is disabled its
    // acquire/release calls are no-ops.
    // Locks are exclusive and NOT reentrant; release from the acquiring thread.
    //
    class lock_manager
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(lock_manager)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(lock_manager)

        lock_manager(bool global_enabled, bool per_source_enabled)
            : _global_enabled(global_enabled),
              _per_source_enabled(per_source_enabled)
        { }

        void acquire_global();
        void release_global();

        void acquire_per_source(const std::string& directory);
        void release_per_source(const std::string& directory);

        [[nodiscard]]
        bool global_enabled() const noexcept { return _global_enabled; }

        [[nodiscard]]
        bool per_source_enabled() const noexcept { return _per_source_enabled; }

    private:
        std::mutex& per_source_mutex(const std::string& directory);

    private:
        const bool _global_enabled;
        const bool _per_source_enabled;

        std::mutex _global_mutex { };

        // Created lazily on first use, never removed
        std::mutex _per_source_map_mutex { };
        std::unordered_map<std::string, std::unique_ptr<std::mutex>> _per_source_mutexes { };
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_LOCK_MANAGER_H_INCLUDED_)
