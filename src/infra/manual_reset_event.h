#if !defined(_FANMV_INFRA_MANUAL_RESET_EVENT_H_INCLUDED_)
#define _FANMV_INFRA_MANUAL_RESET_EVENT_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    class manual_reset_event
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(manual_reset_event)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(manual_reset_event)

        explicit manual_reset_event(const bool is_set)
            : _is_set(is_set)
        { }

        void set()
        {
            std::unique_lock<std::mutex> lock(_mutex);
            if (_is_set) return;
            _is_set = true;
            _cond.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(_mutex);
            while (!_is_set) {
                _cond.wait(lock);
            }
        }

        //
        // Returns true if the event got set before the timeout elapsed.
        // Used as an interruptible sleep.
        //
        template<typename TRep, typename TPeriod>
        bool wait_for(const std::chrono::duration<TRep, TPeriod>& timeout)
        {
            std::unique_lock<std::mutex> lock(_mutex);
            return _cond.wait_for(lock, timeout, [this]() { return _is_set.load(); });
        }

    private:
        std::mutex _mutex { };
        std::condition_variable _cond { };
        std::atomic_bool _is_set;
    };

}  // namespace infra

#endif  // !defined(_FANMV_INFRA_MANUAL_RESET_EVENT_H_INCLUDED_)
