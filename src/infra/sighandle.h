#if !defined(_FANMV_INFRA_SIGHANDLE_H_INCLUDED_)
#define _FANMV_INFRA_SIGHANDLE_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    class sighandle
    {
    private:
        static inline semaphore __exit_sem { 0 };
        static inline std::atomic_bool __exit_required { false };
        static inline std::atomic_int __caught_signal { 0 };

        static void stop_handler(
            const int sig,
            [[maybe_unused]] siginfo_t* const info,
            [[maybe_unused]] void* const ucontext)
        {
            // Only async-signal-safe operations here
            __caught_signal = sig;
            require_exit();
        }

    public:
        static void wait_for_exit_required()
        {
            __exit_sem.wait();

            // Let other waiters (if any) pass too
            (void)__exit_sem.post();

            const int sig = __caught_signal;
            if (sig != 0) {
                LOG_DEBUG("Caught signal: {}", sig);
            }
        }

        static void require_exit() noexcept
        {
            if (!__exit_required.exchange(true)) {
                (void)__exit_sem.post();
            }
        }

        static bool is_exit_required() noexcept
        {
            return __exit_required;
        }

        static void setup_signal_handler()
        {
            #define _SETUP_FOR_SIGNAL(_Signal_) \
                do { \
                    struct sigaction act { }; \
                    act.sa_flags = SA_RESTART | SA_SIGINFO; \
                    act.sa_sigaction = &stop_handler; \
                    if (sigaction((_Signal_), &act, nullptr) != 0) { \
                        LOG_ERROR("sigaction() for {} failed: errno = {} ({})", #_Signal_, errno, strerror(errno)); \
                        THROW_SYSTEM_ERROR(errno, sigaction); \
                    } \
                    LOG_TRACE("Setup signal handler for {}", #_Signal_); \
                } while(false)

            _SETUP_FOR_SIGNAL(SIGINT);
            _SETUP_FOR_SIGNAL(SIGTERM);
            _SETUP_FOR_SIGNAL(SIGQUIT);
            _SETUP_FOR_SIGNAL(SIGHUP);

            #undef _SETUP_FOR_SIGNAL

            #define _IGNORE_SIGNAL(_Signal_) \
                do { \
                    if (signal(_Signal_, SIG_IGN) == SIG_ERR) { \
                        LOG_ERROR("signal() for {} failed: errno = {} ({})", #_Signal_, errno, strerror(errno)); \
                        THROW_SYSTEM_ERROR(errno, signal); \
                    } \
                    LOG_TRACE("Ignore signal: {}", #_Signal_); \
                } while(false)

            // A transfer child dying must not kill us through a broken pipe
            _IGNORE_SIGNAL(SIGPIPE);

            #undef _IGNORE_SIGNAL
        }
    };

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_SIGHANDLE_H_INCLUDED_)
