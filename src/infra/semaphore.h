#if !defined(_FANMV_INFRA_SEMAPHORE_H_INCLUDED_)
#define _FANMV_INFRA_SEMAPHORE_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)

namespace infra
{
    //
    // Thin wrapper of an unnamed POSIX semaphore.
    // post() is async-signal-safe, so it may be called from a signal handler.
    //
    class semaphore
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(semaphore)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(semaphore)

        explicit semaphore(const std::uint32_t init_value)
        {
            if (sem_init(&_sem, /*pshared*/0, (unsigned int)init_value) != 0) {
                const int err = errno;
                if (err == EINVAL) {
                    // init_value exceeds SEM_VALUE_MAX
                    LOG_ERROR("init_value = {} exceeds SEM_VALUE_MAX", init_value);
                }
                else {
                    LOG_ERROR("sem_init (init_value = {}) failed. errno = {} ({})", init_value, err, strerror(err));
                }
                THROW_SYSTEM_ERROR(err, sem_init);
            }
        }

        //
        // Blocks until the semaphore can be decremented.
        // Restarts transparently when interrupted by a signal.
        //
        void wait()
        {
            while (sem_wait(&_sem) != 0) {
                const int err = errno;
                if (err == EINTR) {
                    continue;
                }
                LOG_ERROR("sem_wait() failed. errno = {} ({})", err, strerror(err));
                THROW_SYSTEM_ERROR(err, sem_wait);
            }
        }

        // NOTE: no logging here: must stay async-signal-safe
        bool post() noexcept
        {
            return (sem_post(&_sem) == 0);
        }

        ~semaphore() noexcept
        {
            (void)sem_destroy(&_sem);
        }

    private:
        sem_t _sem { };
    };

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_SEMAPHORE_H_INCLUDED_)
