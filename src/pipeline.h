#if !defined(_FANMV_PIPELINE_H_INCLUDED_)
#define _FANMV_PIPELINE_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)

namespace fanmv
{
    //
    // Everything shared by the discoverer and the destination workers of one run.
    // Owned by pipeline (or by a test), passed to the others by reference.
    //
    struct pipeline_state
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(pipeline_state)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(pipeline_state)

        pipeline_state(
            std::shared_ptr<fanmv_program_options> program_options,
            std::shared_ptr<transfer_capability> transfer,
            std::shared_ptr<filesystem_probe> probe)
            : program_options(std::move(program_options)),
              transfer(std::move(transfer)),
              probe(std::move(probe)),
              locks(this->program_options->arg_global_lock, this->program_options->arg_per_source_lock)
        { }

        // Close the queue and interrupt every backoff sleep
        void request_stop();

        // Interruptible sleep. Returns false if stop was requested meanwhile.
        bool sleep_for(std::chrono::milliseconds duration);

    public:
        const std::shared_ptr<fanmv_program_options> program_options;
        const std::shared_ptr<transfer_capability> transfer;
        const std::shared_ptr<filesystem_probe> probe;

        // Small file sent by the connectivity check before each transfer
        stdfs::path probe_file { };

        work_queue queue { };
        lock_manager locks;

        // Workers not yet TERMINATED
        std::atomic_size_t running_workers { 0 };

    private:
        infra::manual_reset_event stop_event { false };
    };


    //
    // Runs one discoverer and one worker per destination until disposed.
    //
    struct pipeline : infra::disposable
    {
    public:
        FANMV_DISABLE_COPY_CONSTRUCTOR(pipeline)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(pipeline)

        // transfer and probe default to rsync and the local filesystem
        explicit pipeline(
            std::shared_ptr<fanmv_program_options> program_options,
            std::shared_ptr<transfer_capability> transfer = nullptr,
            std::shared_ptr<filesystem_probe> probe = nullptr);

        bool init();

        void dispose_impl() noexcept override final;
        ~pipeline() noexcept override final { this->dispose(); }

        [[nodiscard]]
        bool has_fatal_error() const noexcept;

    private:
        bool prepare_probe_file();

    public:
        // NOTE: called on the discoverer thread
        std::function<void()> fatal_error_callback { nullptr };

        pipeline_state state;

        std::shared_ptr<discoverer> source_discoverer { nullptr };
        std::vector<std::shared_ptr<destination_worker>> workers { };

    private:
        static constexpr const char PROBE_FILE_NAME[] = ".fanmv_probe";

        stdfs::path _generated_probe_dir { };
    };

}  // namespace fanmv

#endif  // !defined(_FANMV_PIPELINE_H_INCLUDED_)
