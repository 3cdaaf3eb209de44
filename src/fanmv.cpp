#include "common.h"


int main(int argc, char* argv[])
{
    //
    // Global initializer and finalizer
    //
    [[maybe_unused]]
    const infra::global_initialize_finalize_t __init_fin;

    //
    // Parse command line arguments
    //
    std::shared_ptr<fanmv::fanmv_program_options> options = std::make_shared<fanmv::fanmv_program_options>();
    CLI::App app("Move new postdata_*.bin files to one of several destinations", "fanmv");
    options->add_options(app);
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (!options->post_process()) {
        LOG_ERROR("fanmv_program_options post_process() failed");
        return 1;
    }

    // Initialize signal handler
    infra::sighandle::setup_signal_handler();

    std::shared_ptr<fanmv::pipeline> pipeline = std::make_shared<fanmv::pipeline>(options);
    pipeline->fatal_error_callback = []() {
        infra::sighandle::require_exit();
    };
    bool success = false;

    {
        //
        // On-exit sweeper
        //
        infra::sweeper exit_sweep = [&]() {
            // Set exit required flag first!
            if (!infra::sighandle::is_exit_required()) {
                infra::sighandle::require_exit();
            }

            pipeline->dispose();
            success = !pipeline->has_fatal_error();
            pipeline.reset();

            LOG_DEBUG("Bye!");
        };

        if (!pipeline->init()) {
            LOG_ERROR("Init pipeline failed");
            return 1;
        }

        // Wait for exit...
        LOG_TRACE("Waiting for exit on main thread...");
        infra::sighandle::wait_for_exit_required();
    }

    return (success ? 0 : 1);
}
