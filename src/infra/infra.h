#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#define _FANMV_INFRA_INFRA_H_INCLUDED_

#include "predef.h"
#include "macro.h"

#include "logging.h"
#include "assertion.h"
#include "sweeper.h"
#include "disposable.h"

#include "manual_reset_event.h"
#include "semaphore.h"
#include "sighandle.h"

#include "process.h"
#include "filesystem.h"
#include "dir_watcher.h"



//
// Struct for globally initialization and finalization
//
namespace infra
{
    struct global_initialize_finalize_t
    {
        FANMV_DISABLE_COPY_CONSTRUCTOR(global_initialize_finalize_t)
        FANMV_DISABLE_MOVE_CONSTRUCTOR(global_initialize_finalize_t)

        global_initialize_finalize_t()
        {
            // Initialize logging
            // This must be called BEFORE initializing everything else
            global_initialize_logging();
        }

        ~global_initialize_finalize_t() noexcept
        {
            // Finalize logging
            // This must be called AFTER finalizing everything else
            global_finalize_logging();
        }
    };

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
