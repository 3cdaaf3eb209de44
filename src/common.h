#if !defined(_FANMV_COMMON_H_INCLUDED_)
#define _FANMV_COMMON_H_INCLUDED_

#include "infra/infra.h"

#include "program_options.h"
#include "work_queue.h"
#include "lock_manager.h"
#include "transfer.h"
#include "destination.h"
#include "discoverer.h"
#include "destination_worker.h"
#include "pipeline.h"


#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)
