// ============================================================================
// fanout/fanout.hpp - Main Include Header
// ============================================================================
//
// This convenience header includes the complete fanout library.
// For smaller builds, include individual headers as needed.
//
// USAGE:
// ------
//   #include <fanout/fanout.hpp>
//   using namespace fanout;
//
// ============================================================================

#pragma once

// Core primitives
#include "fanout/core/check.hpp"
#include "fanout/core/defer.hpp"
#include "fanout/core/error.hpp"
#include "fanout/core/log.hpp"
#include "fanout/core/result.hpp"
#include "fanout/core/task.hpp"

// Cancellation
#include "fanout/core/cancellation.hpp"
#include "fanout/core/deadline_timer.hpp"

// Results
#include "fanout/core/aggregator.hpp"
#include "fanout/core/future.hpp"

// Worker pool
#include "fanout/pool/thread_utils.hpp"
#include "fanout/pool/work_item.hpp"
#include "fanout/pool/work_queue.hpp"
#include "fanout/pool/worker_pool.hpp"

// Fan-out / fan-in
#include "fanout/pool/fan_out.hpp"

// std::stop_token interop
#include "fanout/execution/stop_token_adapter.hpp"

// P2300 interop
#ifdef FANOUT_HAS_STDEXEC
#include "fanout/execution/scheduler.hpp"
#endif
