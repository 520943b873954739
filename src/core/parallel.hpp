#pragma once

#include "core/types.hpp"

#include <functional>

namespace vinyl {

/// Resolve a requested worker count (0 = hardware concurrency), capped at
/// the number of rows.
u32 resolve_worker_count(u32 requested, u32 rows);

/// Run row_fn(y) once for every y in [0, rows), spreading rows across worker
/// threads. Each row is handed to exactly one worker, so row_fn may write the
/// row's slice of a shared buffer without locking. Returns after every worker
/// has joined.
void parallel_rows(u32 rows, u32 workers, const std::function<void(u32)>& row_fn);

} // namespace vinyl
