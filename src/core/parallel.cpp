#include "core/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace vinyl {

u32 resolve_worker_count(u32 requested, u32 rows) {
    u32 workers = requested;
    if (workers == 0) workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    return std::max<u32>(1, std::min(workers, rows));
}

void parallel_rows(u32 rows, u32 workers, const std::function<void(u32)>& row_fn) {
    if (rows == 0) return;
    workers = resolve_worker_count(workers, rows);

    if (workers == 1) {
        for (u32 y = 0; y < rows; ++y) row_fn(y);
        return;
    }

    std::atomic<u32> next_row{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        try {
            while (true) {
                u32 y = next_row.fetch_add(1);
                if (y >= rows) break;
                row_fn(y);
            }
        } catch (...) {
            // Stop handing out rows and rethrow on the calling thread.
            next_row.store(rows);
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) failure = std::current_exception();
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (u32 i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // Thread creation failed: drain the started workers before rethrowing.
        next_row.store(rows);
        for (auto& t : pool) t.join();
        throw;
    }
    for (auto& t : pool) {
        t.join();
    }

    if (failure) std::rethrow_exception(failure);
}

} // namespace vinyl
