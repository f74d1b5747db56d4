#pragma once

#include "analysis_config.hpp"
#include "grid.hpp"
#include "status.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <memory>

// Computes the fractal dimension field of a square grid. Rows are split into
// disjoint ranges, one pool task per range; each task writes only its own
// rows of the output.
class FieldBuilder {
public:
    FieldBuilder();
    explicit FieldBuilder(int n_threads);

    // A set `cancel` flag, or a cancel() request, is checked before each row
    // range starts; ranges already running finish. Returns Cancelled if any
    // range was skipped, leaving `out` untouched.
    Status build(const Grid& grid, const AnalysisConfig& cfg, DimensionField& out,
                 const std::atomic<bool>* cancel = nullptr);

    // Safe from any thread. Stops the build in progress, or the next one if
    // none is running; the build that sees it clears the request.
    void cancel() { cancel_requested_.store(true); }

    // Rows finished so far by the running build.
    int rows_done() const { return rows_done_.load(std::memory_order_relaxed); }

    ThreadPool& pool() { return *pool_; }

    double last_build_ms  = 0.0;
    int    rows_computed  = 0;       // rows finished by the last build
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup
    int    rows_per_task  = 16;

    // n=0 restores hw_concurrency; n is capped at max_thread_count()
    void set_thread_count(int n);

private:
    std::unique_ptr<ThreadPool> pool_;
    std::atomic<bool>           cancel_requested_{false};
    std::atomic<int>            rows_done_{0};
};
