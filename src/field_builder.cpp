#include "field_builder.hpp"
#include "box_count.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------
// Constructor — detect core count, build thread pool
// -----------------------------------------------------------------------
FieldBuilder::FieldBuilder() : FieldBuilder(0) {}

FieldBuilder::FieldBuilder(int n_threads)
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    set_thread_count(n_threads);
}

void FieldBuilder::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    n = std::min(n, max_thread_count());
    pool_ = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Top-level build — splits rows into ranges and dispatches to the pool
// -----------------------------------------------------------------------
Status FieldBuilder::build(const Grid& grid, const AnalysisConfig& cfg, DimensionField& out,
                           const std::atomic<bool>* cancel)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    rows_computed = 0;
    rows_done_.store(0);

    Status st = validate_config(cfg);
    if (!st.ok()) return st;
    if (grid.width <= 0 || grid.height <= 0)
        return Status(ErrorCode::MalformedInput, "cannot build a field over an empty grid");

    auto cancelled = [&] {
        return cancel_requested_.load(std::memory_order_relaxed) ||
               (cancel && cancel->load(std::memory_order_relaxed));
    };

    DimensionField field;
    field.resize(grid.width, grid.height);

    std::mutex        status_mtx;
    Status            first_error;
    std::atomic<bool> skipped{false};

    for_each_row_range(*pool_, grid.height, rows_per_task, [&](int r0, int r1) {
        if (cancelled()) {
            skipped.store(true);
            return;
        }
        BoxCounter counter(cfg);
        for (int r = r0; r < r1; ++r) {
            double* row = field.values.data() + static_cast<size_t>(r) * grid.width;
            for (int c = 0; c < grid.width; ++c) {
                Status cell = counter.dimension_at(grid, r, c, row[c]);
                if (!cell.ok()) {
                    std::lock_guard<std::mutex> lock(status_mtx);
                    if (first_error.ok()) first_error = std::move(cell);
                    return;
                }
            }
            rows_done_.fetch_add(1, std::memory_order_relaxed);
        }
    });

    rows_computed = rows_done_.load();
    cancel_requested_.store(false);
    last_build_ms = std::chrono::duration<double, std::milli>(
                        clock::now() - t0).count();

    if (!first_error.ok()) return first_error;
    if (skipped.load()) {
        char msg[96];
        std::snprintf(msg, sizeof(msg), "field build cancelled after %d of %d rows",
                      rows_computed, grid.height);
        return Status(ErrorCode::Cancelled, msg);
    }
    out = std::move(field);
    return {};
}
