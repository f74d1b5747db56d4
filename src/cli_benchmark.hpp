#pragma once

#include "analysis_config.hpp"
#include "field_builder.hpp"
#include "grid.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    FieldBuilder builder;
    const int hw = builder.hw_concurrency;

    constexpr int S = 256, RUNS = 4, BEST_N = 2;

    // Sierpinski-triangle bitmap: a known structure with dimension ~1.58
    Grid grid;
    grid.resize(S, S);
    for (int r = 0; r < S; ++r)
        for (int c = 0; c < S; ++c)
            grid.at(r, c) = (r & c) == 0 ? 1 : 0;

    struct TestCase {
        const char*   label;
        OccupancyMode occupancy;
        int           neighborhood;
    };

    const TestCase tests[] = {
        {"any, N=32", OccupancyMode::Any, 32},
        {"all, N=32", OccupancyMode::All, 32},
        {"any, N=64", OccupancyMode::Any, 64},
    };

    printf("boxcount CLI Benchmark\n");
    printf("%dx%d Sierpinski grid, B_min=2, k=2, %d runs (avg best %d)\n",
           S, S, RUNS, BEST_N);
    printf("Hardware threads: %d\n\n", hw);
    printf("%-20s %-8s %s\n", "Label", "Threads", "Mpix/s");
    printf("----------------------------------------\n");

    for (const auto& t : tests) {
        AnalysisConfig cfg;
        cfg.square_size       = S;
        cfg.neighborhood_size = t.neighborhood;
        cfg.occupancy         = t.occupancy;

        for (int n = 1; n <= hw; n *= 2) {
            builder.set_thread_count(n);
            DimensionField field;

            // Warm-up
            Status st = builder.build(grid, cfg, field);
            if (!st.ok()) {
                fprintf(stderr, "benchmark failed: %s\n", st.message.c_str());
                return 1;
            }

            std::vector<double> times(RUNS);
            for (int r = 0; r < RUNS; ++r) {
                st = builder.build(grid, cfg, field);
                if (!st.ok()) {
                    fprintf(stderr, "benchmark failed: %s\n", st.message.c_str());
                    return 1;
                }
                times[r] = builder.last_build_ms;
            }
            std::sort(times.begin(), times.end());
            double avg_ms = 0.0;
            for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
            avg_ms /= BEST_N;
            double mpixs = (S * S) / (avg_ms * 1000.0);

            printf("%-20s %-8d %6.3f\n", t.label, n, mpixs);
        }
    }
    return 0;
}
