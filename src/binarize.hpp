#pragma once

#include "analysis_config.hpp"
#include "grid.hpp"
#include "status.hpp"

#include <array>
#include <cstdint>

class ThreadPool;

using Histogram = std::array<uint64_t, 256>;

// 256-bin intensity histogram. With a pool, rows are split into ranges whose
// partial histograms are merged at the end.
Histogram compute_histogram(const Grid& grid, ThreadPool* pool = nullptr);

struct OtsuResult {
    int    threshold = 0;
    double variance  = 0.0;    // between-class variance at `threshold`
    bool   separable = false;  // false when every sample has the same value
};

// Scans t = 0..255 left to right and keeps the first t with the largest
// between-class variance. A single-valued histogram has variance 0 for every
// t, so the threshold stays 0 and the result is marked not separable.
OtsuResult otsu_threshold(const Histogram& hist);

// value > threshold → foreground, else 0.
void binarize_fixed(const Grid& src, int threshold, BinaryEncoding enc, Grid& out);

// Applies cfg.binarize_mode. `threshold_used` receives the effective cutoff
// (-1 for BinarizeMode::None). A non-separable Otsu input binarizes to all
// background.
Status binarize(const Grid& src, const AnalysisConfig& cfg, ThreadPool* pool,
                Grid& out, int& threshold_used);
