#include "binarize.hpp"
#include "thread_pool.hpp"

#include <cstdio>
#include <mutex>
#include <utility>

Histogram compute_histogram(const Grid& grid, ThreadPool* pool)
{
    Histogram hist{};
    const int H = grid.height;
    const int W = grid.width;
    if (H <= 0 || W <= 0) return hist;

    if (!pool || pool->size() < 2) {
        for (uint8_t v : grid.cells) ++hist[v];
        return hist;
    }

    std::mutex merge_mtx;
    const int chunk = (H + pool->size() - 1) / pool->size();
    for_each_row_range(*pool, H, chunk, [&](int r0, int r1) {
        Histogram part{};
        for (int r = r0; r < r1; ++r) {
            const uint8_t* row = grid.row_ptr(r);
            for (int c = 0; c < W; ++c) ++part[row[c]];
        }
        std::lock_guard<std::mutex> lock(merge_mtx);
        for (int i = 0; i < 256; ++i) hist[i] += part[i];
    });
    return hist;
}

OtsuResult otsu_threshold(const Histogram& hist)
{
    OtsuResult res;

    uint64_t total = 0, total_sum = 0;
    for (int i = 0; i < 256; ++i) {
        total     += hist[i];
        total_sum += hist[i] * static_cast<uint64_t>(i);
    }
    if (total == 0) return res;

    // Integer running sums keep the weights exact, so empty bins between two
    // clusters produce bit-identical variances and the lowest t wins.
    const double n = static_cast<double>(total);
    uint64_t bg_count = 0, bg_sum = 0;
    for (int t = 0; t < 256; ++t) {
        bg_count += hist[t];
        bg_sum   += hist[t] * static_cast<uint64_t>(t);
        if (bg_count == 0 || bg_count == total) continue;  // one class empty

        const uint64_t fg_count = total - bg_count;
        const double w_bg    = static_cast<double>(bg_count) / n;
        const double w_fg    = static_cast<double>(fg_count) / n;
        const double mean_bg = static_cast<double>(bg_sum) / static_cast<double>(bg_count);
        const double mean_fg = static_cast<double>(total_sum - bg_sum)
                             / static_cast<double>(fg_count);
        const double d       = mean_bg - mean_fg;
        const double var     = w_bg * w_fg * d * d;
        if (var > res.variance) {
            res.variance  = var;
            res.threshold = t;
            res.separable = true;
        }
    }
    return res;
}

void binarize_fixed(const Grid& src, int threshold, BinaryEncoding enc, Grid& out)
{
    const uint8_t fg = foreground_value(enc);
    Grid bin;
    bin.resize(src.width, src.height);
    for (size_t i = 0; i < src.cells.size(); ++i)
        bin.cells[i] = src.cells[i] > threshold ? fg : 0;
    out = std::move(bin);
}

Status binarize(const Grid& src, const AnalysisConfig& cfg, ThreadPool* pool,
                Grid& out, int& threshold_used)
{
    if (src.width <= 0 || src.height <= 0)
        return Status(ErrorCode::MalformedInput, "cannot binarize an empty grid");

    switch (cfg.binarize_mode) {
        case BinarizeMode::None:
            out = src;
            threshold_used = -1;
            return {};
        case BinarizeMode::Fixed:
            binarize_fixed(src, cfg.threshold, cfg.binary_encoding, out);
            threshold_used = cfg.threshold;
            return {};
        case BinarizeMode::Otsu: {
            const OtsuResult otsu = otsu_threshold(compute_histogram(src, pool));
            threshold_used = otsu.threshold;
            if (otsu.separable) {
                binarize_fixed(src, otsu.threshold, cfg.binary_encoding, out);
            } else {
                out.resize(src.width, src.height);
            }
            return {};
        }
    }
    char msg[64];
    std::snprintf(msg, sizeof(msg), "unknown binarize mode %d",
                  static_cast<int>(cfg.binarize_mode));
    return Status(ErrorCode::MalformedInput, msg);
}
