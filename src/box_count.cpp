#include "box_count.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

// -----------------------------------------------------------------------
// Neighborhood extraction
// -----------------------------------------------------------------------
void extract_neighborhood(const Grid& src, int row, int col, int size, Grid& out)
{
    if (out.width != size || out.height != size)
        out.resize(size, size);

    const int half = size / 2;
    const int r0   = row - half;
    const int c0   = col - half;

    // In-bounds column span of every window row, fixed for the whole window.
    const int cb = std::max(0, -c0);
    const int ce = std::min(size, src.width - c0);

    for (int i = 0; i < size; ++i) {
        uint8_t*  dst = out.cells.data() + static_cast<size_t>(i) * size;
        const int sr  = r0 + i;
        if (sr < 0 || sr >= src.height || cb >= ce) {
            std::memset(dst, 0, static_cast<size_t>(size));
            continue;
        }
        if (cb > 0) std::memset(dst, 0, static_cast<size_t>(cb));
        std::memcpy(dst + cb, src.row_ptr(sr) + c0 + cb, static_cast<size_t>(ce - cb));
        if (ce < size) std::memset(dst + ce, 0, static_cast<size_t>(size - ce));
    }
}

// -----------------------------------------------------------------------
// Box counting
// -----------------------------------------------------------------------
std::vector<int> box_sizes(int min_box, int scaling, int limit)
{
    std::vector<int> sizes;
    if (min_box < 1 || scaling < 2) return sizes;
    for (long long b = min_box; 2 * b < limit; b *= scaling)
        sizes.push_back(static_cast<int>(b));
    return sizes;
}

static bool box_occupied(const Grid& g, int top, int left, int bottom, int right,
                         OccupancyMode mode)
{
    for (int r = top; r < bottom; ++r) {
        const uint8_t* row = g.row_ptr(r);
        for (int c = left; c < right; ++c) {
            if (mode == OccupancyMode::Any) {
                if (row[c] != 0) return true;
            } else if (row[c] == 0) {
                return false;
            }
        }
    }
    return mode == OccupancyMode::All;
}

int count_boxes(const Grid& grid, int box, OccupancyMode mode)
{
    if (box < 1) return 0;
    int count = 0;
    for (int top = 0; top < grid.height; top += box) {
        const int bottom = std::min(top + box, grid.height);
        for (int left = 0; left < grid.width; left += box) {
            const int right = std::min(left + box, grid.width);
            if (box_occupied(grid, top, left, bottom, right, mode)) ++count;
        }
    }
    return count;
}

double log_count(int count)
{
    return count > 0 ? std::log(static_cast<double>(count)) : 0.0;
}

// -----------------------------------------------------------------------
// Regression
// -----------------------------------------------------------------------
Status fit_line(const DataPoint* points, size_t n, RegressionResult& out)
{
    if (n < 2) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "regression needs 2 points, got %zu", n);
        return Status(ErrorCode::InsufficientSamples, msg);
    }

    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mx += points[i].log_size;
        my += points[i].log_count;
    }
    mx /= static_cast<double>(n);
    my /= static_cast<double>(n);

    double sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = points[i].log_size - mx;
        sxx += dx * dx;
        sxy += dx * (points[i].log_count - my);
    }

    out.slope     = (sxx > 0.0) ? sxy / sxx : 0.0;
    out.intercept = my - out.slope * mx;
    return {};
}

double dimension_from_slope(double slope)
{
    // -0.0 would print as "-0" in the matrix and JSON dumps
    return slope == 0.0 ? 0.0 : -slope;
}

double dimension_upper_bound(const AnalysisConfig& cfg)
{
    if (cfg.occupancy == OccupancyMode::Any) return 2.0;

    const int n = cfg.neighborhood_size;
    const std::vector<int> sizes = box_sizes(cfg.min_box_size, cfg.scaling_factor, n);
    if (sizes.size() < 2) return 2.0;

    double mx = 0.0;
    for (int b : sizes) mx += std::log(static_cast<double>(b));
    mx /= static_cast<double>(sizes.size());

    double sxx = 0.0, num = 0.0;
    for (int b : sizes) {
        const double dx = std::log(static_cast<double>(b)) - mx;
        sxx += dx * dx;
        if (dx < 0.0) {
            const double per_side = static_cast<double>((n + b - 1) / b);
            num -= dx * std::log(per_side * per_side);
        }
    }
    // 1e-9 absorbs rounding between this sum and the per-window fit
    return std::max(2.0, num / sxx + 1e-9);
}

static Status estimate_with_sizes(const Grid& g, const std::vector<int>& sizes,
                                  OccupancyMode mode, double& dim)
{
    std::vector<DataPoint> pts;
    pts.reserve(sizes.size());
    for (int b : sizes) {
        DataPoint p;
        p.log_size  = std::log(static_cast<double>(b));
        p.log_count = log_count(count_boxes(g, b, mode));
        pts.push_back(p);
    }
    RegressionResult fit;
    Status st = fit_line(pts.data(), pts.size(), fit);
    if (!st.ok()) return st;
    dim = dimension_from_slope(fit.slope);
    return {};
}

Status estimate_dimension(const Grid& neighborhood, const AnalysisConfig& cfg, double& dim)
{
    const int n = std::min(neighborhood.width, neighborhood.height);
    return estimate_with_sizes(neighborhood,
                               box_sizes(cfg.min_box_size, cfg.scaling_factor, n),
                               cfg.occupancy, dim);
}

Status global_dimension(const Grid& grid, const AnalysisConfig& cfg, int max_box, double& dim)
{
    if (grid.width <= 0 || grid.height <= 0)
        return Status(ErrorCode::MalformedInput, "empty grid");
    return estimate_with_sizes(grid,
                               box_sizes(cfg.min_box_size, cfg.scaling_factor, 2 * max_box),
                               cfg.occupancy, dim);
}

// -----------------------------------------------------------------------
// BoxCounter
// -----------------------------------------------------------------------
BoxCounter::BoxCounter(const AnalysisConfig& cfg)
    : window_(cfg.neighborhood_size)
    , mode_(cfg.occupancy)
    , sizes_(box_sizes(cfg.min_box_size, cfg.scaling_factor, cfg.neighborhood_size))
{
    log_sizes_.reserve(sizes_.size());
    for (int b : sizes_) log_sizes_.push_back(std::log(static_cast<double>(b)));
    points_.resize(sizes_.size());
    nb_.resize(window_, window_);
}

Status BoxCounter::dimension_at(const Grid& src, int row, int col, double& dim)
{
    extract_neighborhood(src, row, col, window_, nb_);
    for (size_t i = 0; i < sizes_.size(); ++i) {
        points_[i].log_size  = log_sizes_[i];
        points_[i].log_count = log_count(count_boxes(nb_, sizes_[i], mode_));
    }
    RegressionResult fit;
    Status st = fit_line(points_.data(), points_.size(), fit);
    if (!st.ok()) return st;
    dim = dimension_from_slope(fit.slope);
    return {};
}
