#pragma once

#include "analysis_config.hpp"
#include "grid.hpp"
#include "status.hpp"

#include <cstddef>
#include <vector>

// One regression input: (ln box size, ln box count).
struct DataPoint {
    double log_size  = 0.0;
    double log_count = 0.0;
};

struct RegressionResult {
    double slope     = 0.0;
    double intercept = 0.0;
};

// size x size window centred on (row, col). Offsets run over
// [-floor(size/2), ceil(size/2)) on both axes; samples outside `src` are 0.
void extract_neighborhood(const Grid& src, int row, int col, int size, Grid& out);

// Box sizes B_min, B_min*k, B_min*k^2, ... while 2*b < limit.
std::vector<int> box_sizes(int min_box, int scaling, int limit);

// Tiles the grid into ceil(W/b) x ceil(H/b) boxes, clipping the last row and
// column of boxes at the grid edge, and counts the occupied ones.
int count_boxes(const Grid& grid, int box, OccupancyMode mode);

// ln(count), with ln(0) replaced by the sentinel 0.0. The sentinel pulls the
// fit toward zero slope for sparse windows; callers rely on it never being
// -inf or NaN.
double log_count(int count);

// Ordinary least squares. InsufficientSamples below 2 points; zero spread in
// x gives slope 0 instead of a division by zero.
Status fit_line(const DataPoint* points, size_t n, RegressionResult& out);

// Negated slope of the log-log fit, normalised so a flat fit returns +0.0.
double dimension_from_slope(double slope);

// Largest dimension the estimator can return for `cfg`. Counts never grow
// with box size, so estimates are >= 0 in both modes. Any occupancy also
// never drops by more than k^2 per step, capping the slope at -2. All
// occupancy has no such floor; the ln(0) sentinel can push the estimate up to
// the fit of full counts ceil(N/b)^2 on the small boxes and 0 on the rest.
double dimension_upper_bound(const AnalysisConfig& cfg);

// Box-counting dimension of a neighborhood with the box progression and
// occupancy mode from `cfg`.
Status estimate_dimension(const Grid& neighborhood, const AnalysisConfig& cfg, double& dim);

// Single-window estimate over a whole grid, box sizes below `max_box`.
Status global_dimension(const Grid& grid, const AnalysisConfig& cfg, int max_box, double& dim);

// Per-worker scratch state for the field builder: one neighborhood buffer and
// one point list reused for every pixel.
class BoxCounter {
public:
    explicit BoxCounter(const AnalysisConfig& cfg);

    Status dimension_at(const Grid& src, int row, int col, double& dim);

    const std::vector<int>&       sizes()  const { return sizes_; }
    const std::vector<DataPoint>& points() const { return points_; }

private:
    int                    window_;
    OccupancyMode          mode_;
    std::vector<int>       sizes_;
    std::vector<double>    log_sizes_;
    std::vector<DataPoint> points_;
    Grid                   nb_;
};
