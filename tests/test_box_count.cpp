#include "box_count.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <vector>

namespace {

Grid filled(int w, int h, uint8_t v)
{
    Grid g;
    g.resize(w, h);
    for (auto& c : g.cells) c = v;
    return g;
}

int zero_cells(const Grid& g)
{
    int n = 0;
    for (uint8_t v : g.cells) n += v == 0;
    return n;
}

AnalysisConfig window_config(int n, int min_box, int k)
{
    AnalysisConfig cfg;
    cfg.neighborhood_size = n;
    cfg.min_box_size      = min_box;
    cfg.scaling_factor    = k;
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// Box size progression: b < N/2
// ---------------------------------------------------------------------------
TEST(BoxSizes, StopsStrictlyBelowHalfWindow)
{
    EXPECT_EQ(box_sizes(2, 2, 32), (std::vector<int>{2, 4, 8}));
    EXPECT_EQ(box_sizes(1, 2, 8),  (std::vector<int>{1, 2}));
    EXPECT_EQ(box_sizes(1, 2, 4),  (std::vector<int>{1}));
    EXPECT_EQ(box_sizes(1, 3, 27), (std::vector<int>{1, 3, 9}));
}

TEST(BoxSizes, OddWindowUsesExactHalf)
{
    // 4 < 9/2 = 4.5
    EXPECT_EQ(box_sizes(1, 2, 9), (std::vector<int>{1, 2, 4}));
}

TEST(BoxSizes, DegenerateInputsYieldNothing)
{
    EXPECT_TRUE(box_sizes(0, 2, 32).empty());
    EXPECT_TRUE(box_sizes(2, 1, 32).empty());
    EXPECT_TRUE(box_sizes(16, 2, 32).empty());
}

// ---------------------------------------------------------------------------
// Counting
// ---------------------------------------------------------------------------
TEST(CountBoxes, FullFourByFourGrid)
{
    const Grid g = filled(4, 4, 1);
    EXPECT_EQ(count_boxes(g, 1, OccupancyMode::Any), 16);
    EXPECT_EQ(count_boxes(g, 2, OccupancyMode::Any), 4);
    EXPECT_EQ(count_boxes(g, 4, OccupancyMode::Any), 1);
    EXPECT_EQ(count_boxes(g, 2, OccupancyMode::All), 4);
}

TEST(CountBoxes, FourByFourWindowHasTooFewSizes)
{
    // With b < N/2 only b = 1 survives, so the 16/4/1 series is never fitted.
    const Grid g = filled(4, 4, 1);
    double dim = -1.0;
    const Status st = estimate_dimension(g, window_config(4, 1, 2), dim);
    EXPECT_EQ(st.code, ErrorCode::InsufficientSamples);
    EXPECT_EQ(dim, -1.0);
}

TEST(CountBoxes, EdgeBoxesAreClipped)
{
    const Grid full = filled(5, 5, 1);
    EXPECT_EQ(count_boxes(full, 2, OccupancyMode::Any), 9);
    EXPECT_EQ(count_boxes(full, 2, OccupancyMode::All), 9);

    // Only the bottom-right pixel is set: it fills the clipped 1x1 corner box.
    Grid corner = filled(5, 5, 0);
    corner.at(4, 4) = 1;
    EXPECT_EQ(count_boxes(corner, 2, OccupancyMode::Any), 1);
    EXPECT_EQ(count_boxes(corner, 2, OccupancyMode::All), 1);
}

TEST(CountBoxes, OccupancyModesDiffer)
{
    Grid g = filled(4, 4, 0);
    g.at(0, 0) = 1;
    EXPECT_EQ(count_boxes(g, 2, OccupancyMode::Any), 1);
    EXPECT_EQ(count_boxes(g, 2, OccupancyMode::All), 0);
}

TEST(LogCount, ZeroMapsToPositiveZero)
{
    EXPECT_EQ(log_count(0), 0.0);
    EXPECT_FALSE(std::signbit(log_count(0)));
    EXPECT_EQ(log_count(1), 0.0);
    EXPECT_NEAR(log_count(16), std::log(16.0), 1e-15);
}

// ---------------------------------------------------------------------------
// Regression
// ---------------------------------------------------------------------------
TEST(FitLine, RecoversExactSlope)
{
    std::vector<DataPoint> pts;
    for (int b = 2; b <= 64; b *= 2) {
        DataPoint p;
        p.log_size  = std::log(static_cast<double>(b));
        p.log_count = 3.0 - 1.5 * p.log_size;
        pts.push_back(p);
    }
    RegressionResult fit;
    ASSERT_TRUE(fit_line(pts.data(), pts.size(), fit).ok());
    EXPECT_NEAR(fit.slope, -1.5, 1e-9);
    EXPECT_NEAR(fit.intercept, 3.0, 1e-9);
}

TEST(FitLine, NeedsTwoPoints)
{
    DataPoint p;
    RegressionResult fit;
    EXPECT_EQ(fit_line(&p, 1, fit).code, ErrorCode::InsufficientSamples);
    EXPECT_EQ(fit_line(nullptr, 0, fit).code, ErrorCode::InsufficientSamples);
}

TEST(FitLine, IdenticalPointsGiveZeroSlope)
{
    std::vector<DataPoint> pts(4);
    for (auto& p : pts) { p.log_size = 1.0; p.log_count = 2.0; }
    RegressionResult fit;
    ASSERT_TRUE(fit_line(pts.data(), pts.size(), fit).ok());
    EXPECT_EQ(fit.slope, 0.0);
    EXPECT_EQ(fit.intercept, 2.0);
}

TEST(DimensionFromSlope, NegatesAndNormalisesZero)
{
    EXPECT_EQ(dimension_from_slope(-1.25), 1.25);
    EXPECT_FALSE(std::signbit(dimension_from_slope(0.0)));
    EXPECT_FALSE(std::signbit(dimension_from_slope(-0.0)));
}

// ---------------------------------------------------------------------------
// Estimator
// ---------------------------------------------------------------------------
TEST(EstimateDimension, FilledWindowIsTwoDimensional)
{
    // counts (N/b)^2 lie on a line of slope -2
    double dim = 0.0;
    ASSERT_TRUE(estimate_dimension(filled(8, 8, 1), window_config(8, 1, 2), dim).ok());
    EXPECT_NEAR(dim, 2.0, 1e-12);

    ASSERT_TRUE(estimate_dimension(filled(32, 32, 255), window_config(32, 2, 2), dim).ok());
    EXPECT_NEAR(dim, 2.0, 1e-12);
}

TEST(EstimateDimension, FilledWindowAllModeMatchesAnyMode)
{
    AnalysisConfig cfg = window_config(32, 2, 2);
    cfg.occupancy = OccupancyMode::All;
    double dim = 0.0;
    ASSERT_TRUE(estimate_dimension(filled(32, 32, 1), cfg, dim).ok());
    EXPECT_NEAR(dim, 2.0, 1e-12);
}

TEST(EstimateDimension, StraightLineIsOneDimensional)
{
    Grid g = filled(32, 32, 0);
    for (int c = 0; c < 32; ++c) g.at(5, c) = 1;
    double dim = 0.0;
    ASSERT_TRUE(estimate_dimension(g, window_config(32, 2, 2), dim).ok());
    EXPECT_NEAR(dim, 1.0, 1e-12);
}

TEST(EstimateDimension, EmptyWindowUsesSentinel)
{
    double dim = -1.0;
    ASSERT_TRUE(estimate_dimension(filled(32, 32, 0), window_config(32, 2, 2), dim).ok());
    EXPECT_EQ(dim, 0.0);
    EXPECT_FALSE(std::signbit(dim));
}

TEST(EstimateDimension, SinglePixelIsZeroDimensional)
{
    Grid g = filled(32, 32, 0);
    g.at(16, 16) = 1;
    double dim = -1.0;
    ASSERT_TRUE(estimate_dimension(g, window_config(32, 2, 2), dim).ok());
    EXPECT_EQ(dim, 0.0);
}

TEST(GlobalDimension, FilledGrid)
{
    AnalysisConfig cfg;
    double dim = 0.0;
    ASSERT_TRUE(global_dimension(filled(128, 128, 1), cfg, 64, dim).ok());
    EXPECT_NEAR(dim, 2.0, 1e-12);
}

// ---------------------------------------------------------------------------
// Neighborhoods
// ---------------------------------------------------------------------------
TEST(Neighborhood, EvenWindowOffsets)
{
    Grid src;
    src.resize(10, 10);
    for (int r = 0; r < 10; ++r)
        for (int c = 0; c < 10; ++c) src.at(r, c) = static_cast<uint8_t>(r * 10 + c);

    Grid nb;
    extract_neighborhood(src, 5, 5, 4, nb);
    ASSERT_EQ(nb.width, 4);
    ASSERT_EQ(nb.height, 4);
    EXPECT_EQ(nb.at(0, 0), 33);  // offsets start at -2
    EXPECT_EQ(nb.at(3, 3), 66);  // and end at +1
}

TEST(Neighborhood, OddWindowIsCentred)
{
    Grid src;
    src.resize(10, 10);
    for (int r = 0; r < 10; ++r)
        for (int c = 0; c < 10; ++c) src.at(r, c) = static_cast<uint8_t>(r * 10 + c);

    Grid nb;
    extract_neighborhood(src, 5, 5, 3, nb);
    EXPECT_EQ(nb.at(0, 0), 44);
    EXPECT_EQ(nb.at(1, 1), 55);
    EXPECT_EQ(nb.at(2, 2), 66);
}

TEST(Neighborhood, OutOfBoundsSamplesAreZero)
{
    const Grid src = filled(9, 9, 7);
    Grid nb;
    extract_neighborhood(src, 0, 0, 4, nb);
    // rows/cols -2 and -1 fall outside
    for (int r = 0; r < 4; ++r)
        for (int c = 0; c < 4; ++c)
            EXPECT_EQ(nb.at(r, c), (r >= 2 && c >= 2) ? 7 : 0);
}

TEST(Neighborhood, CornerSeesMorePaddingThanCentre)
{
    const Grid src = filled(9, 9, 1);
    Grid corner, centre;
    extract_neighborhood(src, 0, 0, 4, corner);
    extract_neighborhood(src, 4, 4, 4, centre);
    EXPECT_EQ(zero_cells(centre), 0);
    EXPECT_EQ(zero_cells(corner), 12);
    EXPECT_GT(zero_cells(corner), zero_cells(centre));
}

TEST(Neighborhood, WindowLargerThanSource)
{
    const Grid src = filled(2, 3, 5);
    Grid nb;
    extract_neighborhood(src, 1, 1, 8, nb);
    int set = 0;
    for (uint8_t v : nb.cells) set += v == 5;
    EXPECT_EQ(set, 6);
    EXPECT_EQ(nb.cells.size(), 64u);
}

TEST(BoxCounter, MatchesExtractThenEstimate)
{
    Grid src = filled(40, 40, 0);
    for (int r = 0; r < 40; ++r)
        for (int c = 0; c < 40; ++c)
            if ((r & c) == 0) src.at(r, c) = 1;

    const AnalysisConfig cfg = window_config(16, 1, 2);
    BoxCounter counter(cfg);
    ASSERT_EQ(counter.sizes(), (std::vector<int>{1, 2, 4}));

    const int cells[][2] = {{0, 0}, {7, 13}, {20, 20}, {39, 39}};
    for (const auto& p : cells) {
        Grid nb;
        extract_neighborhood(src, p[0], p[1], cfg.neighborhood_size, nb);
        double expected = 0.0, got = 0.0;
        ASSERT_TRUE(estimate_dimension(nb, cfg, expected).ok());
        ASSERT_TRUE(counter.dimension_at(src, p[0], p[1], got).ok());
        EXPECT_DOUBLE_EQ(got, expected);
    }
}

TEST(BoxCounter, ReportsInsufficientSamples)
{
    BoxCounter counter(window_config(4, 1, 2));
    double dim = 0.0;
    EXPECT_EQ(counter.dimension_at(filled(4, 4, 1), 2, 2, dim).code,
              ErrorCode::InsufficientSamples);
}

TEST(DimensionUpperBound, AnyOccupancyIsPlanar)
{
    AnalysisConfig cfg;
    EXPECT_EQ(dimension_upper_bound(cfg), 2.0);
    cfg.neighborhood_size = 33;
    cfg.min_box_size      = 1;
    EXPECT_EQ(dimension_upper_bound(cfg), 2.0);
}

TEST(DimensionUpperBound, AllOccupancyFollowsSentinelFit)
{
    AnalysisConfig cfg;
    cfg.occupancy = OccupancyMode::All;
    // sizes 2, 4, 8 in a 32 window: full count 256 at b=2, 0 elsewhere
    // gives slope -ln(256) ln2 / (2 ln^2 2) = -4
    EXPECT_NEAR(dimension_upper_bound(cfg), 4.0, 1e-6);
}

TEST(DimensionUpperBound, CoversEveryAllOccupancyWindow)
{
    AnalysisConfig cfg;
    cfg.occupancy         = OccupancyMode::All;
    cfg.neighborhood_size = 16;
    cfg.min_box_size      = 1;
    const double bound = dimension_upper_bound(cfg);

    // checkerboards and sparse lattices drive the coarse counts to zero
    uint32_t seed = 7;
    for (int trial = 0; trial < 200; ++trial) {
        Grid nb;
        nb.resize(16, 16);
        const int density = trial % 10;
        for (auto& c : nb.cells) {
            seed = seed * 1664525u + 1013904223u;
            c = static_cast<int>((seed >> 8) % 10) < density ? 1 : 0;
        }
        double dim = 0.0;
        ASSERT_TRUE(estimate_dimension(nb, cfg, dim).ok());
        EXPECT_GE(dim, 0.0);
        EXPECT_LE(dim, bound);
    }
}
