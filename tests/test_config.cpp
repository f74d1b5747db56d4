#include "analysis_config.hpp"

#include <gtest/gtest.h>

TEST(AnalysisConfig, DefaultsAreValid)
{
    AnalysisConfig cfg;
    EXPECT_TRUE(validate_config(cfg).ok());
    EXPECT_EQ(box_size_count(cfg), 3);  // 2, 4, 8 below 32/2
}

TEST(AnalysisConfig, TooFewBoxSizes)
{
    AnalysisConfig cfg;
    cfg.neighborhood_size = 4;
    cfg.min_box_size      = 1;
    EXPECT_EQ(box_size_count(cfg), 1);
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::InsufficientSamples);

    cfg.neighborhood_size = 5;  // 2 < 2.5
    EXPECT_EQ(box_size_count(cfg), 2);
    EXPECT_TRUE(validate_config(cfg).ok());
}

TEST(AnalysisConfig, RejectsOutOfRangeValues)
{
    AnalysisConfig cfg;
    cfg.scaling_factor = 1;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.threshold = 256;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.square_size = 0;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.min_box_size = 0;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.thread_count = -2;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);
}

TEST(AnalysisConfig, RejectsOversizedResources)
{
    AnalysisConfig cfg;
    cfg.square_size = MAX_SQUARE_SIZE;
    EXPECT_TRUE(validate_config(cfg).ok());
    cfg.square_size = 200000;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.square_size       = 16;
    cfg.neighborhood_size = 16;
    EXPECT_TRUE(validate_config(cfg).ok());
    cfg.neighborhood_size = 17;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);

    cfg = AnalysisConfig{};
    cfg.thread_count = max_thread_count();
    EXPECT_TRUE(validate_config(cfg).ok());
    cfg.thread_count = max_thread_count() + 1;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);
    cfg.thread_count = 1000000;
    EXPECT_EQ(validate_config(cfg).code, ErrorCode::MalformedInput);
}

TEST(AnalysisConfig, ParsesCliSpellings)
{
    BinarizeMode b = BinarizeMode::Fixed;
    EXPECT_TRUE(parse_binarize_mode("otsu", b));
    EXPECT_EQ(b, BinarizeMode::Otsu);
    EXPECT_FALSE(parse_binarize_mode("sauvola", b));
    EXPECT_EQ(b, BinarizeMode::Otsu);

    OccupancyMode o = OccupancyMode::Any;
    EXPECT_TRUE(parse_occupancy_mode("all", o));
    EXPECT_EQ(o, OccupancyMode::All);

    BinaryEncoding e = BinaryEncoding::ZeroOne;
    EXPECT_TRUE(parse_binary_encoding("0255", e));
    EXPECT_EQ(foreground_value(e), 255);
    EXPECT_FALSE(parse_binary_encoding("0256", e));
}

TEST(AnalysisConfig, NamesRoundTrip)
{
    for (int i = 0; i < BINARIZE_MODE_COUNT; ++i) {
        const BinarizeMode m = static_cast<BinarizeMode>(i);
        BinarizeMode parsed = BinarizeMode::None;
        ASSERT_TRUE(parse_binarize_mode(binarize_mode_name(m), parsed));
        EXPECT_EQ(parsed, m);
    }
    EXPECT_STREQ(error_code_name(ErrorCode::PaletteGap), "PaletteGap");
}
