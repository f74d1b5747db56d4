#pragma once

#include "heatmap_palette.hpp"
#include "status.hpp"

enum class BinarizeMode {
    None  = 0,  // run the field on raw intensities (non-zero = occupied)
    Fixed = 1,  // value > threshold
    Otsu  = 2,  // value > threshold chosen by between-class variance
};
constexpr int BINARIZE_MODE_COUNT = 3;

enum class BinaryEncoding {
    ZeroOne = 0,  // foreground = 1
    ZeroMax = 1,  // foreground = 255
};

enum class OccupancyMode {
    Any = 0,  // a box counts if at least one sampled pixel is non-zero
    All = 1,  // a box counts only if every sampled pixel is non-zero
};

struct AnalysisConfig {
    int            square_size       = 1024;  // S
    int            neighborhood_size = 32;    // N
    int            min_box_size      = 2;     // B_min
    int            scaling_factor    = 2;     // k
    BinarizeMode   binarize_mode     = BinarizeMode::Fixed;
    int            threshold         = 113;   // T, fixed mode only
    BinaryEncoding binary_encoding   = BinaryEncoding::ZeroOne;
    OccupancyMode  occupancy         = OccupancyMode::Any;
    HeatmapPalette palette           = {};
    int            thread_count      = 0;     // 0 = hardware concurrency
};

// Largest accepted canvas side. The field alone takes 8 bytes per cell.
constexpr int MAX_SQUARE_SIZE = 16384;

// Four workers per logical CPU (4 when the count is unknown).
int max_thread_count();

// Checks every tunable once, before any per-pixel work is started:
// 1 <= S <= MAX_SQUARE_SIZE, 2 <= N <= S, thread_count <= max_thread_count().
Status validate_config(const AnalysisConfig& cfg);

// Number of box sizes b = B_min * k^i with b < N/2.
int box_size_count(const AnalysisConfig& cfg);

inline unsigned char foreground_value(BinaryEncoding enc)
{
    return enc == BinaryEncoding::ZeroMax ? 255 : 1;
}

const char* binarize_mode_name(BinarizeMode m);
const char* occupancy_mode_name(OccupancyMode m);

// CLI spellings. Return false on an unknown name and leave `out` untouched.
bool parse_binarize_mode(const char* s, BinarizeMode& out);
bool parse_occupancy_mode(const char* s, OccupancyMode& out);
bool parse_binary_encoding(const char* s, BinaryEncoding& out);
