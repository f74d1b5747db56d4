#pragma once

#include "status.hpp"

#include <cstdint>

enum class PaletteKind {
    Buckets   = 0,  // discrete 0.10-wide buckets over [0, 2]
    Gradient  = 1,  // red = 255 t, blue = 255 (1 - t), green = 0
    Fire      = 2,
    Ice       = 3,
    Grayscale = 4,
};
constexpr int PALETTE_KIND_COUNT = 5;

static constexpr int LUT_SIZE     = 1024;
static constexpr int BUCKET_COUNT = 20;

extern const char* g_palette_names[PALETTE_KIND_COUNT];

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// Bucket palettes span [0, 2] plus one overflow bucket (2, hi] when hi > 2;
// the continuous kinds span [lo, hi]. With `fit_estimator` set, the pipeline
// raises hi to the largest value the configured estimator can produce.
struct HeatmapPalette {
    PaletteKind kind          = PaletteKind::Buckets;
    double      lo            = 0.0;
    double      hi            = 2.0;
    bool        fit_estimator = true;
};

struct ColorBucket {
    double lo;   // inclusive
    double hi;   // exclusive, except for the last bucket
    Rgb    color;
};

// The fixed bucket table, ordered by `lo`.
const ColorBucket* bucket_table();

// Colour of the (2, hi] overflow bucket.
constexpr Rgb OVERFLOW_COLOR = {255, 0, 255};

// Maps one dimension value to a colour. PaletteGap for NaN and for values
// outside the palette's domain.
Status palette_color(const HeatmapPalette& pal, double value, Rgb& out);

bool parse_palette_kind(const char* s, PaletteKind& out);
