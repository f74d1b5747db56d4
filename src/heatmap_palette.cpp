#include "heatmap_palette.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

const char* g_palette_names[PALETTE_KIND_COUNT] = {
    "buckets",
    "gradient",
    "fire",
    "ice",
    "grayscale",
};

// ---------------------------------------------------------------------------
// Bucket table: cold (low dimension) through green to hot (near 2.0)
// ---------------------------------------------------------------------------
namespace {

const Rgb BUCKET_COLORS[BUCKET_COUNT] = {
    {  0,   0, 128}, {  0,   0, 191}, {  0,   0, 255}, {  0,  64, 255},
    {  0, 128, 255}, {  0, 191, 255}, {  0, 255, 255}, {  0, 255, 191},
    {  0, 255, 128}, {  0, 255,  64}, { 64, 255,   0}, {128, 255,   0},
    {191, 255,   0}, {255, 255,   0}, {255, 213,   0}, {255, 170,   0},
    {255, 128,   0}, {255,  85,   0}, {255,  43,   0}, {255,   0,   0},
};

struct BucketTable {
    ColorBucket buckets[BUCKET_COUNT];

    BucketTable()
    {
        for (int i = 0; i < BUCKET_COUNT; ++i) {
            buckets[i].lo    = i / 10.0;
            buckets[i].hi    = (i + 1) / 10.0;
            buckets[i].color = BUCKET_COLORS[i];
        }
    }
};

// ---------------------------------------------------------------------------
// Color-stop interpolation helper
// ---------------------------------------------------------------------------
struct ColorStop { float t; uint8_t r, g, b; };

struct Lut {
    Rgb entries[LUT_SIZE];
};

void build_lut(Lut& lut, const ColorStop* stops, int n)
{
    for (int i = 0; i < LUT_SIZE; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(LUT_SIZE - 1);

        // Find the segment [stops[seg], stops[seg+1]] that contains t.
        int seg = n - 2;
        for (int s = 0; s < n - 1; ++s) {
            if (t <= stops[s + 1].t) { seg = s; break; }
        }
        const ColorStop& a = stops[seg];
        const ColorStop& b = stops[seg + 1];
        const float span = b.t - a.t;
        const float f    = (span > 0.0f) ? (t - a.t) / span : 0.0f;
        const float cf   = std::max(0.0f, std::min(1.0f, f));

        lut.entries[i].r = static_cast<uint8_t>(a.r + cf * (static_cast<float>(b.r) - a.r));
        lut.entries[i].g = static_cast<uint8_t>(a.g + cf * (static_cast<float>(b.g) - a.g));
        lut.entries[i].b = static_cast<uint8_t>(a.b + cf * (static_cast<float>(b.b) - a.b));
    }
}

struct LutSet {
    Lut fire;
    Lut ice;
    Lut gray;

    LutSet()
    {
        // Fire  (black → dark-red → red → orange → yellow → white)
        {
            static const ColorStop s[] = {
                {0.000f,   0,   0,   0},
                {0.250f, 128,   0,   0},
                {0.500f, 255,   0,   0},
                {0.750f, 255, 128,   0},
                {0.875f, 255, 255,   0},
                {1.000f, 255, 255, 255},
            };
            build_lut(fire, s, 6);
        }

        // Ice  (black → dark-blue → blue → cyan → white)
        {
            static const ColorStop s[] = {
                {0.000f,   0,   0,   0},
                {0.250f,   0,   0, 128},
                {0.500f,   0,  64, 255},
                {0.750f,   0, 200, 255},
                {1.000f, 255, 255, 255},
            };
            build_lut(ice, s, 5);
        }

        {
            static const ColorStop s[] = {
                {0.0f,   0,   0,   0},
                {1.0f, 255, 255, 255},
            };
            build_lut(gray, s, 2);
        }
    }
};

const LutSet& luts()
{
    static const LutSet set;
    return set;
}

Status gap(double value, const char* what)
{
    char msg[96];
    std::snprintf(msg, sizeof(msg), "value %g not covered by %s palette", value, what);
    return Status(ErrorCode::PaletteGap, msg);
}

}  // namespace

const ColorBucket* bucket_table()
{
    static const BucketTable table;
    return table.buckets;
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------
Status palette_color(const HeatmapPalette& pal, double value, Rgb& out)
{
    const char* name = g_palette_names[static_cast<int>(pal.kind)];
    if (std::isnan(value))
        return gap(value, name);

    if (pal.kind == PaletteKind::Buckets) {
        const ColorBucket* table = bucket_table();
        const ColorBucket& last  = table[BUCKET_COUNT - 1];
        if (value < table[0].lo)
            return gap(value, name);
        if (value > last.hi) {
            if (value > pal.hi) return gap(value, name);
            out = OVERFLOW_COLOR;
            return {};
        }
        if (value == last.hi) {
            out = last.color;
            return {};
        }
        // First bucket whose lower edge is above value, then step back one.
        const ColorBucket* it = std::upper_bound(
            table, table + BUCKET_COUNT, value,
            [](double v, const ColorBucket& b) { return v < b.lo; });
        out = (it - 1)->color;
        return {};
    }

    const double span = pal.hi - pal.lo;
    if (!(span > 0.0) || value < pal.lo || value > pal.hi)
        return gap(value, name);
    const double t = (value - pal.lo) / span;

    switch (pal.kind) {
        case PaletteKind::Gradient:
            out.r = static_cast<uint8_t>(std::lround(255.0 * t));
            out.g = 0;
            out.b = static_cast<uint8_t>(std::lround(255.0 * (1.0 - t)));
            return {};
        case PaletteKind::Fire:
        case PaletteKind::Ice:
        case PaletteKind::Grayscale: {
            const LutSet& set = luts();
            const Lut& lut = pal.kind == PaletteKind::Fire ? set.fire
                           : pal.kind == PaletteKind::Ice  ? set.ice
                           :                                 set.gray;
            const int idx = static_cast<int>(std::lround(t * (LUT_SIZE - 1)));
            out = lut.entries[std::max(0, std::min(LUT_SIZE - 1, idx))];
            return {};
        }
        case PaletteKind::Buckets:
            break;
    }
    return gap(value, name);
}

bool parse_palette_kind(const char* s, PaletteKind& out)
{
    for (int i = 0; i < PALETTE_KIND_COUNT; ++i) {
        if (std::strcmp(s, g_palette_names[i]) == 0) {
            out = static_cast<PaletteKind>(i);
            return true;
        }
    }
    return false;
}
