#pragma once

#include "grid.hpp"
#include "heatmap_palette.hpp"
#include "status.hpp"

#include <cstdint>
#include <vector>

// Raster handed to the encoder: R, G, B bytes per pixel, row-major.
struct RgbBuffer {
    static constexpr int channels = 3;

    std::vector<uint8_t> bytes;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        bytes.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * channels, 0);
    }

    const uint8_t* row_ptr(int row) const
    {
        return bytes.data() + static_cast<size_t>(row) * width * channels;
    }
};

// Colours every cell of `field`. Stops at the first uncovered value and
// reports its coordinates with PaletteGap; `out` is left untouched then.
Status render_heatmap(const DimensionField& field, const HeatmapPalette& pal, RgbBuffer& out);
