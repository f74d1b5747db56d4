#pragma once

#include "status.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Row-major grid of 8-bit samples. Used for the intensity grid, the square
// canvas and the binary grid alike.
struct Grid {
    std::vector<uint8_t> cells;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        cells.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0);
    }

    uint8_t at(int row, int col) const
    {
        return cells[static_cast<size_t>(row) * width + col];
    }

    uint8_t& at(int row, int col)
    {
        return cells[static_cast<size_t>(row) * width + col];
    }

    const uint8_t* row_ptr(int row) const
    {
        return cells.data() + static_cast<size_t>(row) * width;
    }
};

// Per-pixel fractal dimension, same shape as the grid it was computed from.
struct DimensionField {
    std::vector<double> values;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        values.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0.0);
    }

    double at(int row, int col) const
    {
        return values[static_cast<size_t>(row) * width + col];
    }
};

// Splits a flat grayscale buffer into rows of `width` samples. The length must
// be a non-zero multiple of width.
Status build_grid(const uint8_t* samples, size_t count, int width, Grid& out);

// Crops or zero-pads each axis to `size`. Keeps the first rows/columns; this is
// a canvas operation, never a resample.
Status normalize_grid(const Grid& src, int size, Grid& out);
