#include "grid.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <utility>

Status build_grid(const uint8_t* samples, size_t count, int width, Grid& out)
{
    char msg[128];
    if (width <= 0) {
        std::snprintf(msg, sizeof(msg), "grid width must be positive (got %d)", width);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (count == 0 || !samples)
        return Status(ErrorCode::MalformedInput, "empty pixel buffer");
    if (count % static_cast<size_t>(width) != 0) {
        std::snprintf(msg, sizeof(msg), "%zu samples do not divide into rows of %d",
                      count, width);
        return Status(ErrorCode::MalformedInput, msg);
    }

    out.width  = width;
    out.height = static_cast<int>(count / static_cast<size_t>(width));
    out.cells.assign(samples, samples + count);
    return {};
}

Status normalize_grid(const Grid& src, int size, Grid& out)
{
    if (src.width <= 0 || src.height <= 0)
        return Status(ErrorCode::MalformedInput, "cannot normalize an empty grid");
    if (size <= 0)
        return Status(ErrorCode::MalformedInput, "square size must be positive");

    Grid sq;
    sq.resize(size, size);
    const int rows = std::min(src.height, size);
    const int cols = std::min(src.width,  size);
    for (int r = 0; r < rows; ++r)
        std::memcpy(sq.cells.data() + static_cast<size_t>(r) * size, src.row_ptr(r),
                    static_cast<size_t>(cols));
    out = std::move(sq);
    return {};
}
