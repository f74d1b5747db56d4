#include "heatmap.hpp"

#include <string>
#include <utility>

Status render_heatmap(const DimensionField& field, const HeatmapPalette& pal, RgbBuffer& out)
{
    if (field.width <= 0 || field.height <= 0)
        return Status(ErrorCode::MalformedInput, "cannot render an empty field");

    RgbBuffer buf;
    buf.resize(field.width, field.height);

    uint8_t* px = buf.bytes.data();
    for (int y = 0; y < field.height; ++y) {
        for (int x = 0; x < field.width; ++x) {
            Rgb c;
            Status st = palette_color(pal, field.at(y, x), c);
            if (!st.ok()) {
                st.message += " at row " + std::to_string(y) + ", col " + std::to_string(x);
                return st;
            }
            *px++ = c.r;
            *px++ = c.g;
            *px++ = c.b;
        }
    }
    out = std::move(buf);
    return {};
}
