#include "analysis.hpp"
#include "binarize.hpp"
#include "box_count.hpp"

#include <algorithm>
#include <utility>

Status analyze_grayscale(const uint8_t* pixels, size_t count, int width,
                         const AnalysisConfig& cfg, FieldBuilder& builder,
                         AnalysisResult& out, const std::atomic<bool>* cancel)
{
    Status st = validate_config(cfg);
    if (!st.ok()) return st;

    Grid intensity;
    st = build_grid(pixels, count, width, intensity);
    if (!st.ok()) return st;

    AnalysisResult res;
    st = normalize_grid(intensity, cfg.square_size, res.square);
    if (!st.ok()) return st;

    st = binarize(res.square, cfg, &builder.pool(), res.binary, res.threshold_used);
    if (!st.ok()) return st;

    st = builder.build(res.binary, cfg, res.field, cancel);
    if (!st.ok()) return st;

    st = render_heatmap(res.field, field_palette(cfg), res.heatmap);
    if (!st.ok()) return st;

    out = std::move(res);
    return {};
}

HeatmapPalette field_palette(const AnalysisConfig& cfg)
{
    HeatmapPalette pal = cfg.palette;
    if (pal.fit_estimator)
        pal.hi = std::max(pal.hi, dimension_upper_bound(cfg));
    return pal;
}

FieldSummary field_summary(const DimensionField& field)
{
    FieldSummary s;
    if (field.values.empty()) return s;
    const auto mm = std::minmax_element(field.values.begin(), field.values.end());
    s.min = *mm.first;
    s.max = *mm.second;
    double sum = 0.0;
    for (double v : field.values) sum += v;
    s.mean = sum / static_cast<double>(field.values.size());
    return s;
}
