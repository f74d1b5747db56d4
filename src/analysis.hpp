#pragma once

#include "analysis_config.hpp"
#include "field_builder.hpp"
#include "grid.hpp"
#include "heatmap.hpp"
#include "status.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

struct AnalysisResult {
    Grid           square;               // S x S canvas of raw intensities
    Grid           binary;               // square after binarization
    int            threshold_used = -1;  // -1 when binarization is off
    DimensionField field;
    RgbBuffer      heatmap;
};

// Grid Builder → Normalizer → Binarizer → Field Builder → Heatmap Renderer.
// Any failing stage ends the run and its Status is returned unchanged.
Status analyze_grayscale(const uint8_t* pixels, size_t count, int width,
                         const AnalysisConfig& cfg, FieldBuilder& builder,
                         AnalysisResult& out, const std::atomic<bool>* cancel = nullptr);

// cfg.palette with its domain widened to dimension_upper_bound(cfg) when
// fit_estimator is set.
HeatmapPalette field_palette(const AnalysisConfig& cfg);

struct FieldSummary {
    double min  = 0.0;
    double max  = 0.0;
    double mean = 0.0;
};

FieldSummary field_summary(const DimensionField& field);
