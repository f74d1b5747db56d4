#pragma once

#include "analysis.hpp"
#include "status.hpp"

#include <cstdio>
#include <string>

enum class PayloadKind {
    Field      = 0,  // the fractal dimension field
    BinaryGrid = 1,  // the binarized S x S grid
};

struct ResponseOptions {
    std::string heatmap_path;                         // only the basename is emitted
    std::string matrix_key = "fractalDimensionMatrix";
    PayloadKind payload    = PayloadKind::Field;
};

// "dir/sub/img.png" → "img.png"
std::string path_basename(const std::string& path);

// One line per row, values separated by single spaces.
Status write_matrix_text(const char* path, const DimensionField& field);

// {"heatmapImageSourceName": "...", "<matrix_key>": [[...], ...]}
Status write_response_json(FILE* fp, const ResponseOptions& opts, const AnalysisResult& result);
