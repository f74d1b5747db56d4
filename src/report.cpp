#include "report.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <vector>

using json = nlohmann::ordered_json;

std::string path_basename(const std::string& path)
{
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

Status write_matrix_text(const char* path, const DimensionField& field)
{
    std::unique_ptr<FILE, int (*)(FILE*)> fp(std::fopen(path, "w"), &std::fclose);
    if (!fp)
        return Status(ErrorCode::CodecFailure, std::string("Cannot open file for writing: ") + path);

    for (int y = 0; y < field.height; ++y) {
        for (int x = 0; x < field.width; ++x)
            std::fprintf(fp.get(), x ? " %.17g" : "%.17g", field.at(y, x));
        if (y + 1 < field.height) std::fputc('\n', fp.get());
    }
    if (std::ferror(fp.get()) || std::fflush(fp.get()) != 0)
        return Status(ErrorCode::CodecFailure, std::string("Write failed: ") + path);
    return {};
}

Status write_response_json(FILE* fp, const ResponseOptions& opts, const AnalysisResult& result)
{
    if (!fp) return Status(ErrorCode::CodecFailure, "no output stream");

    json payload;
    payload["heatmapImageSourceName"] = path_basename(opts.heatmap_path);

    if (opts.payload == PayloadKind::Field) {
        const DimensionField& f = result.field;
        std::vector<std::vector<double>> rows(f.height);
        for (int y = 0; y < f.height; ++y)
            rows[y].assign(f.values.begin() + static_cast<size_t>(y) * f.width,
                           f.values.begin() + static_cast<size_t>(y + 1) * f.width);
        payload[opts.matrix_key] = rows;
    } else {
        const Grid& g = result.binary;
        std::vector<std::vector<int>> rows(g.height);
        for (int y = 0; y < g.height; ++y)
            rows[y].assign(g.row_ptr(y), g.row_ptr(y) + g.width);
        payload[opts.matrix_key] = rows;
    }

    std::string text;
    try {
        text = payload.dump();
    } catch (const json::exception& e) {
        return Status(ErrorCode::CodecFailure,
                      std::string("cannot serialize response payload: ") + e.what());
    }
    text += '\n';

    if (std::fwrite(text.data(), 1, text.size(), fp) != text.size() || std::ferror(fp))
        return Status(ErrorCode::CodecFailure, "failed writing response payload");
    return {};
}
