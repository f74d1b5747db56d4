#include "analysis_config.hpp"
#include "box_count.hpp"

#include <cstdio>
#include <cstring>
#include <thread>

int box_size_count(const AnalysisConfig& cfg)
{
    return static_cast<int>(
        box_sizes(cfg.min_box_size, cfg.scaling_factor, cfg.neighborhood_size).size());
}

int max_thread_count()
{
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    if (hw < 1) hw = 4;
    return 4 * hw;
}

Status validate_config(const AnalysisConfig& cfg)
{
    char msg[128];
    if (cfg.square_size < 1) {
        std::snprintf(msg, sizeof(msg), "square size must be >= 1 (got %d)", cfg.square_size);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.square_size > MAX_SQUARE_SIZE) {
        std::snprintf(msg, sizeof(msg), "square size must be <= %d (got %d)",
                      MAX_SQUARE_SIZE, cfg.square_size);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.neighborhood_size < 2 || cfg.neighborhood_size > cfg.square_size) {
        std::snprintf(msg, sizeof(msg), "neighborhood size must be in [2, %d] (got %d)",
                      cfg.square_size, cfg.neighborhood_size);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.min_box_size < 1) {
        std::snprintf(msg, sizeof(msg), "minimum box size must be >= 1 (got %d)",
                      cfg.min_box_size);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.scaling_factor < 2) {
        std::snprintf(msg, sizeof(msg), "scaling factor must be >= 2 (got %d)",
                      cfg.scaling_factor);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.threshold < 0 || cfg.threshold > 255) {
        std::snprintf(msg, sizeof(msg), "threshold must be in [0, 255] (got %d)", cfg.threshold);
        return Status(ErrorCode::MalformedInput, msg);
    }
    if (cfg.thread_count < 0 || cfg.thread_count > max_thread_count()) {
        std::snprintf(msg, sizeof(msg), "thread count must be in [0, %d] (got %d)",
                      max_thread_count(), cfg.thread_count);
        return Status(ErrorCode::MalformedInput, msg);
    }

    const int steps = box_size_count(cfg);
    if (steps < 2) {
        std::snprintf(msg, sizeof(msg),
                      "%d box size(s) below N/2 for N=%d, B_min=%d, k=%d; regression needs 2",
                      steps, cfg.neighborhood_size, cfg.min_box_size, cfg.scaling_factor);
        return Status(ErrorCode::InsufficientSamples, msg);
    }
    return {};
}

const char* binarize_mode_name(BinarizeMode m)
{
    switch (m) {
        case BinarizeMode::None:  return "none";
        case BinarizeMode::Fixed: return "fixed";
        case BinarizeMode::Otsu:  return "otsu";
    }
    return "unknown";
}

const char* occupancy_mode_name(OccupancyMode m)
{
    switch (m) {
        case OccupancyMode::Any: return "any";
        case OccupancyMode::All: return "all";
    }
    return "unknown";
}

bool parse_binarize_mode(const char* s, BinarizeMode& out)
{
    for (int i = 0; i < BINARIZE_MODE_COUNT; ++i) {
        const BinarizeMode m = static_cast<BinarizeMode>(i);
        if (std::strcmp(s, binarize_mode_name(m)) == 0) {
            out = m;
            return true;
        }
    }
    return false;
}

bool parse_occupancy_mode(const char* s, OccupancyMode& out)
{
    if (std::strcmp(s, "any") == 0) { out = OccupancyMode::Any; return true; }
    if (std::strcmp(s, "all") == 0) { out = OccupancyMode::All; return true; }
    return false;
}

bool parse_binary_encoding(const char* s, BinaryEncoding& out)
{
    if (std::strcmp(s, "01") == 0)   { out = BinaryEncoding::ZeroOne; return true; }
    if (std::strcmp(s, "0255") == 0) { out = BinaryEncoding::ZeroMax; return true; }
    return false;
}
