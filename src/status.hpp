#pragma once

#include <string>
#include <utility>

enum class ErrorCode {
    Ok                  = 0,
    MalformedInput      = 1,  // bad buffer length, zero dimension, bad config
    InsufficientSamples = 2,  // fewer than 2 box sizes for the regression
    PaletteGap          = 3,  // field value not covered by the palette
    CodecFailure        = 4,  // PNG/JXL read or write failed
    Cancelled           = 5,  // field build aborted by the caller
};

inline const char* error_code_name(ErrorCode c)
{
    switch (c) {
        case ErrorCode::Ok:                  return "Ok";
        case ErrorCode::MalformedInput:      return "MalformedInput";
        case ErrorCode::InsufficientSamples: return "InsufficientSamples";
        case ErrorCode::PaletteGap:          return "PaletteGap";
        case ErrorCode::CodecFailure:        return "CodecFailure";
        case ErrorCode::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

// Result of a fallible stage. Default-constructed means success.
struct Status {
    ErrorCode   code = ErrorCode::Ok;
    std::string message;

    Status() = default;
    Status(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool ok() const { return code == ErrorCode::Ok; }
};
