#include "errors.hpp"

const char* toString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::InvalidGeometry:   return "InvalidGeometry";
        case ErrorCode::SessionNotReady:   return "SessionNotReady";
        case ErrorCode::InferenceError:    return "InferenceError";
        case ErrorCode::ModelLoadError:    return "ModelLoadError";
    }
    return "Unknown";
}

PipelineError::PipelineError(ErrorCode code, const std::string& what)
    : std::runtime_error(std::string(toString(code)) + ": " + what),
      code_(code)
{
}
