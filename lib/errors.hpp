#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
    UnsupportedFormat,   // frame pixel format or plane layout not understood
    InvalidGeometry,     // degenerate resize target or tensor shape mismatch
    SessionNotReady,     // inference attempted before a session was loaded
    InferenceError,      // the model failed while running
    ModelLoadError       // a model could not be loaded or failed validation
};

const char* toString(ErrorCode code);

class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorCode code, const std::string& what);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};
