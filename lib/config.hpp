#pragma once
#include "tensor_utils.hpp"
#include <array>
#include <string>

constexpr std::array<int, 4> kSupportedInputSizes = {320, 400, 512, 768};
constexpr float              kDefaultThreshold    = 0.7f;

bool isSupportedInputSize(int inputSize);

// Per-frame settings. A copy is taken when a frame is admitted, so changes
// only affect frames submitted afterwards.
struct PipelineConfig {
    int   inputSize           = 320;
    float similarityThreshold = kDefaultThreshold;
    bool  largestAreaOnly     = false;
};

struct SessionSettings {
    int  intraOpThreads = 1;
    bool useCuda        = false;
};

struct CameraConfig {
    int index       = 0;
    int width       = 640;
    int height      = 480;
    int frameStride = 5;    // offer every Nth captured frame
};

struct TrainingConfig {
    std::string url;
    std::string email;
    std::string password;
    std::string collection     = "datasets";
    int         pollIntervalMs = 10000;
    int         timeoutMs      = 30 * 60 * 1000;
};

struct AppConfig {
    std::string                     featureModel;
    std::string                     modelDir;
    CameraConfig                    camera;
    PipelineConfig                  pipeline;
    SessionSettings                 runtime;
    tensor_utils::ProbabilityLayout classifierLayout;
    TrainingConfig                  training;
    std::string                     logLevel = "info";
};

// Reads a JSON configuration file. Missing keys keep their defaults.
// Throws std::runtime_error if the file cannot be read or parsed, and
// std::invalid_argument for out-of-range values.
AppConfig loadConfig(const std::string& path);

// Same as loadConfig, from JSON text.
AppConfig parseConfig(const std::string& json_text);
