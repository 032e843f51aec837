#include "config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

bool isSupportedInputSize(int inputSize)
{
    return std::find(kSupportedInputSizes.begin(), kSupportedInputSizes.end(), inputSize)
           != kSupportedInputSizes.end();
}

namespace
{
    json section(const json& j, const char* key)
    {
        if (!j.contains(key)) return json::object();
        if (!j.at(key).is_object())
            throw std::runtime_error(std::string("config: '") + key + "' must be an object");
        return j.at(key);
    }

    AppConfig fromJson(const json& j)
    {
        AppConfig cfg;
        cfg.featureModel = j.value("feature_model", cfg.featureModel);
        cfg.modelDir     = j.value("model_dir",     cfg.modelDir);
        cfg.logLevel     = j.value("log_level",     cfg.logLevel);

        const json cam = section(j, "camera");
        cfg.camera.index       = cam.value("index",        cfg.camera.index);
        cfg.camera.width       = cam.value("width",        cfg.camera.width);
        cfg.camera.height      = cam.value("height",       cfg.camera.height);
        cfg.camera.frameStride = cam.value("frame_stride", cfg.camera.frameStride);

        const json pipe = section(j, "pipeline");
        cfg.pipeline.inputSize           = pipe.value("input_size",        cfg.pipeline.inputSize);
        cfg.pipeline.similarityThreshold = pipe.value("threshold",         cfg.pipeline.similarityThreshold);
        cfg.pipeline.largestAreaOnly     = pipe.value("largest_area_only", cfg.pipeline.largestAreaOnly);

        const json rt = section(j, "runtime");
        cfg.runtime.intraOpThreads = rt.value("intra_op_threads", cfg.runtime.intraOpThreads);
        cfg.runtime.useCuda        = rt.value("use_cuda",         cfg.runtime.useCuda);

        const json layout = section(j, "classifier_layout");
        cfg.classifierLayout.classCount      = layout.value("class_count",      cfg.classifierLayout.classCount);
        cfg.classifierLayout.foregroundIndex = layout.value("foreground_index", cfg.classifierLayout.foregroundIndex);

        const json tr = section(j, "training");
        cfg.training.url            = tr.value("url",              cfg.training.url);
        cfg.training.email          = tr.value("email",            cfg.training.email);
        cfg.training.password       = tr.value("password",         cfg.training.password);
        cfg.training.collection     = tr.value("collection",       cfg.training.collection);
        cfg.training.pollIntervalMs = tr.value("poll_interval_ms", cfg.training.pollIntervalMs);
        cfg.training.timeoutMs      = tr.value("timeout_ms",       cfg.training.timeoutMs);

        if (!isSupportedInputSize(cfg.pipeline.inputSize))
            throw std::invalid_argument("config: unsupported input_size "
                                        + std::to_string(cfg.pipeline.inputSize));
        if (cfg.pipeline.similarityThreshold < 0.0f || cfg.pipeline.similarityThreshold > 1.0f)
            throw std::invalid_argument("config: threshold must be within [0, 1]");
        if (cfg.camera.frameStride < 1)
            throw std::invalid_argument("config: frame_stride must be at least 1");
        if (cfg.classifierLayout.classCount < 1
            || cfg.classifierLayout.foregroundIndex < 0
            || cfg.classifierLayout.foregroundIndex >= cfg.classifierLayout.classCount)
            throw std::invalid_argument("config: foreground_index outside class_count");
        return cfg;
    }
}

AppConfig parseConfig(const std::string& json_text)
{
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
    if (!j.is_object())
        throw std::runtime_error("config: top level must be an object");

    try {
        return fromJson(j);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
}

AppConfig loadConfig(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("config: cannot open " + path);

    std::ostringstream text;
    text << in.rdbuf();
    return parseConfig(text.str());
}
