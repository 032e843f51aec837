
// Few-shot segmentation demo ---------------------------------------------

#include "camera.hpp"
#include "config.hpp"
#include "engine_factory.hpp"
#include "log.hpp"
#include "overlay.hpp"
#include "segmentation_pipeline.hpp"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

static OrtLoggingLevel ortLevel(logging::Level level)
{
    switch (level) {
        case logging::Level::Debug:   return ORT_LOGGING_LEVEL_INFO;
        case logging::Level::Info:    return ORT_LOGGING_LEVEL_WARNING;
        case logging::Level::Warning: return ORT_LOGGING_LEVEL_WARNING;
        case logging::Level::Error:   return ORT_LOGGING_LEVEL_ERROR;
    }
    return ORT_LOGGING_LEVEL_WARNING;
}

static int nextInputSize(int current)
{
    auto it = std::find(kSupportedInputSizes.begin(), kSupportedInputSizes.end(), current);
    if (it == kSupportedInputSizes.end() || ++it == kSupportedInputSizes.end())
        return kSupportedInputSizes.front();
    return *it;
}

int main(int argc, char** argv) {

    // --- Configuration -------------------------------------------------------

    AppConfig cfg;
    try {
        cfg = loadConfig(argc > 1 ? argv[1] : "patchseg.json");
        logging::setLevel(logging::parseLevel(cfg.logLevel));
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // --- Pipeline setup ------------------------------------------------------

    PipelineOptions options;
    options.featureModelPath = cfg.featureModel;
    options.modelDir         = cfg.modelDir;
    options.config           = cfg.pipeline;

    std::string last_error;     // written by the pipeline's listener, must outlive it
    auto factory = std::make_shared<OnnxEngineFactory>(cfg.runtime, cfg.classifierLayout,
                                                       ortLevel(logging::level()));
    SegmentationPipeline pipeline(options, factory);

    pipeline.subscribe([&last_error](const PipelineState& s) {
        if (!s.errorMessage.empty() && s.errorMessage != last_error)
            std::cerr << "ERROR: " << s.errorMessage << std::endl;
        last_error = s.errorMessage;
    });

    pipeline.initialize();
    if (argc > 2)
        pipeline.loadClassifier(argv[2]);

    // --- Camera setup --------------------------------------------------------

    std::unique_ptr<Camera> cam;
    try {
        cam = std::make_unique<Camera>(cfg.camera.index, cfg.camera.width, cfg.camera.height);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    const std::string window_name = "Few-shot segmentation";
    cv::Mat bgra, preview;

    double  fps = 0.0;
    int64_t tick_start;
    int     frame_counter_fps = 0;
    double  total_time_fps = 0.0;
    int64_t frame_index = 0;

    std::cout << "Keys: s start/stop, a largest area, +/- threshold, i input size, "
                 "r re-initialize, q quit." << std::endl;

    while (true) {
        tick_start = cv::getTickCount();
        if (!cam->grabFrame(bgra)) {
            std::cerr << "ERROR: Captured empty frame" << std::endl;
            break;
        }

        // 1. Offer every Nth frame to the pipeline (dropped while busy)
        if (frame_index++ % cfg.camera.frameStride == 0)
            pipeline.submitFrame(Camera::view(bgra));

        // 2. Upright preview with the latest overlay
        cv::Mat upright;
        cv::rotate(bgra, upright, cv::ROTATE_90_CLOCKWISE);
        cv::cvtColor(upright, preview, cv::COLOR_BGRA2BGR);

        const PipelineState state = pipeline.state();
        if (state.running())
            overlay::blend(preview, state.overlay);

        // FPS averaged over 10 frames
        double frame_time = (cv::getTickCount() - tick_start) / cv::getTickFrequency();
        total_time_fps += frame_time;
        frame_counter_fps++;
        if (frame_counter_fps >= 10) {
            fps = frame_counter_fps / total_time_fps;
            frame_counter_fps = 0;
            total_time_fps = 0.0;
        }

        std::string status_text = std::string(toString(state.status))
                                + cv::format("  thr %.2f  size %d%s", state.config.similarityThreshold,
                                             state.config.inputSize,
                                             state.config.largestAreaOnly ? "  largest" : "");
        cv::putText(preview, "FPS: " + cv::format("%.2f", fps), {10, 30},
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(0, 255, 0), 2);
        cv::putText(preview, status_text, {10, 60},
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 255, 0), 1);
        const std::string& message = !state.errorMessage.empty() ? state.errorMessage : state.advisory;
        if (!message.empty())
            cv::putText(preview, message, {10, 90},
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 255), 1);

        cv::imshow(window_name, preview);

        const int key = cv::waitKey(1);
        if (key == 'q' || key == 27) {
            std::cout << "Quitting..." << std::endl;
            break;
        }
        switch (key) {
            case 's': pipeline.setRunning(!state.running()); break;
            case 'a': pipeline.setLargestAreaOnly(!state.config.largestAreaOnly); break;
            case '+': pipeline.setThreshold(std::min(1.0f, state.config.similarityThreshold + 0.05f)); break;
            case '-': pipeline.setThreshold(std::max(0.0f, state.config.similarityThreshold - 0.05f)); break;
            case 'i': pipeline.setInputSize(nextInputSize(state.config.inputSize)); break;
            case 'r': pipeline.initialize(); break;
            default: break;
        }
    }

    cv::destroyAllWindows();
    return 0;
}
