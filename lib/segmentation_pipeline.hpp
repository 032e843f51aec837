#pragma once
#include "classifier_store.hpp"
#include "config.hpp"
#include "engines.hpp"
#include "frame.hpp"
#include "preprocess.hpp"
#include <opencv2/opencv.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class PipelineStatus { Idle, LoadingModels, ModelsReady, Running, Error };
enum class SessionState   { Unloaded, Loading, Ready, Error };

const char* toString(PipelineStatus status);
const char* toString(SessionState state);

struct PipelineStats {
    uint64_t framesAdmitted  = 0;
    uint64_t framesDropped   = 0;
    uint64_t cyclesCompleted = 0;
    uint64_t cyclesFailed    = 0;
};

// Snapshot of everything the caller can observe.
struct PipelineState {
    uint64_t              version           = 0;
    PipelineStatus        status            = PipelineStatus::Idle;
    SessionState          featureSession    = SessionState::Unloaded;
    SessionState          classifierSession = SessionState::Unloaded;
    std::string           classifierPath;
    PipelineConfig        config;
    cv::Mat               overlay;         // RGBA, one pixel per patch; empty when none
    std::vector<float>    scores;
    preprocess::PatchGrid grid;
    std::string           errorMessage;    // load / hot-swap failure, shown to the user
    std::string           advisory;        // last per-frame problem, informational
    PipelineStats         stats;

    bool running() const { return status == PipelineStatus::Running; }
};

struct PipelineOptions {
    std::string    featureModelPath;
    std::string    modelDir;    // where the active classifier is persisted; empty disables
    PipelineConfig config;
};

// Owns the two model sessions and a single background worker.
//
// Frames go through a one-slot mailbox: while a cycle is pending or running,
// further frames are dropped rather than queued. Model loading and classifier
// hot-swaps run on the same worker, between cycles. None of the public calls
// block on inference, except waitIdle().
class SegmentationPipeline {
public:
    using Listener = std::function<void(const PipelineState&)>;

    SegmentationPipeline(PipelineOptions options, std::shared_ptr<EngineFactory> factory);
    ~SegmentationPipeline();

    SegmentationPipeline(const SegmentationPipeline&)            = delete;
    SegmentationPipeline& operator=(const SegmentationPipeline&) = delete;

    // Loads the feature model and, if one was persisted, the classifier.
    // Accepted from Idle and Error; returns false otherwise.
    bool initialize();

    // Offers a frame. Returns true if a cycle was started for it. The planes
    // are copied before returning.
    bool submitFrame(const RawFrame& frame);

    // Throws std::invalid_argument outside [0, 1].
    void setThreshold(float value);
    // Throws std::invalid_argument for sizes not in kSupportedInputSizes.
    // Changing the size stops a running pipeline.
    void setInputSize(int value);
    void setLargestAreaOnly(bool flag);

    // Replaces the classifier in the background. The current classifier stays
    // active until the new one has loaded; on failure it stays for good and
    // errorMessage is set. Returns false when no models are loaded or loading.
    bool loadClassifier(const std::string& path);

    // Start or stop segmenting. Starting needs both sessions Ready.
    bool setRunning(bool flag);

    PipelineState state() const;

    // Listeners are called after every state change, on the thread that made
    // the change. They must not call the pipeline's setters.
    void subscribe(Listener listener);

    // Blocks until no command, frame or cycle is outstanding.
    void waitIdle();

private:
    enum class CommandKind { LoadModels, SwapClassifier };

    struct Command {
        CommandKind kind;
        std::string path;
    };

    struct FrameJob {
        OwnedFrame     frame;
        PipelineConfig config;
        uint64_t       generation = 0;
    };

    void run();
    void loadModels();
    void swapClassifier(const std::string& path);
    void processFrame(FrameJob job,
                      std::shared_ptr<FeatureExtractor> features,
                      std::shared_ptr<PatchClassifier>  classifier);

    // Bumps the version, releases `lock` and notifies listeners.
    void publish(std::unique_lock<std::mutex>& lock);
    void notify(const PipelineState& snapshot);
    void clearResultLocked();

    const PipelineOptions          options_;
    std::shared_ptr<EngineFactory> factory_;
    std::optional<ClassifierStore> store_;

    mutable std::mutex      m_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::deque<Command>     commands_;
    std::optional<FrameJob> pending_;
    bool                    commandInFlight_ = false;
    bool                    cycleInFlight_   = false;   // from admission until the result is in
    bool                    stop_            = false;
    uint64_t                generation_      = 0;
    PipelineState           state_;

    // Shared with in-flight cycles; a swap only replaces the pointer.
    std::shared_ptr<FeatureExtractor> features_;
    std::shared_ptr<PatchClassifier>  classifier_;

    std::mutex            listenersMutex_;
    std::vector<Listener> listeners_;
    uint64_t              deliveredVersion_ = 0;

    std::thread worker_;
};
