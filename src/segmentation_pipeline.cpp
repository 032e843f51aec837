#include "segmentation_pipeline.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "segmenter.hpp"
#include <stdexcept>

namespace
{
    const char* const kTag = "Pipeline";
}

const char* toString(PipelineStatus status)
{
    switch (status) {
        case PipelineStatus::Idle:          return "Idle";
        case PipelineStatus::LoadingModels: return "LoadingModels";
        case PipelineStatus::ModelsReady:   return "ModelsReady";
        case PipelineStatus::Running:       return "Running";
        case PipelineStatus::Error:         return "Error";
    }
    return "Unknown";
}

const char* toString(SessionState state)
{
    switch (state) {
        case SessionState::Unloaded: return "Unloaded";
        case SessionState::Loading:  return "Loading";
        case SessionState::Ready:    return "Ready";
        case SessionState::Error:    return "Error";
    }
    return "Unknown";
}

SegmentationPipeline::SegmentationPipeline(PipelineOptions options,
                                           std::shared_ptr<EngineFactory> factory)
    : options_(std::move(options)),
      factory_(std::move(factory))
{
    if (!factory_)
        throw std::invalid_argument("SegmentationPipeline needs an engine factory");
    if (!isSupportedInputSize(options_.config.inputSize))
        throw std::invalid_argument("unsupported input size "
                                    + std::to_string(options_.config.inputSize));

    if (!options_.modelDir.empty())
        store_.emplace(options_.modelDir);
    state_.config = options_.config;

    worker_ = std::thread(&SegmentationPipeline::run, this);
}

SegmentationPipeline::~SegmentationPipeline()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        stop_ = true;
        commands_.clear();
        pending_.reset();
    }
    wake_.notify_all();
    idle_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

/* ---------- caller-facing operations ---------- */

bool SegmentationPipeline::initialize()
{
    std::unique_lock<std::mutex> lock(m_);
    if (state_.status != PipelineStatus::Idle && state_.status != PipelineStatus::Error) {
        PATCHSEG_LOG_WARN(kTag) << "initialize() ignored in state " << toString(state_.status);
        return false;
    }

    state_.status         = PipelineStatus::LoadingModels;
    state_.featureSession = features_ ? SessionState::Ready : SessionState::Loading;
    state_.errorMessage.clear();
    state_.advisory.clear();
    commands_.push_back({CommandKind::LoadModels, options_.featureModelPath});
    wake_.notify_one();
    publish(lock);
    return true;
}

bool SegmentationPipeline::submitFrame(const RawFrame& frame)
{
    FrameJob job;
    {
        std::lock_guard<std::mutex> lock(m_);
        if (state_.status != PipelineStatus::Running || cycleInFlight_ || stop_) {
            ++state_.stats.framesDropped;
            return false;
        }
        cycleInFlight_  = true;
        job.config      = state_.config;
        job.generation  = generation_;
    }

    try {
        job.frame = OwnedFrame(frame);
    } catch (const std::bad_alloc&) {
        {
            std::lock_guard<std::mutex> lock(m_);
            cycleInFlight_ = false;
        }
        idle_.notify_all();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_);
        pending_ = std::move(job);
        ++state_.stats.framesAdmitted;
    }
    wake_.notify_one();
    return true;
}

void SegmentationPipeline::setThreshold(float value)
{
    if (!(value >= 0.0f && value <= 1.0f))
        throw std::invalid_argument("threshold must be within [0, 1]");

    std::unique_lock<std::mutex> lock(m_);
    if (state_.config.similarityThreshold == value) return;
    state_.config.similarityThreshold = value;
    publish(lock);
}

void SegmentationPipeline::setInputSize(int value)
{
    if (!isSupportedInputSize(value))
        throw std::invalid_argument("unsupported input size " + std::to_string(value));

    std::unique_lock<std::mutex> lock(m_);
    if (state_.config.inputSize == value) return;
    state_.config.inputSize = value;

    // the grid changes; results of a cycle already started are stale
    ++generation_;
    if (state_.status == PipelineStatus::Running)
        state_.status = PipelineStatus::ModelsReady;
    clearResultLocked();
    publish(lock);
}

void SegmentationPipeline::setLargestAreaOnly(bool flag)
{
    std::unique_lock<std::mutex> lock(m_);
    if (state_.config.largestAreaOnly == flag) return;
    state_.config.largestAreaOnly = flag;
    publish(lock);
}

bool SegmentationPipeline::loadClassifier(const std::string& path)
{
    std::unique_lock<std::mutex> lock(m_);
    if (state_.status == PipelineStatus::Idle || state_.status == PipelineStatus::Error) {
        PATCHSEG_LOG_WARN(kTag) << "loadClassifier() ignored in state " << toString(state_.status);
        return false;
    }
    commands_.push_back({CommandKind::SwapClassifier, path});
    wake_.notify_one();
    return true;
}

bool SegmentationPipeline::setRunning(bool flag)
{
    std::unique_lock<std::mutex> lock(m_);
    if (flag) {
        if (state_.status == PipelineStatus::Running) return true;
        if (state_.status != PipelineStatus::ModelsReady || !features_ || !classifier_) {
            PATCHSEG_LOG_WARN(kTag) << "cannot start segmenting in state " << toString(state_.status)
                                    << (classifier_ ? "" : " (no classifier loaded)");
            return false;
        }
        state_.status = PipelineStatus::Running;
    } else {
        if (state_.status != PipelineStatus::Running) return true;
        state_.status = PipelineStatus::ModelsReady;
        ++generation_;
        clearResultLocked();
    }
    publish(lock);
    return true;
}

PipelineState SegmentationPipeline::state() const
{
    std::lock_guard<std::mutex> lock(m_);
    return state_;
}

void SegmentationPipeline::subscribe(Listener listener)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void SegmentationPipeline::waitIdle()
{
    std::unique_lock<std::mutex> lock(m_);
    idle_.wait(lock, [this] {
        return stop_ || (commands_.empty() && !commandInFlight_ && !cycleInFlight_);
    });
}

/* ---------- worker ---------- */

void SegmentationPipeline::run()
{
    for (;;) {
        std::unique_lock<std::mutex> lock(m_);
        wake_.wait(lock, [this] { return stop_ || !commands_.empty() || pending_.has_value(); });
        if (stop_) break;

        if (!commands_.empty()) {
            const Command cmd = std::move(commands_.front());
            commands_.pop_front();
            commandInFlight_ = true;
            lock.unlock();

            try {
                if (cmd.kind == CommandKind::LoadModels) loadModels();
                else                                     swapClassifier(cmd.path);
            } catch (const std::exception& e) {
                PATCHSEG_LOG_ERROR(kTag) << "command failed: " << e.what();
            }

            lock.lock();
            commandInFlight_ = false;
            lock.unlock();
            idle_.notify_all();
            continue;
        }

        FrameJob job = std::move(*pending_);
        pending_.reset();
        std::shared_ptr<FeatureExtractor> features   = features_;
        std::shared_ptr<PatchClassifier>  classifier = classifier_;
        lock.unlock();

        processFrame(std::move(job), std::move(features), std::move(classifier));
        idle_.notify_all();
    }
}

void SegmentationPipeline::loadModels()
{
    std::shared_ptr<FeatureExtractor> features;
    {
        std::lock_guard<std::mutex> lock(m_);
        features = features_;
    }

    // the feature model is loaded once per process
    if (!features) {
        PATCHSEG_LOG_INFO(kTag) << "Loading feature model " << options_.featureModelPath;
        try {
            features = factory_->loadFeatureExtractor(options_.featureModelPath);
        } catch (const std::exception& e) {
            PATCHSEG_LOG_ERROR(kTag) << "Failed to initialize: " << e.what();
            std::unique_lock<std::mutex> lock(m_);
            state_.status         = PipelineStatus::Error;
            state_.featureSession = SessionState::Error;
            state_.errorMessage   = std::string("Failed to initialize: ") + e.what();
            publish(lock);
            return;
        }
    }

    const std::optional<std::string> saved = store_ ? store_->activePath() : std::nullopt;
    {
        std::unique_lock<std::mutex> lock(m_);
        features_             = features;
        state_.featureSession = SessionState::Ready;
        if (saved && !classifier_)
            state_.classifierSession = SessionState::Loading;
        publish(lock);
    }

    std::shared_ptr<PatchClassifier> classifier;
    std::string failure;
    if (saved) {
        std::lock_guard<std::mutex> lock(m_);
        classifier = classifier_;
    }
    if (saved && !classifier) {
        try {
            classifier = factory_->loadClassifier(*saved);
            PATCHSEG_LOG_INFO(kTag) << "Classifier loaded from " << *saved;
        } catch (const std::exception& e) {
            failure = e.what();
            PATCHSEG_LOG_ERROR(kTag) << "Failed to load saved classifier: " << failure;
        }
    }

    std::unique_lock<std::mutex> lock(m_);
    if (classifier && !classifier_) {
        classifier_              = classifier;
        state_.classifierPath    = *saved;
    }
    if (classifier_) {
        state_.classifierSession = SessionState::Ready;
    } else if (!failure.empty()) {
        state_.classifierSession = SessionState::Error;
        state_.errorMessage      = "Failed to load saved classifier: " + failure;
    } else {
        state_.classifierSession = SessionState::Unloaded;
        state_.advisory          = "No classifier loaded";
    }
    state_.status = PipelineStatus::ModelsReady;
    PATCHSEG_LOG_INFO(kTag) << "Models ready (classifier " << toString(state_.classifierSession) << ")";
    publish(lock);
}

void SegmentationPipeline::swapClassifier(const std::string& path)
{
    SessionState previous;
    {
        std::unique_lock<std::mutex> lock(m_);
        // queued behind a LoadModels that failed; the fatal error stays visible
        if (state_.status == PipelineStatus::Error) {
            PATCHSEG_LOG_WARN(kTag) << "Classifier swap dropped, pipeline is in error: " << path;
            return;
        }
        previous                 = state_.classifierSession;
        state_.classifierSession = SessionState::Loading;
        publish(lock);
    }

    std::shared_ptr<PatchClassifier> fresh;
    try {
        fresh = factory_->loadClassifier(path);
    } catch (const std::exception& e) {
        PATCHSEG_LOG_ERROR(kTag) << "Failed to load new model " << path << ": " << e.what();
        std::unique_lock<std::mutex> lock(m_);
        state_.classifierSession = previous;
        state_.errorMessage      = std::string("Failed to load new model: ") + e.what();
        publish(lock);
        return;
    }

    std::string active = path;
    std::string advisory;
    if (store_) {
        try {
            active = store_->persist(path);
        } catch (const std::runtime_error& e) {
            PATCHSEG_LOG_WARN(kTag) << "Classifier active but not saved: " << e.what();
            advisory = std::string("Classifier not saved: ") + e.what();
        }
    }

    std::unique_lock<std::mutex> lock(m_);
    // cycles already holding the old classifier keep it until they finish
    classifier_.swap(fresh);
    state_.classifierSession          = SessionState::Ready;
    state_.classifierPath             = active;
    state_.config.similarityThreshold = kDefaultThreshold;
    state_.errorMessage.clear();
    state_.advisory = advisory;
    PATCHSEG_LOG_INFO(kTag) << "Classifier hot-swapped: " << path;
    publish(lock);
    // `fresh` now holds the previous classifier and is released here
}

void SegmentationPipeline::processFrame(FrameJob job,
                                        std::shared_ptr<FeatureExtractor> features,
                                        std::shared_ptr<PatchClassifier>  classifier)
{
    SegmentationResult result;
    std::string        failure;
    try {
        result = segmentFrame(job.frame.view(), features.get(), classifier.get(), job.config);
    } catch (const PipelineError& e) {
        failure = e.what();
        PATCHSEG_LOG_WARN(kTag) << "Frame skipped: " << failure;
    } catch (const std::exception& e) {
        failure = e.what();
        PATCHSEG_LOG_WARN(kTag) << "Frame failed: " << failure;
    }

    std::unique_lock<std::mutex> lock(m_);
    cycleInFlight_ = false;
    if (failure.empty()) ++state_.stats.cyclesCompleted;
    else                 ++state_.stats.cyclesFailed;

    // stopped, reconfigured or shutting down since admission: drop the result
    if (stop_ || job.generation != generation_ || state_.status != PipelineStatus::Running)
        return;

    if (failure.empty()) {
        state_.overlay = result.overlay;
        state_.scores  = std::move(result.scores);
        state_.grid    = result.grid;
        state_.advisory.clear();
    } else {
        clearResultLocked();
        state_.advisory = failure;
    }
    publish(lock);
}

/* ---------- helpers ---------- */

void SegmentationPipeline::clearResultLocked()
{
    state_.overlay.release();
    state_.scores.clear();
    state_.grid = preprocess::PatchGrid{};
}

void SegmentationPipeline::publish(std::unique_lock<std::mutex>& lock)
{
    ++state_.version;
    const PipelineState snapshot = state_;
    lock.unlock();
    notify(snapshot);
}

void SegmentationPipeline::notify(const PipelineState& snapshot)
{
    std::lock_guard<std::mutex> lock(listenersMutex_);
    // a newer snapshot may already have been delivered by another thread
    if (snapshot.version <= deliveredVersion_) return;
    deliveredVersion_ = snapshot.version;

    for (const Listener& listener : listeners_) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            PATCHSEG_LOG_ERROR(kTag) << "state listener threw: " << e.what();
        }
    }
}
