#pragma once
#include <optional>
#include <string>

// Keeps the active classifier artifact in a model directory so that it can be
// reloaded after a restart without fetching it again.
class ClassifierStore {
public:
    static constexpr const char* kActiveFileName = "current_classifier.onnx";

    explicit ClassifierStore(std::string modelDir);

    // Path of the persisted classifier, if one exists.
    std::optional<std::string> activePath() const;

    // Copies `sourcePath` over the persisted classifier and returns the
    // persistent path. Throws std::runtime_error on I/O failure; the previous
    // artifact is left in place when the copy fails.
    std::string persist(const std::string& sourcePath);

private:
    std::string modelDir_;
};
