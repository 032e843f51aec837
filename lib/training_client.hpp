#pragma once
#include <chrono>
#include <string>
#include <vector>

enum class TrainingStatus { Pending, Training, Ready, Failed };

const char*    toString(TrainingStatus status);
// Throws std::runtime_error for anything but pending|training|ready|failed.
TrainingStatus parseTrainingStatus(const std::string& text);

struct TrainingRecord {
    std::string    id;
    std::string    name;
    TrainingStatus status = TrainingStatus::Pending;
    std::string    classifierFile;   // set once the job is ready
};

// Client for the remote training service. A dataset is a record in a
// collection; the service picks up pending records, trains a classifier and
// attaches it to the record.
//
// Every call throws std::runtime_error on transport errors and non-2xx
// responses.
class TrainingClient {
public:
    TrainingClient(std::string baseUrl, std::string collection = "datasets");

    void authenticate(const std::string& email, const std::string& password);

    // Uploads the images (RGBA, alpha = label mask) as a new pending
    // dataset. Returns the record id.
    std::string createDataset(const std::string& name,
                              const std::vector<std::string>& imagePaths);

    TrainingRecord fetchRecord(const std::string& id);

    // Saves the classifier as <destDir>/classifier_<id>.onnx and returns
    // that path. The record must be Ready.
    std::string downloadClassifier(const TrainingRecord& record, const std::string& destDir);

    // Polls until the record is Ready or Failed, or the timeout expires
    // (std::runtime_error).
    TrainingRecord waitForCompletion(const std::string&        id,
                                     std::chrono::milliseconds pollInterval,
                                     std::chrono::milliseconds timeout);

private:
    std::string baseUrl_;
    std::string collection_;
    std::string token_;
};
