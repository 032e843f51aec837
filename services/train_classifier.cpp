// Uploads a labelled dataset to the training service, waits for the job and
// downloads the resulting classifier into the model directory.
//
//   patchseg_train <config.json> <dataset-name> <image>...
//   patchseg_train <config.json> --fetch <record-id>

#include "config.hpp"
#include "log.hpp"
#include "training_client.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0] << " <config.json> <dataset-name> <image>...\n"
                  << "       " << argv[0] << " <config.json> --fetch <record-id>" << std::endl;
        return 2;
    }

    try {
        const AppConfig cfg = loadConfig(argv[1]);
        logging::setLevel(logging::parseLevel(cfg.logLevel));
        if (cfg.training.url.empty())
            throw std::runtime_error("config: training.url is not set");

        TrainingClient client(cfg.training.url, cfg.training.collection);
        if (!cfg.training.email.empty())
            client.authenticate(cfg.training.email, cfg.training.password);

        std::string record_id;
        if (std::string(argv[2]) == "--fetch") {
            record_id = argv[3];
        } else {
            std::vector<std::string> images(argv + 3, argv + argc);
            record_id = client.createDataset(argv[2], images);
        }

        const TrainingRecord record = client.waitForCompletion(
            record_id,
            std::chrono::milliseconds(cfg.training.pollIntervalMs),
            std::chrono::milliseconds(cfg.training.timeoutMs));
        if (record.status == TrainingStatus::Failed) {
            std::cerr << "ERROR: training failed for record " << record_id << std::endl;
            return 1;
        }

        const std::string dest = cfg.modelDir.empty() ? std::string(".") : cfg.modelDir;
        std::cout << client.downloadClassifier(record, dest) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
