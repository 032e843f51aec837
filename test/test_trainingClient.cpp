#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "fakes.hpp"
#include "training_client.hpp"

using json = nlohmann::json;

// In-process stand-in for the training service: one user, one record that
// turns ready on the third poll.
class TrainingClientTests : public ::testing::Test {
    protected:
        void SetUp() override {
            server.Post("/api/collections/users/auth-with-password",
                        [](const httplib::Request& req, httplib::Response& res) {
                const json body = json::parse(req.body);
                if (body.value("identity", "") == "pilot@example.com"
                    && body.value("password", "") == "secret") {
                    res.set_content(R"({"token":"tok-123","record":{"id":"u1"}})", "application/json");
                } else {
                    res.status = 400;
                    res.set_content(R"({"message":"Failed to authenticate."})", "application/json");
                }
            });

            server.Post("/api/collections/datasets/records",
                        [this](const httplib::Request& req, httplib::Response& res) {
                uploadAuth = req.get_header_value("Authorization");
                uploadType = req.get_header_value("Content-Type");
                res.set_content(R"({"id":"rec1","name":"cups","status":"pending"})", "application/json");
            });

            server.Get("/api/collections/datasets/records/rec1",
                       [this](const httplib::Request&, httplib::Response& res) {
                const int n = ++polls;
                json record = {{"id", "rec1"}, {"name", "cups"}};
                if (n < 3) {
                    record["status"] = n == 1 ? "pending" : "training";
                } else {
                    record["status"] = "ready";
                    record["classifier_file"] = "classifier_x1.onnx";
                }
                res.set_content(record.dump(), "application/json");
            });

            server.Get("/api/collections/datasets/records/odd",
                       [](const httplib::Request&, httplib::Response& res) {
                res.set_content(R"({"id":"odd","status":"queued"})", "application/json");
            });

            server.Get("/api/files/datasets/rec1/classifier_x1.onnx",
                       [](const httplib::Request&, httplib::Response& res) {
                res.set_content("onnx-bytes", "application/octet-stream");
            });

            port = server.bind_to_any_port("127.0.0.1");
            ASSERT_GT(port, 0);
            listener = std::thread([this] { server.listen_after_bind(); });
            while (!server.is_running())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        void TearDown() override {
            server.stop();
            if (listener.joinable()) listener.join();
        }

        std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }

        std::string imageFile(const std::string& name) {
            const std::string path = scratch.file(name);
            std::ofstream out(path, std::ios::binary);
            out << "\x89PNG fake";
            return path;
        }

        httplib::Server  server;
        std::thread      listener;
        int              port = 0;
        std::atomic<int> polls{0};
        std::string      uploadAuth;
        std::string      uploadType;
        fakes::TempDir   scratch;
};

TEST_F(TrainingClientTests, StatusNamesRoundTrip) {
    ASSERT_EQ(parseTrainingStatus("training"), TrainingStatus::Training);
    ASSERT_STREQ(toString(TrainingStatus::Ready), "ready");
    ASSERT_THROW(parseTrainingStatus("done"), std::runtime_error);
}

TEST_F(TrainingClientTests, UploadWaitAndDownload) {
    TrainingClient client(url());
    client.authenticate("pilot@example.com", "secret");

    const std::string id = client.createDataset("cups", {imageFile("a.png"), imageFile("b.png")});
    ASSERT_EQ(id, "rec1");
    ASSERT_EQ(uploadAuth, "tok-123");
    ASSERT_EQ(uploadType.rfind("multipart/form-data", 0), 0u);

    TrainingRecord record = client.waitForCompletion(id, std::chrono::milliseconds(5),
                                                     std::chrono::seconds(5));
    ASSERT_EQ(record.status, TrainingStatus::Ready);
    ASSERT_EQ(record.classifierFile, "classifier_x1.onnx");
    ASSERT_EQ(polls.load(), 3);

    const std::string saved = client.downloadClassifier(record, scratch.file("models"));
    ASSERT_EQ(std::filesystem::path(saved).filename().string(), "classifier_rec1.onnx");
    std::ifstream in(saved, std::ios::binary);
    std::ostringstream bytes;
    bytes << in.rdbuf();
    ASSERT_EQ(bytes.str(), "onnx-bytes");
}

TEST_F(TrainingClientTests, WrongPasswordIsRejected) {
    TrainingClient client(url());
    ASSERT_THROW(client.authenticate("pilot@example.com", "nope"), std::runtime_error);
}

TEST_F(TrainingClientTests, NotReadyRecordCannotBeDownloaded) {
    TrainingClient client(url());
    TrainingRecord record = client.fetchRecord("rec1");
    ASSERT_EQ(record.status, TrainingStatus::Pending);
    ASSERT_THROW(client.downloadClassifier(record, scratch.file("models")), std::runtime_error);
}

TEST_F(TrainingClientTests, UnknownRecordIsAnError) {
    TrainingClient client(url());
    ASSERT_THROW(client.fetchRecord("missing"), std::runtime_error);
    ASSERT_THROW(client.fetchRecord("odd"), std::runtime_error);
}

TEST_F(TrainingClientTests, WaitTimesOut) {
    TrainingClient client(url());
    ASSERT_THROW(client.waitForCompletion("rec1", std::chrono::milliseconds(20),
                                          std::chrono::milliseconds(30)),
                 std::runtime_error);
}

TEST_F(TrainingClientTests, MissingImageIsReportedBeforeUpload) {
    TrainingClient client(url());
    ASSERT_THROW(client.createDataset("cups", {scratch.file("absent.png")}), std::runtime_error);
    ASSERT_THROW(client.createDataset("cups", {}), std::runtime_error);
    ASSERT_TRUE(uploadType.empty());
}
