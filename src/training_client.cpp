#include "training_client.hpp"
#include "log.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{
    const char* const kTag = "TrainingClient";

    std::string readFile(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw std::runtime_error("cannot read " + path);
        std::ostringstream bytes;
        bytes << in.rdbuf();
        return bytes.str();
    }

    std::string contentTypeFor(const fs::path& path)
    {
        const std::string ext = path.extension().string();
        if (ext == ".png")                   return "image/png";
        if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
        if (ext == ".webp")                  return "image/webp";
        return "application/octet-stream";
    }

    // Throws unless the request reached the server and got a 2xx answer.
    const httplib::Response& checked(const httplib::Result& res, const std::string& what)
    {
        if (!res)
            throw std::runtime_error(what + ": " + httplib::to_string(res.error()));
        if (res->status < 200 || res->status >= 300) {
            std::ostringstream msg;
            msg << what << ": HTTP " << res->status << ' ' << res->body;
            throw std::runtime_error(msg.str());
        }
        return *res;
    }

    json parseBody(const httplib::Response& res, const std::string& what)
    {
        try {
            return json::parse(res.body);
        } catch (const json::exception& e) {
            throw std::runtime_error(what + ": bad JSON: " + e.what());
        }
    }

    TrainingRecord recordFrom(const json& j)
    {
        TrainingRecord r;
        r.id             = j.at("id").get<std::string>();
        r.name           = j.value("name", std::string());
        r.status         = parseTrainingStatus(j.value("status", std::string("pending")));
        r.classifierFile = j.value("classifier_file", std::string());
        return r;
    }
}

const char* toString(TrainingStatus status)
{
    switch (status) {
        case TrainingStatus::Pending:  return "pending";
        case TrainingStatus::Training: return "training";
        case TrainingStatus::Ready:    return "ready";
        case TrainingStatus::Failed:   return "failed";
    }
    return "unknown";
}

TrainingStatus parseTrainingStatus(const std::string& text)
{
    if (text == "pending")  return TrainingStatus::Pending;
    if (text == "training") return TrainingStatus::Training;
    if (text == "ready")    return TrainingStatus::Ready;
    if (text == "failed")   return TrainingStatus::Failed;
    throw std::runtime_error("unknown training status '" + text + "'");
}

TrainingClient::TrainingClient(std::string baseUrl, std::string collection)
    : baseUrl_(std::move(baseUrl)), collection_(std::move(collection))
{
}

void TrainingClient::authenticate(const std::string& email, const std::string& password)
{
    httplib::Client cli(baseUrl_);
    const json body = {{"identity", email}, {"password", password}};
    auto res = cli.Post("/api/collections/users/auth-with-password", body.dump(), "application/json");
    const json reply = parseBody(checked(res, "authenticate"), "authenticate");
    token_ = reply.at("token").get<std::string>();
    PATCHSEG_LOG_INFO(kTag) << "Authenticated as " << email;
}

std::string TrainingClient::createDataset(const std::string& name,
                                          const std::vector<std::string>& imagePaths)
{
    if (imagePaths.empty())
        throw std::runtime_error("createDataset: no images given");

    httplib::MultipartFormDataItems items;
    items.push_back({"name", name, "", ""});
    items.push_back({"status", toString(TrainingStatus::Pending), "", ""});
    for (const std::string& path : imagePaths) {
        const fs::path p(path);
        items.push_back({"images", readFile(path), p.filename().string(), contentTypeFor(p)});
    }

    httplib::Client cli(baseUrl_);
    httplib::Headers headers;
    if (!token_.empty()) headers.emplace("Authorization", token_);

    auto res = cli.Post("/api/collections/" + collection_ + "/records", headers, items);
    const TrainingRecord record = recordFrom(parseBody(checked(res, "createDataset"), "createDataset"));
    PATCHSEG_LOG_INFO(kTag) << "Dataset '" << name << "' uploaded with " << imagePaths.size()
                            << " images as record " << record.id;
    return record.id;
}

TrainingRecord TrainingClient::fetchRecord(const std::string& id)
{
    httplib::Client cli(baseUrl_);
    httplib::Headers headers;
    if (!token_.empty()) headers.emplace("Authorization", token_);

    auto res = cli.Get("/api/collections/" + collection_ + "/records/" + id, headers);
    return recordFrom(parseBody(checked(res, "fetchRecord"), "fetchRecord"));
}

std::string TrainingClient::downloadClassifier(const TrainingRecord& record, const std::string& destDir)
{
    if (record.status != TrainingStatus::Ready)
        throw std::runtime_error("record " + record.id + " is " + toString(record.status)
                                 + ", not ready");
    if (record.classifierFile.empty())
        throw std::runtime_error("record " + record.id + " has no classifier file");

    httplib::Client cli(baseUrl_);
    httplib::Headers headers;
    if (!token_.empty()) headers.emplace("Authorization", token_);

    auto res = cli.Get("/api/files/" + collection_ + "/" + record.id + "/" + record.classifierFile,
                       headers);
    const httplib::Response& reply = checked(res, "downloadClassifier");

    std::error_code ec;
    fs::create_directories(destDir, ec);
    const fs::path target = fs::path(destDir) / ("classifier_" + record.id + ".onnx");
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + target.string());
    out.write(reply.body.data(), static_cast<std::streamsize>(reply.body.size()));
    out.close();
    if (!out)
        throw std::runtime_error("failed writing " + target.string());

    PATCHSEG_LOG_INFO(kTag) << "Classifier downloaded to " << target.string()
                            << " (" << reply.body.size() << " bytes)";
    return target.string();
}

TrainingRecord TrainingClient::waitForCompletion(const std::string&        id,
                                                 std::chrono::milliseconds pollInterval,
                                                 std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    TrainingStatus last = TrainingStatus::Pending;
    for (;;) {
        TrainingRecord record = fetchRecord(id);
        if (record.status != last) {
            PATCHSEG_LOG_INFO(kTag) << "Record " << id << " is " << toString(record.status);
            last = record.status;
        }
        if (record.status == TrainingStatus::Ready || record.status == TrainingStatus::Failed)
            return record;
        if (std::chrono::steady_clock::now() + pollInterval > deadline)
            throw std::runtime_error("timed out waiting for record " + id);
        std::this_thread::sleep_for(pollInterval);
    }
}
