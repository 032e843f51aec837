#include "classifier_store.hpp"
#include "log.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

ClassifierStore::ClassifierStore(std::string modelDir) : modelDir_(std::move(modelDir)) {}

std::optional<std::string> ClassifierStore::activePath() const
{
    std::error_code ec;
    const fs::path path = fs::path(modelDir_) / kActiveFileName;
    if (fs::is_regular_file(path, ec))
        return path.string();
    return std::nullopt;
}

std::string ClassifierStore::persist(const std::string& sourcePath)
{
    const fs::path target = fs::path(modelDir_) / kActiveFileName;

    std::error_code ec;
    if (fs::exists(sourcePath, ec) && fs::exists(target, ec)
        && fs::equivalent(sourcePath, target, ec))
        return target.string();

    fs::create_directories(modelDir_, ec);
    if (ec)
        throw std::runtime_error("cannot create model directory " + modelDir_ + ": " + ec.message());

    // copy next to the target, then rename over it
    const fs::path staging = target.string() + ".partial";
    fs::copy_file(sourcePath, staging, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(staging, ec);
        throw std::runtime_error("cannot copy classifier " + sourcePath + ": " + ec.message());
    }
    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        throw std::runtime_error("cannot install classifier at " + target.string() + ": " + reason);
    }

    PATCHSEG_LOG_INFO("ClassifierStore") << "Active classifier saved to " << target.string();
    return target.string();
}
