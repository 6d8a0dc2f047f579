#include "model_manager.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace voicetype {

static const std::string MODEL_PREFIX = "ggml-";
static const std::string MODEL_SUFFIX = ".bin";

ModelManager::ModelManager(std::string model_dir)
    : model_dir_(std::move(model_dir)) {
}

std::string ModelManager::model_filename(const std::string& model_id) {
    return MODEL_PREFIX + model_id + MODEL_SUFFIX;
}

std::string ModelManager::model_path(const std::string& model_id) const {
    return (fs::path(model_dir_) / model_filename(model_id)).string();
}

bool ModelManager::is_model_downloaded(const std::string& model_id) const {
    if (model_id.empty()) return false;

    std::error_code ec;
    fs::path path = model_path(model_id);
    if (!fs::is_regular_file(path, ec)) return false;
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

std::vector<std::string> ModelManager::installed_models() const {
    std::vector<std::string> ids;

    std::error_code ec;
    if (!fs::is_directory(model_dir_, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(model_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        if (name.size() <= MODEL_PREFIX.size() + MODEL_SUFFIX.size()) continue;
        if (name.compare(0, MODEL_PREFIX.size(), MODEL_PREFIX) != 0) continue;
        if (name.compare(name.size() - MODEL_SUFFIX.size(), MODEL_SUFFIX.size(), MODEL_SUFFIX) != 0) continue;
        ids.push_back(name.substr(MODEL_PREFIX.size(), name.size() - MODEL_PREFIX.size() - MODEL_SUFFIX.size()));
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace voicetype
