#pragma once

#include <string>
#include <vector>

namespace voicetype {

// Whisper models stored as <model_dir>/ggml-<id>.bin
class ModelManager {
public:
    explicit ModelManager(std::string model_dir);
    virtual ~ModelManager() = default;

    virtual bool is_model_downloaded(const std::string& model_id) const;

    std::string model_path(const std::string& model_id) const;

    // Ids of every model file present, sorted
    std::vector<std::string> installed_models() const;

    const std::string& model_dir() const { return model_dir_; }

    static std::string model_filename(const std::string& model_id);

private:
    std::string model_dir_;
};

} // namespace voicetype
