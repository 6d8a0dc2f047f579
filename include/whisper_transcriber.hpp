#pragma once

#include "transcriber.hpp"
#include "model_manager.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

// Forward declare whisper types
struct whisper_context;

namespace voicetype {

class WhisperTranscriber : public Transcriber {
public:
    WhisperTranscriber(const ModelManager& models, int n_threads = 4, int sample_rate = 16000);
    ~WhisperTranscriber() override;

    void shutdown();

    bool is_model_loaded() const override { return loaded_.load(); }
    Status load_model(const std::string& model_id) override;
    TranscriptionResult transcribe(const std::vector<float>& audio,
                                   const std::string& language) override;

private:
    // Calculate confidence from token probabilities
    float calculate_confidence() const;

    const ModelManager& models_;
    int n_threads_;
    int sample_rate_;

    std::mutex ctx_mutex_;
    whisper_context* ctx_ = nullptr;
    std::string model_id_;
    std::atomic<bool> loaded_{false};
};

} // namespace voicetype
