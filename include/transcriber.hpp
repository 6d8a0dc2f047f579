#pragma once

#include "errors.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace voicetype {

struct TranscriptionResult {
    std::string text;
    int64_t duration_ms = 0;
    float confidence = 0.0f;    // Average token probability (0.0 - 1.0)
    bool success = false;
    DictationError error;
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    virtual bool is_model_loaded() const = 0;

    // Replaces any previously loaded model
    virtual Status load_model(const std::string& model_id) = 0;

    // 16kHz mono float samples. Empty language means auto-detect.
    virtual TranscriptionResult transcribe(const std::vector<float>& audio,
                                           const std::string& language) = 0;
};

} // namespace voicetype
