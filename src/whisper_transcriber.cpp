#include "whisper_transcriber.hpp"
#include "config.hpp"
#include "whisper.h"
#include <iostream>
#include <chrono>

namespace voicetype {

WhisperTranscriber::WhisperTranscriber(const ModelManager& models, int n_threads, int sample_rate)
    : models_(models)
    , n_threads_(n_threads)
    , sample_rate_(sample_rate) {
}

WhisperTranscriber::~WhisperTranscriber() {
    shutdown();
}

void WhisperTranscriber::shutdown() {
    std::lock_guard<std::mutex> lock(ctx_mutex_);
    loaded_.store(false);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

Status WhisperTranscriber::load_model(const std::string& model_id) {
    if (!models_.is_model_downloaded(model_id)) {
        return Status::failure(DictationError::model_not_found(model_id));
    }

    std::string model_path = models_.model_path(model_id);

    struct whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;

    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        std::cerr << "Failed to load whisper model: " << model_path << std::endl;
        return Status::failure(DictationError::model_loading_failed(model_id, "whisper could not read " + model_path));
    }

    std::lock_guard<std::mutex> lock(ctx_mutex_);
    if (ctx_) {
        whisper_free(ctx_);
    }
    ctx_ = ctx;
    model_id_ = model_id;
    loaded_.store(true);

    std::cout << "Loaded whisper model: " << model_path << std::endl;
    return Status::success();
}

TranscriptionResult WhisperTranscriber::transcribe(const std::vector<float>& audio,
                                                   const std::string& language) {
    TranscriptionResult result;

    std::lock_guard<std::mutex> lock(ctx_mutex_);

    if (!ctx_) {
        result.error = DictationError::model_not_found(model_id_.empty() ? DEFAULT_MODEL_ID : model_id_);
        return result;
    }

    if (audio.empty()) {
        result.error = DictationError::invalid_audio_data();
        return result;
    }

    // Whisper requires minimum 100ms of audio - pad with silence if too short
    std::vector<float> samples = audio;
    size_t min_samples = static_cast<size_t>(sample_rate_ / 10);
    if (samples.size() < min_samples) {
        samples.resize(min_samples, 0.0f);
    }

    auto start_time = std::chrono::steady_clock::now();

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    std::string lang = (language.empty() || language == "auto") ? "auto" : language;

    wparams.print_progress   = false;
    wparams.print_special    = false;
    wparams.print_realtime   = false;
    wparams.print_timestamps = false;
    wparams.translate        = false;
    wparams.single_segment   = true;   // Faster for short audio
    wparams.no_context       = true;
    wparams.language         = lang.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = n_threads_;

    // Run inference
    int ret = whisper_full(ctx_, wparams, samples.data(), static_cast<int>(samples.size()));
    if (ret != 0) {
        result.error = DictationError::transcription_failed("whisper inference returned " + std::to_string(ret));
        return result;
    }

    // Get result
    const int n_segments = whisper_full_n_segments(ctx_);
    std::string text;
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(ctx_, i);
        if (segment_text) {
            text += segment_text;
        }
    }

    // Trim whitespace
    size_t start = text.find_first_not_of(" \t\n\r");
    size_t end = text.find_last_not_of(" \t\n\r");
    if (start != std::string::npos && end != std::string::npos) {
        text = text.substr(start, end - start + 1);
    } else {
        text.clear();
    }

    auto end_time = std::chrono::steady_clock::now();

    result.text = text;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    result.confidence = calculate_confidence();
    result.success = true;

    std::cout << "Transcription took " << result.duration_ms << "ms (conf: "
              << static_cast<int>(result.confidence * 100) << "%): \"" << result.text << "\"" << std::endl;

    return result;
}

float WhisperTranscriber::calculate_confidence() const {
    if (!ctx_) return 0.0f;

    const int n_segments = whisper_full_n_segments(ctx_);
    if (n_segments == 0) return 0.0f;

    float total_prob = 0.0f;
    int total_tokens = 0;

    for (int seg = 0; seg < n_segments; ++seg) {
        const int n_tokens = whisper_full_n_tokens(ctx_, seg);
        for (int tok = 0; tok < n_tokens; ++tok) {
            whisper_token_data token_data = whisper_full_get_token_data(ctx_, seg, tok);
            // Skip special tokens (negative IDs or very low probability)
            if (token_data.id >= 0 && token_data.p > 0.0f) {
                total_prob += token_data.p;
                total_tokens++;
            }
        }
    }

    return total_tokens > 0 ? total_prob / static_cast<float>(total_tokens) : 0.0f;
}

} // namespace voicetype
