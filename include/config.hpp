#pragma once

#include <string>
#include <cstdint>

namespace voicetype {

// Smallest model, used as the recovery fallback
inline const std::string DEFAULT_MODEL_ID = "tiny";

// Transcriptions below this average token probability are rejected
constexpr float MIN_TRANSCRIPTION_CONFIDENCE = 0.5f;

enum class HotkeyMode {
    PushToTalk,   // press starts, release stops
    Toggle        // press starts, next press stops
};

inline const char* hotkey_mode_name(HotkeyMode mode) {
    switch (mode) {
        case HotkeyMode::PushToTalk: return "push-to-talk";
        case HotkeyMode::Toggle: return "toggle";
    }
    return "push-to-talk";
}

struct Config {
    // Audio settings
    int sample_rate = 16000;        // Whisper expects 16kHz
    int channels = 1;               // Mono
    int frames_per_buffer = 512;    // Low latency buffer

    // Whisper model
    std::string model_dir = "models";
    std::string model_id = DEFAULT_MODEL_ID;
    std::string language = "en";    // empty or "auto" = detect
    int n_threads = 4;              // CPU threads for inference

    // Hotkey
    std::string hotkey = "KEY_RIGHTALT";
    HotkeyMode hotkey_mode = HotkeyMode::PushToTalk;

    // Behavior
    int max_recording_seconds = 30;
    float min_confidence = MIN_TRANSCRIPTION_CONFIDENCE;
    int max_recovery_attempts = 3;

    // Timing (ms)
    int64_t error_reset_ms = 5000;      // Error -> Idle
    int64_t success_reset_ms = 2000;    // Success -> Idle
    int64_t health_check_ms = 30000;
    int64_t progress_tick_ms = 100;
    int64_t device_poll_ms = 1000;

    // Preferences file, empty = ~/.voicetype/preferences
    std::string preferences_path;
};

} // namespace voicetype
