#pragma once

#include <string>
#include <utility>

namespace voicetype {

enum class ErrorKind {
    MicrophonePermissionDenied,
    AccessibilityPermissionMissing,
    AudioDeviceDisconnected,
    ModelNotFound,
    ModelLoadingFailed,
    NoFocusedApplication,
    UnsupportedApplication,
    NetworkUnavailable,
    InvalidAudioData,
    LowConfidenceTranscription,
    TranscriptionFailed,
    Unknown
};

const char* error_kind_name(ErrorKind kind);

// Tagged error value passed between collaborators and the orchestrator.
// `detail` carries the model id, application name or free-form reason
// depending on the kind.
struct DictationError {
    ErrorKind kind = ErrorKind::Unknown;
    std::string detail;
    float confidence = 0.0f;    // LowConfidenceTranscription only

    static DictationError microphone_permission_denied();
    static DictationError accessibility_permission_missing(const std::string& detail = "");
    static DictationError audio_device_disconnected();
    static DictationError model_not_found(const std::string& model_id);
    static DictationError model_loading_failed(const std::string& model_id, const std::string& reason);
    static DictationError no_focused_application();
    static DictationError unsupported_application(const std::string& app_name);
    static DictationError network_unavailable();
    static DictationError invalid_audio_data();
    static DictationError low_confidence(float confidence);
    static DictationError transcription_failed(const std::string& reason);
    static DictationError unknown(const std::string& detail);

    // User-facing text
    std::string description() const;

    // Empty when there is nothing more specific to suggest
    std::string recovery_suggestion() const;

    // Errors that resolve through the clipboard instead of Error
    bool is_non_fatal() const;
};

// Outcome of a collaborator operation that produces no value
struct Status {
    bool ok = true;
    DictationError error;

    static Status success() { return Status{}; }
    static Status failure(DictationError error) {
        Status status;
        status.ok = false;
        status.error = std::move(error);
        return status;
    }
};

} // namespace voicetype
