#include "errors.hpp"

namespace voicetype {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MicrophonePermissionDenied: return "MicrophonePermissionDenied";
        case ErrorKind::AccessibilityPermissionMissing: return "AccessibilityPermissionMissing";
        case ErrorKind::AudioDeviceDisconnected: return "AudioDeviceDisconnected";
        case ErrorKind::ModelNotFound: return "ModelNotFound";
        case ErrorKind::ModelLoadingFailed: return "ModelLoadingFailed";
        case ErrorKind::NoFocusedApplication: return "NoFocusedApplication";
        case ErrorKind::UnsupportedApplication: return "UnsupportedApplication";
        case ErrorKind::NetworkUnavailable: return "NetworkUnavailable";
        case ErrorKind::InvalidAudioData: return "InvalidAudioData";
        case ErrorKind::LowConfidenceTranscription: return "LowConfidenceTranscription";
        case ErrorKind::TranscriptionFailed: return "TranscriptionFailed";
        case ErrorKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

static DictationError make_error(ErrorKind kind, const std::string& detail = "") {
    DictationError error;
    error.kind = kind;
    error.detail = detail;
    return error;
}

DictationError DictationError::microphone_permission_denied() {
    return make_error(ErrorKind::MicrophonePermissionDenied);
}

DictationError DictationError::accessibility_permission_missing(const std::string& detail) {
    return make_error(ErrorKind::AccessibilityPermissionMissing, detail);
}

DictationError DictationError::audio_device_disconnected() {
    return make_error(ErrorKind::AudioDeviceDisconnected);
}

DictationError DictationError::model_not_found(const std::string& model_id) {
    return make_error(ErrorKind::ModelNotFound, model_id);
}

DictationError DictationError::model_loading_failed(const std::string& model_id, const std::string& reason) {
    return make_error(ErrorKind::ModelLoadingFailed, model_id + ": " + reason);
}

DictationError DictationError::no_focused_application() {
    return make_error(ErrorKind::NoFocusedApplication);
}

DictationError DictationError::unsupported_application(const std::string& app_name) {
    return make_error(ErrorKind::UnsupportedApplication, app_name);
}

DictationError DictationError::network_unavailable() {
    return make_error(ErrorKind::NetworkUnavailable);
}

DictationError DictationError::invalid_audio_data() {
    return make_error(ErrorKind::InvalidAudioData);
}

DictationError DictationError::low_confidence(float confidence) {
    DictationError error = make_error(ErrorKind::LowConfidenceTranscription);
    error.confidence = confidence;
    return error;
}

DictationError DictationError::transcription_failed(const std::string& reason) {
    return make_error(ErrorKind::TranscriptionFailed, reason);
}

DictationError DictationError::unknown(const std::string& detail) {
    return make_error(ErrorKind::Unknown, detail);
}

std::string DictationError::description() const {
    switch (kind) {
        case ErrorKind::MicrophonePermissionDenied:
            return "Microphone permission is required to record audio. "
                   "No usable input device could be opened.";
        case ErrorKind::AccessibilityPermissionMissing:
            return "Accessibility permission is missing, text cannot be typed into other applications"
                   + (detail.empty() ? std::string(".") : " (" + detail + ").");
        case ErrorKind::AudioDeviceDisconnected:
            return "Audio device was disconnected. Please reconnect and try again.";
        case ErrorKind::ModelNotFound:
            return "Model '" + detail + "' was not found. Please download it first.";
        case ErrorKind::ModelLoadingFailed:
            return "Failed to load model " + detail;
        case ErrorKind::NoFocusedApplication:
            return "No application is currently focused. Click on a text field and try again.";
        case ErrorKind::UnsupportedApplication:
            return "Text insertion is not supported in '" + detail + "'.";
        case ErrorKind::NetworkUnavailable:
            return "Network connection is not available.";
        case ErrorKind::InvalidAudioData:
            return "The recorded audio data is invalid or empty.";
        case ErrorKind::LowConfidenceTranscription:
            return "Transcription confidence (" + std::to_string(static_cast<int>(confidence * 100)) +
                   "%) is too low. Please speak clearly.";
        case ErrorKind::TranscriptionFailed:
            return "Transcription failed: " + detail;
        case ErrorKind::Unknown:
            return "An unknown error occurred: " + detail;
    }
    return detail;
}

std::string DictationError::recovery_suggestion() const {
    switch (kind) {
        case ErrorKind::MicrophonePermissionDenied:
            return "Add your user to the 'audio' group or check the input device in your sound settings.";
        case ErrorKind::AccessibilityPermissionMissing:
            return "Run inside an X11 session with the XTest extension enabled.";
        case ErrorKind::AudioDeviceDisconnected:
            return "Reconnect your audio device or select a different microphone.";
        case ErrorKind::ModelNotFound:
            return "Download the model into the model directory.";
        case ErrorKind::UnsupportedApplication:
        case ErrorKind::NoFocusedApplication:
            return "The text has been copied to your clipboard. Press Ctrl+V to paste.";
        case ErrorKind::NetworkUnavailable:
            return "Network is required for model downloads. Please check your connection.";
        default:
            return "";
    }
}

bool DictationError::is_non_fatal() const {
    return kind == ErrorKind::AccessibilityPermissionMissing ||
           kind == ErrorKind::NoFocusedApplication ||
           kind == ErrorKind::UnsupportedApplication;
}

} // namespace voicetype
