#pragma once

#include <string>

namespace voicetype {

enum class RecordingPhase {
    Idle,
    Recording,
    Processing,
    Success,
    Error
};

const char* phase_name(RecordingPhase phase);

// Workflow state. Only Error carries a message.
struct RecordingState {
    RecordingPhase phase = RecordingPhase::Idle;
    std::string message;

    static RecordingState idle() { return {RecordingPhase::Idle, ""}; }
    static RecordingState recording() { return {RecordingPhase::Recording, ""}; }
    static RecordingState processing() { return {RecordingPhase::Processing, ""}; }
    static RecordingState success() { return {RecordingPhase::Success, ""}; }
    static RecordingState error(const std::string& message) { return {RecordingPhase::Error, message}; }

    bool is(RecordingPhase p) const { return phase == p; }

    bool operator==(const RecordingState& other) const {
        return phase == other.phase && message == other.message;
    }
    bool operator!=(const RecordingState& other) const { return !(*this == other); }
};

// Table of admissible edges. Anything not listed is rejected.
bool is_valid_transition(RecordingPhase from, RecordingPhase to);

inline bool is_valid_transition(const RecordingState& from, const RecordingState& to) {
    return is_valid_transition(from.phase, to.phase);
}

std::string to_string(const RecordingState& state);

} // namespace voicetype
