#include "recording_state.hpp"

namespace voicetype {

const char* phase_name(RecordingPhase phase) {
    switch (phase) {
        case RecordingPhase::Idle: return "Idle";
        case RecordingPhase::Recording: return "Recording";
        case RecordingPhase::Processing: return "Processing";
        case RecordingPhase::Success: return "Success";
        case RecordingPhase::Error: return "Error";
    }
    return "Unknown";
}

bool is_valid_transition(RecordingPhase from, RecordingPhase to) {
    switch (from) {
        case RecordingPhase::Idle:
            return to == RecordingPhase::Recording;
        case RecordingPhase::Recording:
            return to == RecordingPhase::Processing ||
                   to == RecordingPhase::Idle ||
                   to == RecordingPhase::Error;
        case RecordingPhase::Processing:
            return to == RecordingPhase::Success ||
                   to == RecordingPhase::Error;
        case RecordingPhase::Success:
            // Recording allowed for an immediate re-trigger
            return to == RecordingPhase::Idle ||
                   to == RecordingPhase::Recording;
        case RecordingPhase::Error:
            // Recording allowed for retry
            return to == RecordingPhase::Idle ||
                   to == RecordingPhase::Recording;
    }
    return false;
}

std::string to_string(const RecordingState& state) {
    if (state.phase == RecordingPhase::Error) {
        return std::string("Error(") + state.message + ")";
    }
    return phase_name(state.phase);
}

} // namespace voicetype
