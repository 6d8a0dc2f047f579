#pragma once

#include "errors.hpp"
#include "permission_manager.hpp"

#include <functional>
#include <string>
#include <vector>

namespace voicetype {

// The capture device's own view of what it is doing
enum class CaptureState {
    Idle,
    Recording,
    Processing,
    Error
};

class AudioCapture {
public:
    using LevelCallback = std::function<void(float level)>;
    using StateCallback = std::function<void(CaptureState state, const DictationError& error)>;

    virtual ~AudioCapture() = default;

    virtual Status start_recording() = 0;

    // Stops capture and hands over everything recorded since start.
    // Safe to call when not recording (returns an empty buffer).
    virtual std::vector<float> stop_recording() = 0;

    virtual bool is_recording() const = 0;

    virtual PermissionState check_microphone_permission() = 0;
    virtual bool request_microphone_permission() = 0;

    // Device presence, used to watch for a reconnect
    virtual bool has_input_device() = 0;
    virtual std::string input_device_name() = 0;

    // Level in [0, 1], delivered from the capture thread
    virtual void set_level_callback(LevelCallback callback) = 0;
    virtual void set_state_callback(StateCallback callback) = 0;
};

} // namespace voicetype
