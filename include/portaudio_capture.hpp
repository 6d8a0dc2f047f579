#pragma once

#include "audio_capture.hpp"

#include <vector>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <portaudio.h>

namespace voicetype {

class PortAudioCapture : public AudioCapture {
public:
    PortAudioCapture(int sample_rate = 16000, int channels = 1, int frames_per_buffer = 512);
    ~PortAudioCapture() override;

    bool initialize();
    void shutdown();

    Status start_recording() override;
    std::vector<float> stop_recording() override;
    bool is_recording() const override { return recording_.load(); }

    PermissionState check_microphone_permission() override;
    bool request_microphone_permission() override;

    bool has_input_device() override;
    std::string input_device_name() override;

    void set_level_callback(LevelCallback callback) override;
    void set_state_callback(StateCallback callback) override;

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);
    static void pa_finished(void* user_data);

    void emit_state(CaptureState state, const DictationError& error = DictationError());

    int sample_rate_;
    int channels_;
    int frames_per_buffer_;

    PaStream* stream_ = nullptr;
    PaDeviceIndex device_ = paNoDevice;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> probed_{false};

    std::vector<float> audio_buffer_;
    std::mutex buffer_mutex_;

    std::mutex callback_mutex_;
    LevelCallback level_callback_;
    StateCallback state_callback_;
};

} // namespace voicetype
