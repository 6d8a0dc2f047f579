#include "portaudio_capture.hpp"
#include <iostream>
#include <cmath>
#include <algorithm>

namespace voicetype {

// RMS of speech rarely exceeds ~0.3, scale so normal speech fills the meter
static constexpr float LEVEL_GAIN = 3.0f;

PortAudioCapture::PortAudioCapture(int sample_rate, int channels, int frames_per_buffer)
    : sample_rate_(sample_rate)
    , channels_(channels)
    , frames_per_buffer_(frames_per_buffer) {
}

PortAudioCapture::~PortAudioCapture() {
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        level_callback_ = nullptr;
        state_callback_ = nullptr;
    }
    shutdown();
}

bool PortAudioCapture::initialize() {
    if (initialized_.load()) return true;
    probed_.store(true);

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    // Open default input device
    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "No default input device" << std::endl;
        Pa_Terminate();
        return false;
    }

    input_params.channelCount = channels_;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = Pa_GetDeviceInfo(input_params.device)->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        sample_rate_,
                        frames_per_buffer_,
                        paClipOff,
                        pa_callback,
                        this);

    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        Pa_Terminate();
        return false;
    }

    Pa_SetStreamFinishedCallback(stream_, pa_finished);

    device_ = input_params.device;
    initialized_.store(true);
    std::cout << "Audio input: " << Pa_GetDeviceInfo(device_)->name
              << " (" << frames_per_buffer_ << " frames/buffer)" << std::endl;
    return true;
}

void PortAudioCapture::shutdown() {
    if (!initialized_.load()) return;

    stop_recording();

    if (stream_) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

    Pa_Terminate();
    device_ = paNoDevice;
    initialized_.store(false);
}

Status PortAudioCapture::start_recording() {
    if (recording_.load()) {
        return Status::failure(DictationError::unknown("Recording is already in progress"));
    }

    // Device may have come back since the last failure
    if (!initialized_.load() && !initialize()) {
        emit_state(CaptureState::Error, DictationError::audio_device_disconnected());
        return Status::failure(DictationError::audio_device_disconnected());
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        audio_buffer_.clear();
        audio_buffer_.reserve(sample_rate_ * 30);  // Reserve for 30 seconds
    }

    recording_.store(true);
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        recording_.store(false);
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        if (err == paDeviceUnavailable) {
            return Status::failure(DictationError::audio_device_disconnected());
        }
        return Status::failure(DictationError::unknown(
            std::string("Failed to start audio stream: ") + Pa_GetErrorText(err)));
    }

    emit_state(CaptureState::Recording);
    return Status::success();
}

std::vector<float> PortAudioCapture::stop_recording() {
    if (!recording_.load()) return {};

    stopping_.store(true);
    recording_.store(false);
    emit_state(CaptureState::Processing);

    PaError err = Pa_StopStream(stream_);
    stopping_.store(false);
    if (err != paNoError) {
        std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }

    std::vector<float> samples;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        samples.swap(audio_buffer_);
    }

    emit_state(CaptureState::Idle);
    return samples;
}

PermissionState PortAudioCapture::check_microphone_permission() {
    if (initialized_.load()) return PermissionState::Granted;
    if (!probed_.load()) return PermissionState::NotDetermined;
    return PermissionState::Denied;
}

bool PortAudioCapture::request_microphone_permission() {
    // No prompt on Linux: opening the device is the request
    return initialize();
}

bool PortAudioCapture::has_input_device() {
    if (recording_.load()) return true;

    // PortAudio only enumerates devices on Pa_Initialize
    shutdown();
    return initialize();
}

std::string PortAudioCapture::input_device_name() {
    if (!initialized_.load() || device_ == paNoDevice) return "";
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device_);
    return info ? info->name : "";
}

void PortAudioCapture::set_level_callback(LevelCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    level_callback_ = std::move(callback);
}

void PortAudioCapture::set_state_callback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

void PortAudioCapture::emit_state(CaptureState state, const DictationError& error) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = state_callback_;
    }
    if (callback) callback(state, error);
}

int PortAudioCapture::pa_callback(const void* input, void* output,
                                  unsigned long frame_count,
                                  const PaStreamCallbackTimeInfo* time_info,
                                  PaStreamCallbackFlags status_flags,
                                  void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<PortAudioCapture*>(user_data);
    if (!capture->recording_.load() || !input) return paContinue;

    const float* in = static_cast<const float*>(input);
    const unsigned long n_samples = frame_count * static_cast<unsigned long>(capture->channels_);

    {
        std::lock_guard<std::mutex> lock(capture->buffer_mutex_);
        capture->audio_buffer_.insert(capture->audio_buffer_.end(), in, in + n_samples);
    }

    float sum = 0.0f;
    for (unsigned long i = 0; i < n_samples; ++i) {
        sum += in[i] * in[i];
    }
    float rms = n_samples > 0 ? std::sqrt(sum / static_cast<float>(n_samples)) : 0.0f;
    float level = std::min(1.0f, rms * LEVEL_GAIN);

    LevelCallback callback;
    {
        std::lock_guard<std::mutex> lock(capture->callback_mutex_);
        callback = capture->level_callback_;
    }
    if (callback) callback(level);

    return paContinue;
}

// Stream ended without stop_recording(): the device went away
void PortAudioCapture::pa_finished(void* user_data) {
    auto* capture = static_cast<PortAudioCapture*>(user_data);
    if (capture->stopping_.load() || !capture->recording_.load()) return;

    capture->recording_.store(false);
    std::cerr << "Audio stream ended unexpectedly" << std::endl;
    capture->emit_state(CaptureState::Error, DictationError::audio_device_disconnected());
}

} // namespace voicetype
