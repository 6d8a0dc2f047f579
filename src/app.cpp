#include "app.hpp"
#include "portaudio_capture.hpp"
#include "whisper_transcriber.hpp"
#include "x11_text_injector.hpp"
#include <iostream>
#include <thread>
#include <chrono>

namespace voicetype {

App::App() = default;

App::~App() {
    shutdown();
}

bool App::initialize(const Config& config, const ConfigOverrides& overrides) {
    config_ = config;

    std::string preferences_path = config_.preferences_path.empty()
        ? PreferenceStore::default_path() : config_.preferences_path;
    auto preferences = std::make_unique<PreferenceStore>(preferences_path);
    if (!preferences->load()) {
        std::cerr << "Failed to read preferences, using defaults" << std::endl;
    }
    apply_preferences(*preferences, overrides, config_);

    Collaborators collaborators;
    collaborators.preferences = std::move(preferences);
    collaborators.models = std::make_unique<ModelManager>(config_.model_dir);
    collaborators.clipboard = std::make_unique<SystemClipboard>();
    collaborators.permissions = std::make_unique<LinuxPermissionManager>();
    collaborators.hotkeys = std::make_unique<EvdevHotkeyManager>();

    // Both keep a reference; the pointees move into the orchestrator with their owners
    collaborators.transcriber = std::make_unique<WhisperTranscriber>(
        *collaborators.models, config_.n_threads, config_.sample_rate);
    collaborators.injector = std::make_unique<X11TextInjector>(*collaborators.clipboard);

    const int sample_rate = config_.sample_rate;
    const int channels = config_.channels;
    collaborators.audio_factory = [sample_rate, channels](int frames_per_buffer) -> std::unique_ptr<AudioCapture> {
        return std::make_unique<PortAudioCapture>(sample_rate, channels, frames_per_buffer);
    };
    collaborators.audio = collaborators.audio_factory(config_.frames_per_buffer);

    std::vector<std::string> installed = collaborators.models->installed_models();
    if (installed.empty()) {
        std::cerr << "No models found in " << config_.model_dir << std::endl;
    } else {
        std::cout << "Installed models:";
        for (const auto& id : installed) std::cout << " " << id;
        std::cout << std::endl;
    }

    orchestrator_ = std::make_unique<Orchestrator>(config_, std::move(collaborators));

    if (!create_status_display(*orchestrator_)) {
        std::cerr << "Failed to create status display" << std::endl;
        // Continue anyway - not critical
    }

    if (!orchestrator_->initialize()) {
        std::cerr << "Failed to initialize orchestrator" << std::endl;
        destroy_status_display();
        orchestrator_.reset();
        return false;
    }

    return true;
}

void App::shutdown() {
    should_quit_.store(true);

    if (orchestrator_) {
        orchestrator_->shutdown();
        destroy_status_display();
        orchestrator_.reset();
    }
}

int App::run() {
    if (!orchestrator_) {
        std::cerr << "App not initialized" << std::endl;
        return 1;
    }

    std::cout << "\n=== VoiceType Ready ===" << std::endl;
    if (config_.hotkey_mode == HotkeyMode::PushToTalk) {
        std::cout << "Hold " << config_.hotkey << " to record, release to transcribe and insert." << std::endl;
    } else {
        std::cout << "Press " << config_.hotkey << " to start recording, press again to transcribe and insert." << std::endl;
    }
    std::cout << "Recordings stop automatically after " << config_.max_recording_seconds << " seconds.\n" << std::endl;

    while (!should_quit_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return 0;
}

} // namespace voicetype
