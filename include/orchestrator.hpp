#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "recording_state.hpp"
#include "observable.hpp"
#include "serial_executor.hpp"
#include "audio_capture.hpp"
#include "transcriber.hpp"
#include "text_injector.hpp"
#include "clipboard.hpp"
#include "permission_manager.hpp"
#include "hotkey_manager.hpp"
#include "model_manager.hpp"
#include "preferences.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voicetype {

// Everything the orchestrator drives. Ownership moves into the orchestrator.
struct Collaborators {
    using AudioFactory = std::function<std::unique_ptr<AudioCapture>(int frames_per_buffer)>;

    std::unique_ptr<AudioCapture> audio;
    std::unique_ptr<Transcriber> transcriber;
    std::unique_ptr<TextInjector> injector;
    std::unique_ptr<Clipboard> clipboard;
    std::unique_ptr<PermissionManager> permissions;
    std::unique_ptr<HotkeyManager> hotkeys;
    std::unique_ptr<ModelManager> models;
    std::unique_ptr<PreferenceStore> preferences;

    // Rebuilds the capture collaborator when the buffer size changes
    AudioFactory audio_factory;
};

// Owns the dictation state and sequences the collaborators.
//
// Every state read and write happens on one serial executor (the state
// queue). Collaborator calls run on a second executor (the work queue) and
// post their results back to the state queue, so transitions are applied in
// the order their triggers were accepted. All public methods are safe to
// call from any thread.
class Orchestrator {
public:
    static constexpr const char* PUSH_TO_TALK_HOTKEY_ID = "voicetype.push-to-talk";

    Orchestrator(const Config& config, Collaborators collaborators);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Starts the executors, probes permissions, loads the selected model,
    // registers the hotkey and begins health monitoring
    bool initialize();
    void shutdown();

    // Workflow
    void start_dictation();
    void stop_dictation();
    void change_model(const std::string& model_id);
    void load_selected_model();
    void request_permissions();

    // Rebuild audio capture with a new buffer size (Idle only)
    void set_audio_buffer_size(int frames_per_buffer);

    // Observable state
    const Observable<RecordingState>& recording_state() const { return recording_state_; }
    const Observable<float>& audio_level() const { return audio_level_; }
    const Observable<std::string>& last_transcription() const { return last_transcription_; }
    const Observable<std::string>& error_message() const { return error_message_; }
    const Observable<double>& recording_progress() const { return recording_progress_; }
    const Observable<bool>& is_ready() const { return is_ready_; }
    const Observable<bool>& has_microphone_permission() const { return has_microphone_permission_; }
    const Observable<bool>& has_accessibility_permission() const { return has_accessibility_permission_; }
    const Observable<bool>& is_loading_model() const { return is_loading_model_; }
    const Observable<double>& model_loading_progress() const { return model_loading_progress_; }
    const Observable<std::string>& model_loading_status() const { return model_loading_status_; }
    const Observable<std::string>& current_audio_device() const { return current_audio_device_; }
    const Observable<std::string>& selected_model_id() const { return selected_model_id_; }

    // One line for a status display
    std::string state_summary() const;

private:
    enum class Operation {
        Recording,
        Transcription,
        TextInjection,
        ModelLoading
    };

    struct Session {
        std::chrono::steady_clock::time_point started_at;
        std::chrono::milliseconds elapsed{0};
        std::string transcription;
        bool capture_active = false;
        bool stop_requested = false;    // hotkey let go before capture started
        SerialExecutor::TimerId auto_stop_timer = 0;
        SerialExecutor::TimerId progress_timer = 0;
    };

    struct HealthReport {
        bool capture_running = false;
        bool stopped_stray_capture = false;
        bool model_loaded = false;
        std::string model_id;
        bool model_downloaded = true;
        PermissionState microphone = PermissionState::NotDetermined;
        bool accessibility = false;
    };

    static const char* operation_name(Operation operation);

    // Executor plumbing
    bool post_state(SerialExecutor::Task task);
    bool post_work(SerialExecutor::Task task);
    SerialExecutor::TimerId schedule(int64_t delay_ms, SerialExecutor::Task task);

    // State queue only below this line

    bool transition_to(const RecordingState& next);
    void schedule_reset(uint64_t generation, int64_t delay_ms);
    RecordingPhase phase() const { return recording_state_.get().phase; }

    void do_start_dictation();
    void on_start_checked(uint64_t generation, PermissionState microphone, bool model_loaded, Status capture);
    void do_stop_dictation();
    void on_transcribed(uint64_t generation, const TranscriptionResult& result);
    void dispatch_injection(uint64_t generation, const std::string& text);
    void on_injected(uint64_t generation, const std::string& text, const InjectionResult& result, bool copied);

    void do_load_model(const std::string& model_id, bool user_initiated);
    void on_model_loaded(const std::string& model_id, const Status& status);
    void finish_model_loading();

    void handle_error(const DictationError& error, Operation operation);
    void copy_to_clipboard_then_succeed(const std::string& text, const std::string& message);

    void on_hotkey_press();
    void on_hotkey_release();
    void register_hotkey();

    void on_capture_state(CaptureState state, const DictationError& error);
    void on_audio_level(float level);
    void on_permission_changed(Permission permission, PermissionState state);

    void schedule_progress_tick(uint64_t generation);
    void cancel_session_timers();

    void schedule_health_check();
    void run_health_check();
    void on_health_report(const HealthReport& report);

    void start_device_watch();
    void poll_device();

    void update_ready_state();
    void bind_audio_callbacks();

    // Collaborator calls, exceptions converted to DictationError.
    // Work queue only.
    Status guarded(const char* what, const std::function<Status()>& call);

    Config config_;

    // Collaborators are only dereferenced on the work queue
    std::unique_ptr<AudioCapture> audio_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<TextInjector> injector_;
    std::unique_ptr<Clipboard> clipboard_;
    std::unique_ptr<PermissionManager> permissions_;
    std::unique_ptr<HotkeyManager> hotkeys_;
    std::unique_ptr<ModelManager> models_;
    std::unique_ptr<PreferenceStore> preferences_;
    Collaborators::AudioFactory audio_factory_;

    // Observables, written on the state queue only
    Observable<RecordingState> recording_state_{RecordingState::idle()};
    Observable<float> audio_level_{0.0f};
    Observable<std::string> last_transcription_;
    Observable<std::string> error_message_;
    Observable<double> recording_progress_{0.0};
    Observable<bool> is_ready_{false};
    Observable<bool> has_microphone_permission_{false};
    Observable<bool> has_accessibility_permission_{false};
    Observable<bool> is_loading_model_{false};
    Observable<double> model_loading_progress_{0.0};
    Observable<std::string> model_loading_status_;
    Observable<std::string> current_audio_device_;
    Observable<std::string> selected_model_id_;

    // State queue data
    uint64_t generation_ = 0;   // bumped on every applied transition
    Session session_;
    int error_recovery_attempts_ = 0;
    bool model_loaded_ = false;
    bool selected_model_downloaded_ = true;
    bool hotkey_registered_ = false;
    bool device_watch_active_ = false;
    std::string language_;
    std::chrono::milliseconds max_recording_{0};

    // Declared last so they stop before the collaborators go away
    SerialExecutor state_queue_{"state"};
    SerialExecutor work_queue_{"work"};
    bool initialized_ = false;
};

} // namespace voicetype
