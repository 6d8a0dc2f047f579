// Hand-written collaborators for driving the orchestrator in tests.
// Every mock is called from the orchestrator's work queue and inspected from
// the test thread, so all state is behind a mutex or atomic.
#pragma once

#include "orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace voicetype {
namespace testing {

// Poll until pred() holds or the timeout passes
inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

class MockAudioCapture : public AudioCapture {
public:
    Status start_recording() override {
        int delay = start_delay_ms.load();
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        ++start_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        if (!start_status_.ok) return start_status_;
        recording_.store(true);
        return Status::success();
    }

    std::vector<float> stop_recording() override {
        ++stop_calls;
        if (!recording_.exchange(false)) return {};
        std::lock_guard<std::mutex> lock(mutex_);
        return samples_;
    }

    bool is_recording() const override { return recording_.load(); }

    PermissionState check_microphone_permission() override { return permission.load(); }
    bool request_microphone_permission() override {
        ++request_calls;
        return grant_on_request.load();
    }

    bool has_input_device() override { return device_present.load(); }
    std::string input_device_name() override { return device_present.load() ? "Mock Microphone" : ""; }

    void set_level_callback(LevelCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        level_callback_ = std::move(callback);
    }
    void set_state_callback(StateCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        state_callback_ = std::move(callback);
    }

    // Test controls
    void set_samples(std::vector<float> samples) {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_ = std::move(samples);
    }
    void set_start_status(Status status) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_status_ = std::move(status);
    }
    void force_recording(bool recording) { recording_.store(recording); }

    void emit_level(float level) {
        LevelCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = level_callback_;
        }
        if (callback) callback(level);
    }
    void emit_state(CaptureState state, const DictationError& error = DictationError()) {
        StateCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = state_callback_;
        }
        if (callback) callback(state, error);
    }

    std::atomic<PermissionState> permission{PermissionState::Granted};
    std::atomic<bool> grant_on_request{true};
    std::atomic<bool> device_present{true};
    std::atomic<int> start_delay_ms{0};
    std::atomic<int> start_calls{0};
    std::atomic<int> stop_calls{0};
    std::atomic<int> request_calls{0};

private:
    std::atomic<bool> recording_{false};
    std::mutex mutex_;
    std::vector<float> samples_ = std::vector<float>(16000, 0.1f);
    Status start_status_;
    LevelCallback level_callback_;
    StateCallback state_callback_;
};

class MockTranscriber : public Transcriber {
public:
    MockTranscriber() {
        result_.text = "hello world";
        result_.confidence = 0.9f;
        result_.success = true;
    }

    bool is_model_loaded() const override { return loaded.load(); }

    Status load_model(const std::string& model_id) override {
        int delay = load_delay_ms.load();
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        std::lock_guard<std::mutex> lock(mutex_);
        ++load_counts_[model_id];
        if (failing_models_.count(model_id)) {
            return Status::failure(DictationError::model_loading_failed(model_id, "corrupt model file"));
        }
        loaded.store(true);
        return Status::success();
    }

    TranscriptionResult transcribe(const std::vector<float>& audio, const std::string& language) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++transcribe_calls;
        last_language_ = language;
        last_sample_count = audio.size();
        return result_;
    }

    void fail_model(const std::string& model_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_models_.insert(model_id);
    }
    int load_count(const std::string& model_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = load_counts_.find(model_id);
        return it == load_counts_.end() ? 0 : it->second;
    }
    void set_result(TranscriptionResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = std::move(result);
    }
    void set_confidence(float confidence) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_.confidence = confidence;
    }
    std::string last_language() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_language_;
    }

    std::atomic<bool> loaded{false};
    std::atomic<int> load_delay_ms{0};
    std::atomic<int> transcribe_calls{0};
    std::atomic<size_t> last_sample_count{0};

private:
    std::mutex mutex_;
    TranscriptionResult result_;
    std::set<std::string> failing_models_;
    std::map<std::string, int> load_counts_;
    std::string last_language_;
};

class MockTextInjector : public TextInjector {
public:
    InjectionResult inject(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls;
        last_text_ = text;
        return result_;
    }

    void set_result(InjectionResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = std::move(result);
    }
    std::string last_text() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_text_;
    }

    std::atomic<int> calls{0};

private:
    std::mutex mutex_;
    InjectionResult result_ = InjectionResult::succeeded("mock");
    std::string last_text_;
};

class MockClipboard : public Clipboard {
public:
    bool set_text(const std::string& text) override {
        ++set_calls;
        if (fail.load()) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        text_ = text;
        return true;
    }

    std::string get_text() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

    std::atomic<bool> fail{false};
    std::atomic<int> set_calls{0};

private:
    std::mutex mutex_;
    std::string text_;
};

class MockPermissionManager : public PermissionManager {
public:
    PermissionState microphone_permission() const override { return microphone_.load(); }
    PermissionState accessibility_permission() const override {
        return accessibility.load() ? PermissionState::Granted : PermissionState::Denied;
    }

    void update_microphone_permission(PermissionState state) override {
        if (microphone_.exchange(state) == state) return;
        ChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) callback(Permission::Microphone, state);
    }

    bool has_accessibility_permission() override { return accessibility.load(); }

    void show_permission_guidance(Permission permission) override {
        std::lock_guard<std::mutex> lock(mutex_);
        guidance_.push_back(permission);
    }

    void set_change_callback(ChangeCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    int guidance_count(Permission permission) {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (Permission p : guidance_) {
            if (p == permission) ++count;
        }
        return count;
    }

    std::atomic<bool> accessibility{true};

private:
    std::atomic<PermissionState> microphone_{PermissionState::NotDetermined};
    std::mutex mutex_;
    ChangeCallback callback_;
    std::vector<Permission> guidance_;
};

class MockHotkeyManager : public HotkeyManager {
public:
    Status register_push_to_talk(const std::string& id, const std::string& combo,
                                 Callback on_press, Callback on_release) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!register_status_.ok) return register_status_;
        id_ = id;
        combo_ = combo;
        on_press_ = std::move(on_press);
        on_release_ = std::move(on_release);
        return Status::success();
    }

    void unregister(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id != id_) return;
        id_.clear();
        on_press_ = nullptr;
        on_release_ = nullptr;
        ++unregister_calls;
    }

    bool registered() {
        std::lock_guard<std::mutex> lock(mutex_);
        return !id_.empty();
    }
    std::string combo() {
        std::lock_guard<std::mutex> lock(mutex_);
        return combo_;
    }

    // Simulate the key going down / up
    void press() {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_press_;
        }
        if (callback) callback();
    }
    void release() {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = on_release_;
        }
        if (callback) callback();
    }

    void set_register_status(Status status) {
        std::lock_guard<std::mutex> lock(mutex_);
        register_status_ = std::move(status);
    }

    std::atomic<int> unregister_calls{0};

private:
    std::mutex mutex_;
    Status register_status_;
    std::string id_;
    std::string combo_;
    Callback on_press_;
    Callback on_release_;
};

// Every model counts as downloaded unless marked missing
class FakeModelManager : public ModelManager {
public:
    FakeModelManager() : ModelManager("mock-models") {}

    bool is_model_downloaded(const std::string& model_id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return missing_.count(model_id) == 0;
    }

    void mark_missing(const std::string& model_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_.insert(model_id);
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> missing_;
};

// Short timings so the tests run in well under a second each
inline Config test_config() {
    Config config;
    config.error_reset_ms = 200;
    config.success_reset_ms = 100;
    config.health_check_ms = 60000;
    config.progress_tick_ms = 10;
    config.device_poll_ms = 20;
    return config;
}

// Orchestrator wired to mocks. The raw pointers stay valid for the
// orchestrator's lifetime.
struct Harness {
    MockAudioCapture* audio = nullptr;
    MockTranscriber* transcriber = nullptr;
    MockTextInjector* injector = nullptr;
    MockClipboard* clipboard = nullptr;
    MockPermissionManager* permissions = nullptr;
    MockHotkeyManager* hotkeys = nullptr;
    FakeModelManager* models = nullptr;
    PreferenceStore* preferences = nullptr;

    std::mutex factory_mutex;
    std::vector<int> factory_frames;
    MockAudioCapture* rebuilt_audio = nullptr;

    std::unique_ptr<Orchestrator> orchestrator;

    explicit Harness(const Config& config = test_config()) {
        Collaborators collaborators;

        auto audio_ptr = std::make_unique<MockAudioCapture>();
        audio = audio_ptr.get();
        collaborators.audio = std::move(audio_ptr);

        auto transcriber_ptr = std::make_unique<MockTranscriber>();
        transcriber = transcriber_ptr.get();
        collaborators.transcriber = std::move(transcriber_ptr);

        auto injector_ptr = std::make_unique<MockTextInjector>();
        injector = injector_ptr.get();
        collaborators.injector = std::move(injector_ptr);

        auto clipboard_ptr = std::make_unique<MockClipboard>();
        clipboard = clipboard_ptr.get();
        collaborators.clipboard = std::move(clipboard_ptr);

        auto permissions_ptr = std::make_unique<MockPermissionManager>();
        permissions = permissions_ptr.get();
        collaborators.permissions = std::move(permissions_ptr);

        auto hotkeys_ptr = std::make_unique<MockHotkeyManager>();
        hotkeys = hotkeys_ptr.get();
        collaborators.hotkeys = std::move(hotkeys_ptr);

        auto models_ptr = std::make_unique<FakeModelManager>();
        models = models_ptr.get();
        collaborators.models = std::move(models_ptr);

        auto preferences_ptr = std::make_unique<PreferenceStore>();
        preferences = preferences_ptr.get();
        collaborators.preferences = std::move(preferences_ptr);

        collaborators.audio_factory = [this](int frames_per_buffer) -> std::unique_ptr<AudioCapture> {
            auto rebuilt = std::make_unique<MockAudioCapture>();
            std::lock_guard<std::mutex> lock(factory_mutex);
            factory_frames.push_back(frames_per_buffer);
            rebuilt_audio = rebuilt.get();
            return rebuilt;
        };

        orchestrator = std::make_unique<Orchestrator>(config, std::move(collaborators));
    }

    ~Harness() {
        orchestrator.reset();
    }

    RecordingPhase phase() const {
        return orchestrator->recording_state().get().phase;
    }

    bool wait_for_phase(RecordingPhase phase, int timeout_ms = 2000) const {
        return wait_until([this, phase]() { return this->phase() == phase; }, timeout_ms);
    }

    // Initialize and wait for the model and permissions to settle
    bool start_ready() {
        if (!orchestrator->initialize()) return false;
        return wait_until([this]() { return orchestrator->is_ready().get(); });
    }

    // Capture is confirmed once the first progress tick has run
    bool wait_for_capture(int timeout_ms = 2000) const {
        return wait_until([this]() {
            return phase() == RecordingPhase::Recording && orchestrator->recording_progress().get() > 0.0;
        }, timeout_ms);
    }

    bool record_and_stop() {
        orchestrator->start_dictation();
        if (!wait_for_capture()) return false;
        orchestrator->stop_dictation();
        return true;
    }
};

} // namespace testing
} // namespace voicetype
