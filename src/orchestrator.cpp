#include "orchestrator.hpp"
#include <iostream>
#include <algorithm>
#include <exception>
#include <utility>

namespace voicetype {

using Clock = std::chrono::steady_clock;

Orchestrator::Orchestrator(const Config& config, Collaborators collaborators)
    : config_(config)
    , audio_(std::move(collaborators.audio))
    , transcriber_(std::move(collaborators.transcriber))
    , injector_(std::move(collaborators.injector))
    , clipboard_(std::move(collaborators.clipboard))
    , permissions_(std::move(collaborators.permissions))
    , hotkeys_(std::move(collaborators.hotkeys))
    , models_(std::move(collaborators.models))
    , preferences_(std::move(collaborators.preferences))
    , audio_factory_(std::move(collaborators.audio_factory))
    , selected_model_id_(config.model_id.empty() ? DEFAULT_MODEL_ID : config.model_id)
    , language_(config.language)
    , max_recording_(std::chrono::milliseconds(static_cast<int64_t>(config.max_recording_seconds) * 1000)) {
}

Orchestrator::~Orchestrator() {
    shutdown();
}

const char* Orchestrator::operation_name(Operation operation) {
    switch (operation) {
        case Operation::Recording: return "recording";
        case Operation::Transcription: return "transcription";
        case Operation::TextInjection: return "text injection";
        case Operation::ModelLoading: return "model loading";
    }
    return "unknown";
}

bool Orchestrator::initialize() {
    if (initialized_) return true;

    if (!audio_ || !transcriber_ || !injector_ || !clipboard_ || !permissions_ ||
        !hotkeys_ || !models_ || !preferences_) {
        std::cerr << "[Orchestrator] Missing collaborator, cannot initialize" << std::endl;
        return false;
    }

    state_queue_.start();
    work_queue_.start();

    permissions_->set_change_callback([this](Permission permission, PermissionState state) {
        post_state([this, permission, state]() { on_permission_changed(permission, state); });
    });

    post_work([this]() { bind_audio_callbacks(); });

    post_state([this]() {
        post_work([this]() {
            PermissionState microphone = PermissionState::NotDetermined;
            bool accessibility = false;
            std::string device;
            Status probed = guarded("probe permissions", [&]() {
                microphone = audio_->check_microphone_permission();
                if (microphone == PermissionState::NotDetermined) {
                    microphone = audio_->request_microphone_permission()
                        ? PermissionState::Granted : PermissionState::Denied;
                }
                permissions_->update_microphone_permission(microphone);
                accessibility = permissions_->has_accessibility_permission();
                device = audio_->input_device_name();
                return Status::success();
            });
            post_state([this, probed, microphone, accessibility, device]() {
                if (!probed.ok) {
                    error_message_.set(probed.error.description());
                }
                current_audio_device_.set(device);
                has_microphone_permission_.set(microphone == PermissionState::Granted);
                has_accessibility_permission_.set(accessibility);
                update_ready_state();
            });
        });

        do_load_model(selected_model_id_.get(), false);
        register_hotkey();
        schedule_health_check();
    });

    initialized_ = true;
    std::cout << "[Orchestrator] Initialized (model: " << selected_model_id_.get()
              << ", hotkey: " << config_.hotkey << ", " << hotkey_mode_name(config_.hotkey_mode) << ")" << std::endl;
    return true;
}

void Orchestrator::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    state_queue_.stop();
    work_queue_.stop();

    // Both queues are joined, collaborators can be touched from here
    if (hotkey_registered_) {
        hotkeys_->unregister(PUSH_TO_TALK_HOTKEY_ID);
        hotkey_registered_ = false;
    }

    permissions_->set_change_callback(nullptr);

    audio_->set_level_callback(nullptr);
    audio_->set_state_callback(nullptr);
    if (audio_->is_recording()) {
        std::vector<float> discarded = audio_->stop_recording();
        std::cout << "[Orchestrator] Discarded " << discarded.size() << " samples on shutdown" << std::endl;
    }
}

// ---------------------------------------------------------------------------
// Public entry points, all funnelled through the state queue

void Orchestrator::start_dictation() {
    post_state([this]() { do_start_dictation(); });
}

void Orchestrator::stop_dictation() {
    post_state([this]() { do_stop_dictation(); });
}

void Orchestrator::change_model(const std::string& model_id) {
    post_state([this, model_id]() { do_load_model(model_id, true); });
}

void Orchestrator::load_selected_model() {
    post_state([this]() {
        std::string model_id = selected_model_id_.get();
        do_load_model(model_id.empty() ? DEFAULT_MODEL_ID : model_id, true);
    });
}

void Orchestrator::request_permissions() {
    post_state([this]() {
        post_work([this]() {
            PermissionState microphone = PermissionState::NotDetermined;
            bool accessibility = false;
            Status requested = guarded("request permissions", [&]() {
                microphone = audio_->check_microphone_permission();
                if (microphone != PermissionState::Granted &&
                    permissions_->microphone_permission() != PermissionState::Granted) {
                    microphone = audio_->request_microphone_permission()
                        ? PermissionState::Granted : PermissionState::Denied;
                }
                permissions_->update_microphone_permission(microphone);
                accessibility = permissions_->has_accessibility_permission();
                std::cout << "[Orchestrator] Permissions: microphone "
                          << permission_state_name(permissions_->microphone_permission())
                          << ", accessibility "
                          << permission_state_name(permissions_->accessibility_permission()) << std::endl;
                return Status::success();
            });
            post_state([this, requested, microphone, accessibility]() {
                if (!requested.ok) {
                    error_message_.set(requested.error.description());
                    return;
                }
                has_microphone_permission_.set(microphone == PermissionState::Granted);
                has_accessibility_permission_.set(accessibility);
                update_ready_state();
            });
        });
    });
}

void Orchestrator::set_audio_buffer_size(int frames_per_buffer) {
    post_state([this, frames_per_buffer]() {
        if (phase() != RecordingPhase::Idle) {
            error_message_.set("Cannot change audio settings while recording or processing");
            return;
        }
        if (!audio_factory_ || frames_per_buffer <= 0) {
            std::cerr << "[Orchestrator] Cannot rebuild audio capture with " << frames_per_buffer << " frames" << std::endl;
            return;
        }
        config_.frames_per_buffer = frames_per_buffer;

        post_work([this, frames_per_buffer]() {
            std::unique_ptr<AudioCapture> fresh;
            Status built = guarded("rebuild audio capture", [&]() {
                fresh = audio_factory_(frames_per_buffer);
                return fresh ? Status::success()
                             : Status::failure(DictationError::unknown("audio factory returned nothing"));
            });
            if (!built.ok) {
                std::cerr << "[Orchestrator] " << built.error.description() << std::endl;
                return;
            }

            audio_->set_level_callback(nullptr);
            audio_->set_state_callback(nullptr);
            audio_ = std::move(fresh);
            bind_audio_callbacks();
            std::cout << "[Orchestrator] Audio capture rebuilt with " << frames_per_buffer << " frames/buffer" << std::endl;
        });
    });
}

std::string Orchestrator::state_summary() const {
    RecordingState state = recording_state_.get();
    switch (state.phase) {
        case RecordingPhase::Idle:
            return is_ready_.get() ? "Ready to record" : "Preparing...";
        case RecordingPhase::Recording:
            return "Recording... (" + std::to_string(static_cast<int>(recording_progress_.get() * 100)) + "%)";
        case RecordingPhase::Processing:
            return "Processing audio...";
        case RecordingPhase::Success:
            return "Transcription complete";
        case RecordingPhase::Error:
            return "Error: " + state.message;
    }
    return "";
}

// ---------------------------------------------------------------------------
// Executor plumbing

bool Orchestrator::post_state(SerialExecutor::Task task) {
    return state_queue_.post(std::move(task));
}

bool Orchestrator::post_work(SerialExecutor::Task task) {
    return work_queue_.post(std::move(task));
}

SerialExecutor::TimerId Orchestrator::schedule(int64_t delay_ms, SerialExecutor::Task task) {
    return state_queue_.post_delayed(std::chrono::milliseconds(delay_ms), std::move(task));
}

Status Orchestrator::guarded(const char* what, const std::function<Status()>& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] " << what << " threw: " << e.what() << std::endl;
        return Status::failure(DictationError::unknown(std::string(what) + ": " + e.what()));
    }
}

// ---------------------------------------------------------------------------
// State machine

bool Orchestrator::transition_to(const RecordingState& next) {
    RecordingState current = recording_state_.get();
    if (!is_valid_transition(current, next)) {
        std::cout << "[Orchestrator] Rejected transition " << to_string(current)
                  << " -> " << to_string(next) << std::endl;
        return false;
    }

    ++generation_;

    if (current.phase == RecordingPhase::Recording && next.phase != RecordingPhase::Recording) {
        cancel_session_timers();
        audio_level_.set(0.0f);
        recording_progress_.set(0.0);
    }
    if (next.phase == RecordingPhase::Idle) {
        session_ = Session();
    }

    recording_state_.set(next);

    if (next.phase == RecordingPhase::Error) {
        schedule_reset(generation_, config_.error_reset_ms);
    } else if (next.phase == RecordingPhase::Success) {
        schedule_reset(generation_, config_.success_reset_ms);
    }
    return true;
}

// Only fires if nothing has moved the state since it was scheduled
void Orchestrator::schedule_reset(uint64_t generation, int64_t delay_ms) {
    schedule(delay_ms, [this, generation]() {
        if (generation != generation_) return;
        RecordingPhase current = phase();
        if (current == RecordingPhase::Error || current == RecordingPhase::Success) {
            transition_to(RecordingState::idle());
        }
    });
}

void Orchestrator::cancel_session_timers() {
    if (session_.auto_stop_timer) {
        state_queue_.cancel(session_.auto_stop_timer);
        session_.auto_stop_timer = 0;
    }
    if (session_.progress_timer) {
        state_queue_.cancel(session_.progress_timer);
        session_.progress_timer = 0;
    }
}

// ---------------------------------------------------------------------------
// Start / stop

void Orchestrator::do_start_dictation() {
    if (!transition_to(RecordingState::recording())) {
        return;
    }

    error_message_.set("");
    recording_progress_.set(0.0);
    session_ = Session();
    session_.started_at = Clock::now();

    const uint64_t generation = generation_;
    const std::string model_id = selected_model_id_.get();

    post_work([this, generation, model_id]() {
        PermissionState microphone = PermissionState::NotDetermined;
        Status started = guarded("start recording", [&]() {
            microphone = audio_->check_microphone_permission();
            if (microphone == PermissionState::NotDetermined) {
                microphone = audio_->request_microphone_permission()
                    ? PermissionState::Granted : PermissionState::Denied;
            }
            permissions_->update_microphone_permission(microphone);
            if (microphone != PermissionState::Granted) {
                return Status::failure(DictationError::microphone_permission_denied());
            }

            if (!transcriber_->is_model_loaded()) {
                return Status::failure(DictationError::model_not_found(model_id));
            }

            return audio_->start_recording();
        });

        post_state([this, generation, microphone, started]() {
            on_start_checked(generation, microphone, started.ok || started.error.kind != ErrorKind::ModelNotFound, started);
        });
    });
}

void Orchestrator::on_start_checked(uint64_t generation, PermissionState microphone, bool model_loaded, Status capture) {
    has_microphone_permission_.set(microphone == PermissionState::Granted);

    if (generation != generation_ || phase() != RecordingPhase::Recording) {
        // The session this start belonged to is gone
        if (capture.ok) {
            std::cout << "[Orchestrator] Discarding capture from a superseded start" << std::endl;
            post_work([this]() {
                Status stopped = guarded("stop stale recording", [&]() {
                    std::vector<float> discarded = audio_->stop_recording();
                    return Status::success();
                });
                if (!stopped.ok) {
                    std::cerr << "[Orchestrator] " << stopped.error.description() << std::endl;
                }
            });
        }
        return;
    }

    if (!capture.ok) {
        if (!model_loaded) {
            model_loaded_ = false;
            update_ready_state();
            error_message_.set("Please wait for the AI model to load");
            transition_to(RecordingState::error("No model loaded"));
            do_load_model(selected_model_id_.get(), false);
            return;
        }
        handle_error(capture.error, Operation::Recording);
        return;
    }

    session_.capture_active = true;
    session_.started_at = Clock::now();
    error_recovery_attempts_ = 0;
    std::cout << "Recording..." << std::endl;

    if (max_recording_.count() > 0) {
        session_.auto_stop_timer = schedule(max_recording_.count(), [this, generation]() {
            if (generation != generation_ || phase() != RecordingPhase::Recording) return;
            session_.auto_stop_timer = 0;
            std::cout << "Maximum recording duration reached" << std::endl;
            do_stop_dictation();
        });
    }
    schedule_progress_tick(generation);

    // Push-to-talk key was let go before capture was up
    if (session_.stop_requested) {
        do_stop_dictation();
    }
}

void Orchestrator::schedule_progress_tick(uint64_t generation) {
    session_.progress_timer = schedule(config_.progress_tick_ms, [this, generation]() {
        if (generation != generation_ || phase() != RecordingPhase::Recording) return;

        session_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - session_.started_at);
        if (max_recording_.count() > 0) {
            double progress = static_cast<double>(session_.elapsed.count()) / static_cast<double>(max_recording_.count());
            recording_progress_.set(std::min(progress, 1.0));
        }
        schedule_progress_tick(generation);
    });
}

void Orchestrator::do_stop_dictation() {
    if (phase() != RecordingPhase::Recording) return;

    if (!session_.capture_active) {
        std::cout << "[Orchestrator] Stop ignored, capture has not started yet" << std::endl;
        return;
    }

    session_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - session_.started_at);

    if (!transition_to(RecordingState::processing())) {
        return;
    }
    session_.capture_active = false;

    std::cout << "Transcribing " << session_.elapsed.count() << "ms of audio..." << std::endl;

    const uint64_t generation = generation_;
    const std::string language = language_;

    post_work([this, generation, language]() {
        TranscriptionResult result;
        std::vector<float> samples;

        Status stopped = guarded("stop recording", [&]() {
            samples = audio_->stop_recording();
            return Status::success();
        });

        if (!stopped.ok) {
            result.error = stopped.error;
        } else if (samples.empty()) {
            result.error = DictationError::invalid_audio_data();
        } else {
            Status transcribed = guarded("transcribe", [&]() {
                result = transcriber_->transcribe(samples, language);
                return Status::success();
            });
            if (!transcribed.ok) {
                result = TranscriptionResult();
                result.error = transcribed.error;
            }
        }

        post_state([this, generation, result]() { on_transcribed(generation, result); });
    });
}

void Orchestrator::on_transcribed(uint64_t generation, const TranscriptionResult& result) {
    if (generation != generation_ || phase() != RecordingPhase::Processing) return;

    if (!result.success) {
        handle_error(result.error, Operation::Transcription);
        return;
    }

    if (result.confidence < config_.min_confidence) {
        handle_error(DictationError::low_confidence(result.confidence), Operation::Transcription);
        return;
    }

    if (result.text.empty()) {
        handle_error(DictationError::transcription_failed("no speech detected"), Operation::Transcription);
        return;
    }

    session_.transcription = result.text;
    last_transcription_.set(result.text);
    dispatch_injection(generation, result.text);
}

// ---------------------------------------------------------------------------
// Injection

void Orchestrator::dispatch_injection(uint64_t generation, const std::string& text) {
    const bool accessible = has_accessibility_permission_.get();

    post_work([this, generation, text, accessible]() {
        InjectionResult result;
        if (!accessible) {
            result = InjectionResult::failed(InjectionFailure::PermissionDenied, "accessibility permission missing");
        } else {
            Status injected = guarded("inject text", [&]() {
                result = injector_->inject(text);
                return Status::success();
            });
            if (!injected.ok) {
                result = InjectionResult::failed(InjectionFailure::Failed, injected.error.description());
            }
        }

        // Focus and application failures are copied by the recovery policy
        bool copied = false;
        if (!result.success &&
            result.failure != InjectionFailure::NoFocusedElement &&
            result.failure != InjectionFailure::UnsupportedApplication) {
            Status set = guarded("copy to clipboard", [&]() {
                return clipboard_->set_text(text)
                    ? Status::success()
                    : Status::failure(DictationError::unknown("clipboard unavailable"));
            });
            copied = set.ok;
        }

        post_state([this, generation, text, result, copied]() {
            on_injected(generation, text, result, copied);
        });
    });
}

void Orchestrator::on_injected(uint64_t generation, const std::string& text, const InjectionResult& result, bool copied) {
    if (generation != generation_ || phase() != RecordingPhase::Processing) return;

    if (result.success) {
        std::cout << "Inserted transcript via " << result.method << std::endl;
        error_message_.set("");
        transition_to(RecordingState::success());
        return;
    }

    std::cerr << "[Orchestrator] Injection failed: " << result.detail << std::endl;

    std::string message;
    switch (result.failure) {
        case InjectionFailure::NoFocusedElement:
            handle_error(DictationError::no_focused_application(), Operation::TextInjection);
            return;
        case InjectionFailure::UnsupportedApplication:
            handle_error(DictationError::unsupported_application(result.detail), Operation::TextInjection);
            return;
        case InjectionFailure::PermissionDenied:
            message = DictationError::accessibility_permission_missing(result.detail).description() +
                      " Text copied to clipboard.";
            post_work([this]() { permissions_->show_permission_guidance(Permission::Accessibility); });
            break;
        default:
            message = "Text injection failed. Text copied to clipboard instead.";
            break;
    }

    if (!copied) {
        std::cerr << "[Orchestrator] Clipboard fallback failed for " << text.size() << " bytes" << std::endl;
        message = "Text could not be inserted or copied. The last transcription is still available.";
    }

    // The user still has the text
    error_message_.set(message);
    transition_to(RecordingState::success());
}

void Orchestrator::copy_to_clipboard_then_succeed(const std::string& text, const std::string& message) {
    const uint64_t generation = generation_;

    post_work([this, generation, text, message]() {
        bool copied = false;
        if (!text.empty()) {
            Status set = guarded("copy to clipboard", [&]() {
                return clipboard_->set_text(text)
                    ? Status::success()
                    : Status::failure(DictationError::unknown("clipboard unavailable"));
            });
            copied = set.ok;
        }

        post_state([this, generation, message, copied]() {
            if (generation != generation_) return;
            error_message_.set(copied ? message
                                      : "Text could not be inserted or copied. The last transcription is still available.");
            transition_to(RecordingState::success());
        });
    });
}

// ---------------------------------------------------------------------------
// Recovery policy

void Orchestrator::handle_error(const DictationError& error, Operation operation) {
    ++error_recovery_attempts_;

    std::ostream& log = error.is_non_fatal() ? std::cout : std::cerr;
    log << "[Orchestrator] Error during " << operation_name(operation) << ": "
        << error_kind_name(error.kind) << " - " << error.description() << std::endl;

    switch (error.kind) {
        case ErrorKind::MicrophonePermissionDenied:
            error_message_.set(error.description());
            transition_to(RecordingState::error("Microphone permission required"));
            post_work([this]() { permissions_->show_permission_guidance(Permission::Microphone); });
            break;

        case ErrorKind::AccessibilityPermissionMissing:
            // Text still reaches the user through the clipboard
            error_message_.set(error.description());
            post_work([this]() { permissions_->show_permission_guidance(Permission::Accessibility); });
            break;

        case ErrorKind::AudioDeviceDisconnected:
            error_message_.set("Your audio device was disconnected. Please reconnect and try again.");
            transition_to(RecordingState::error("Audio device disconnected"));
            start_device_watch();
            break;

        case ErrorKind::ModelNotFound:
        case ErrorKind::ModelLoadingFailed:
            error_message_.set(error.description());
            transition_to(RecordingState::error("Model loading failed"));
            if (selected_model_id_.get() != DEFAULT_MODEL_ID &&
                error_recovery_attempts_ < config_.max_recovery_attempts) {
                std::cout << "[Orchestrator] Falling back to model " << DEFAULT_MODEL_ID
                          << " (attempt " << error_recovery_attempts_ << ")" << std::endl;
                do_load_model(DEFAULT_MODEL_ID, false);
            }
            break;

        case ErrorKind::NoFocusedApplication:
        case ErrorKind::UnsupportedApplication:
            copy_to_clipboard_then_succeed(session_.transcription,
                                           "Text copied to clipboard. Press Ctrl+V to paste.");
            break;

        case ErrorKind::NetworkUnavailable:
            error_message_.set(error.recovery_suggestion());
            transition_to(RecordingState::error("Network unavailable"));
            break;

        default: {
            std::string suggestion = error.recovery_suggestion();
            error_message_.set(suggestion.empty() ? error.description() : suggestion);
            transition_to(RecordingState::error(error.description()));
            break;
        }
    }
}

// ---------------------------------------------------------------------------
// Model loading

void Orchestrator::do_load_model(const std::string& model_id, bool user_initiated) {
    RecordingPhase current = phase();
    bool busy = user_initiated
        ? current != RecordingPhase::Idle
        : (current == RecordingPhase::Recording || current == RecordingPhase::Processing);
    if (busy) {
        error_message_.set("Cannot change model while recording or processing");
        return;
    }

    if (is_loading_model_.get()) {
        std::cout << "[Orchestrator] Model load already in progress, ignoring " << model_id << std::endl;
        if (user_initiated) {
            error_message_.set("Another model is still loading, try again shortly");
        }
        return;
    }

    selected_model_id_.set(model_id);
    is_loading_model_.set(true);
    model_loading_progress_.set(0.0);
    model_loading_status_.set("Loading model " + model_id + "...");

    post_work([this, model_id]() {
        if (!preferences_->set(pref::SELECTED_MODEL_ID, model_id)) {
            std::cerr << "[Orchestrator] Could not save selected model" << std::endl;
        }

        bool downloaded = models_->is_model_downloaded(model_id);
        if (!downloaded) {
            std::string path = models_->model_path(model_id);
            post_state([this, model_id, path]() {
                finish_model_loading();
                model_loading_status_.set("Model needs to be downloaded");
                error_message_.set("Model " + model_id + " needs to be downloaded first. Expected at " + path);
                selected_model_downloaded_ = false;
                update_ready_state();
            });
            return;
        }

        post_state([this]() { model_loading_progress_.set(0.3); });

        Status loaded = guarded("load model", [&]() {
            return transcriber_->load_model(model_id);
        });
        post_state([this, model_id, loaded]() { on_model_loaded(model_id, loaded); });
    });
}

void Orchestrator::on_model_loaded(const std::string& model_id, const Status& status) {
    finish_model_loading();
    selected_model_downloaded_ = true;

    if (!status.ok) {
        DictationError error = status.error;
        if (error.kind != ErrorKind::ModelNotFound && error.kind != ErrorKind::ModelLoadingFailed) {
            error = DictationError::model_loading_failed(model_id, error.description());
        }
        handle_error(error, Operation::ModelLoading);
        return;
    }

    std::cout << "[Orchestrator] Model " << model_id << " loaded" << std::endl;
    model_loaded_ = true;
    model_loading_progress_.set(1.0);
    model_loading_status_.set("Model loaded successfully");
    error_message_.set("");
    update_ready_state();
}

void Orchestrator::finish_model_loading() {
    is_loading_model_.set(false);
    model_loading_progress_.set(0.0);
    model_loading_status_.set("");
}

// ---------------------------------------------------------------------------
// Hotkey

void Orchestrator::register_hotkey() {
    const std::string combo = config_.hotkey;

    post_work([this, combo]() {
        Status registered = guarded("register hotkey", [&]() {
            return hotkeys_->register_push_to_talk(
                PUSH_TO_TALK_HOTKEY_ID, combo,
                [this]() { post_state([this]() { on_hotkey_press(); }); },
                [this]() { post_state([this]() { on_hotkey_release(); }); });
        });

        post_state([this, registered]() {
            hotkey_registered_ = registered.ok;
            if (registered.ok) return;

            error_message_.set("Failed to register hotkey: " + registered.error.description());
            if (registered.error.kind == ErrorKind::AccessibilityPermissionMissing) {
                post_work([this]() { permissions_->show_permission_guidance(Permission::Accessibility); });
            }
        });
    });
}

void Orchestrator::on_hotkey_press() {
    switch (phase()) {
        case RecordingPhase::Idle:
        case RecordingPhase::Success:   // immediate re-trigger
        case RecordingPhase::Error:     // retry
            do_start_dictation();
            break;
        case RecordingPhase::Recording:
            if (config_.hotkey_mode == HotkeyMode::Toggle) {
                if (session_.capture_active) {
                    do_stop_dictation();
                } else {
                    session_.stop_requested = true;
                }
            }
            break;
        case RecordingPhase::Processing:
            break;
    }
}

void Orchestrator::on_hotkey_release() {
    if (config_.hotkey_mode != HotkeyMode::PushToTalk) return;

    switch (phase()) {
        case RecordingPhase::Recording:
            if (session_.capture_active) {
                do_stop_dictation();
            } else {
                session_.stop_requested = true;
            }
            break;
        case RecordingPhase::Processing:
            std::cout << "[Orchestrator] Release while processing, dropped" << std::endl;
            break;
        default:
            break;
    }
}

// ---------------------------------------------------------------------------
// Collaborator signals

void Orchestrator::bind_audio_callbacks() {
    audio_->set_level_callback([this](float level) {
        post_state([this, level]() { on_audio_level(level); });
    });
    audio_->set_state_callback([this](CaptureState state, const DictationError& error) {
        post_state([this, state, error]() { on_capture_state(state, error); });
    });
}

void Orchestrator::on_audio_level(float level) {
    if (phase() != RecordingPhase::Recording || !session_.capture_active) return;
    audio_level_.set(level);
}

void Orchestrator::on_capture_state(CaptureState state, const DictationError& error) {
    if (phase() != RecordingPhase::Recording || !session_.capture_active) return;

    switch (state) {
        case CaptureState::Error:
            session_.capture_active = false;
            post_work([this]() {
                Status stopped = guarded("stop failed recording", [&]() {
                    std::vector<float> discarded = audio_->stop_recording();
                    return Status::success();
                });
                if (!stopped.ok) {
                    std::cerr << "[Orchestrator] " << stopped.error.description() << std::endl;
                }
            });
            handle_error(error.kind == ErrorKind::Unknown && error.detail.empty()
                             ? DictationError::audio_device_disconnected() : error,
                         Operation::Recording);
            break;
        case CaptureState::Idle:
            std::cerr << "[Orchestrator] Capture stopped outside the workflow" << std::endl;
            transition_to(RecordingState::idle());
            break;
        default:
            break;
    }
}

void Orchestrator::on_permission_changed(Permission permission, PermissionState state) {
    bool granted = state == PermissionState::Granted;
    if (permission == Permission::Microphone) {
        has_microphone_permission_.set(granted);
    } else {
        has_accessibility_permission_.set(granted);
    }
    update_ready_state();
}

void Orchestrator::update_ready_state() {
    is_ready_.set(has_microphone_permission_.get() && model_loaded_ && selected_model_downloaded_);
}

// ---------------------------------------------------------------------------
// Health monitoring

void Orchestrator::schedule_health_check() {
    schedule(config_.health_check_ms, [this]() {
        run_health_check();
        schedule_health_check();
    });
}

void Orchestrator::run_health_check() {
    const bool believes_recording = phase() == RecordingPhase::Recording;
    const std::string selected = selected_model_id_.get();

    post_work([this, believes_recording, selected]() {
        HealthReport report;
        Status checked = guarded("health check", [&]() {
            report.capture_running = audio_->is_recording();
            if (report.capture_running && !believes_recording) {
                std::vector<float> discarded = audio_->stop_recording();
                report.stopped_stray_capture = true;
            }
            report.model_loaded = transcriber_->is_model_loaded();
            report.model_id = selected;
            report.model_downloaded = models_->is_model_downloaded(selected);
            report.microphone = audio_->check_microphone_permission();
            permissions_->update_microphone_permission(report.microphone);
            report.accessibility = permissions_->has_accessibility_permission();
            return Status::success();
        });

        if (!checked.ok) {
            std::cerr << "[Orchestrator] Health check failed: " << checked.error.description() << std::endl;
            return;
        }
        post_state([this, report]() { on_health_report(report); });
    });
}

void Orchestrator::on_health_report(const HealthReport& report) {
    if (report.stopped_stray_capture) {
        std::cerr << "[Orchestrator] Stopped capture that was running outside a session" << std::endl;
    }

    has_microphone_permission_.set(report.microphone == PermissionState::Granted);
    has_accessibility_permission_.set(report.accessibility);

    model_loaded_ = report.model_loaded;
    if (report.model_id == selected_model_id_.get()) {
        selected_model_downloaded_ = report.model_downloaded;
    }
    if (!report.model_loaded && is_ready_.get()) {
        std::cerr << "[Orchestrator] Model unloaded unexpectedly, reloading" << std::endl;
        is_ready_.set(false);
        do_load_model(selected_model_id_.get(), false);
    }
    update_ready_state();
}

// ---------------------------------------------------------------------------
// Device reconnection

void Orchestrator::start_device_watch() {
    if (device_watch_active_) return;
    device_watch_active_ = true;
    current_audio_device_.set("");
    schedule(config_.device_poll_ms, [this]() { poll_device(); });
}

void Orchestrator::poll_device() {
    post_work([this]() {
        bool present = false;
        std::string name;
        Status polled = guarded("poll audio device", [&]() {
            present = audio_->has_input_device();
            if (present) name = audio_->input_device_name();
            return Status::success();
        });
        if (!polled.ok) present = false;

        post_state([this, present, name]() {
            if (!present) {
                schedule(config_.device_poll_ms, [this]() { poll_device(); });
                return;
            }

            device_watch_active_ = false;
            current_audio_device_.set(name);
            std::cout << "[Orchestrator] Audio device available: " << name << std::endl;
            if (phase() == RecordingPhase::Error) {
                error_message_.set("Audio device reconnected. Ready to record.");
                transition_to(RecordingState::idle());
            }
        });
    });
}

} // namespace voicetype
