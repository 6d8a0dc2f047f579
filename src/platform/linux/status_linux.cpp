#include "app.hpp"
#include <iostream>
#include <mutex>

// Linux status display - console output, no GUI dependencies

namespace voicetype {

static std::mutex g_status_mutex;
static const Orchestrator* g_orchestrator = nullptr;
static Observable<RecordingState>::SubscriptionId g_state_subscription = 0;
static Observable<std::string>::SubscriptionId g_error_subscription = 0;
static Observable<bool>::SubscriptionId g_ready_subscription = 0;
static Observable<std::string>::SubscriptionId g_model_subscription = 0;

static void print_status(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_status_mutex);
    std::cout << "[VoiceType] " << line << std::endl;
}

bool create_status_display(const Orchestrator& orchestrator) {
    destroy_status_display();
    g_orchestrator = &orchestrator;

    g_state_subscription = orchestrator.recording_state().subscribe([](const RecordingState& state) {
        (void)state;
        if (g_orchestrator) print_status(g_orchestrator->state_summary());
    });

    g_error_subscription = orchestrator.error_message().subscribe([](const std::string& message) {
        if (!message.empty()) print_status(message);
    });

    g_ready_subscription = orchestrator.is_ready().subscribe([](bool ready) {
        print_status(ready ? "Ready to record" : "Not ready");
    });

    g_model_subscription = orchestrator.model_loading_status().subscribe([](const std::string& status) {
        if (!status.empty()) print_status(status);
    });

    return true;
}

void destroy_status_display() {
    if (!g_orchestrator) return;

    g_orchestrator->recording_state().unsubscribe(g_state_subscription);
    g_orchestrator->error_message().unsubscribe(g_error_subscription);
    g_orchestrator->is_ready().unsubscribe(g_ready_subscription);
    g_orchestrator->model_loading_status().unsubscribe(g_model_subscription);
    g_orchestrator = nullptr;
}

} // namespace voicetype
