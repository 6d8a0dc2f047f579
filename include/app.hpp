#pragma once

#include "config.hpp"
#include "orchestrator.hpp"
#include "preferences.hpp"

#include <memory>
#include <atomic>
#include <string>

namespace voicetype {

class App {
public:
    App();
    ~App();

    // Build the Linux collaborators and initialize the orchestrator
    bool initialize(const Config& config, const ConfigOverrides& overrides);
    void shutdown();

    // Run the application (blocking)
    int run();

    // Stop the application
    void quit() { should_quit_.store(true); }

    Orchestrator* orchestrator() { return orchestrator_.get(); }

private:
    Config config_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::atomic<bool> should_quit_{false};
};

// Console status line, the Linux stand-in for a tray icon
bool create_status_display(const Orchestrator& orchestrator);
void destroy_status_display();

} // namespace voicetype
