#include "app.hpp"
#include "config.hpp"
#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <vector>

static voicetype::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -M, --model ID        Model id: tiny, base, small, medium, ... (default: tiny)\n"
              << "  -m, --model-dir DIR   Directory containing ggml-<id>.bin models (default: models)\n"
              << "  -t, --threads N       Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG   Language code, or 'auto' to detect (default: en)\n"
              << "  -k, --hotkey COMBO    Hotkey, e.g. KEY_RIGHTALT or ctrl+shift+space (default: KEY_RIGHTALT)\n"
              << "  --toggle              Press once to start, again to stop (default: hold to talk)\n"
              << "  --max-seconds N       Stop recording automatically after N seconds (default: 30)\n"
              << "  --buffer-frames N     Audio frames per buffer (default: 512)\n"
              << "  --preferences FILE    Preferences file (default: ~/.voicetype/preferences)\n"
              << "  -h, --help            Show this help\n"
              << "\nHotkey:\n"
              << "  Keys are read from /dev/input, so your user needs to be in the 'input' group.\n"
              << "\nFirst run:\n"
              << "  Download a model with:\n"
              << "    curl -L -o models/ggml-tiny.bin \\\n"
              << "      https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-tiny.bin\n"
              << std::endl;
}

static bool parse_positive(const char* text, int& value) {
    char* end = nullptr;
    long parsed = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || parsed <= 0) return false;
    value = static_cast<int>(parsed);
    return true;
}

int main(int argc, char* argv[]) {
    voicetype::Config config;
    voicetype::ConfigOverrides overrides;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-M") == 0 || strcmp(argv[i], "--model") == 0) && i + 1 < argc) {
            config.model_id = argv[++i];
            overrides.model_id = true;
        }
        else if ((strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) && i + 1 < argc) {
            config.model_dir = argv[++i];
        }
        else if ((strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) && i + 1 < argc) {
            if (!parse_positive(argv[++i], config.n_threads)) {
                std::cerr << "Invalid thread count: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if ((strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) && i + 1 < argc) {
            config.language = argv[++i];
            overrides.language = true;
        }
        else if ((strcmp(argv[i], "-k") == 0 || strcmp(argv[i], "--hotkey") == 0) && i + 1 < argc) {
            config.hotkey = argv[++i];
            overrides.hotkey = true;
        }
        else if (strcmp(argv[i], "--toggle") == 0) {
            config.hotkey_mode = voicetype::HotkeyMode::Toggle;
        }
        else if (strcmp(argv[i], "--max-seconds") == 0 && i + 1 < argc) {
            if (!parse_positive(argv[++i], config.max_recording_seconds)) {
                std::cerr << "Invalid duration: " << argv[i] << std::endl;
                return 1;
            }
            overrides.max_recording_seconds = true;
        }
        else if (strcmp(argv[i], "--buffer-frames") == 0 && i + 1 < argc) {
            if (!parse_positive(argv[++i], config.frames_per_buffer)) {
                std::cerr << "Invalid buffer size: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (strcmp(argv[i], "--preferences") == 0 && i + 1 < argc) {
            config.preferences_path = argv[++i];
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::vector<uint32_t> keycodes;
    if (overrides.hotkey && !voicetype::parse_key_combo(config.hotkey, keycodes)) {
        std::cerr << "Unknown hotkey: " << config.hotkey << std::endl;
        return 1;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    voicetype::App app;
    g_app = &app;

    std::cout << "VoiceType - Voice to Text\n" << std::endl;
    std::cout << "Model directory: " << config.model_dir << std::endl;
    std::cout << "Threads: " << config.n_threads << std::endl;
    std::cout << "Hotkey mode: " << voicetype::hotkey_mode_name(config.hotkey_mode) << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config, overrides)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    std::cout << "\nShutting down..." << std::endl;
    app.shutdown();
    g_app = nullptr;
    return result;
}
