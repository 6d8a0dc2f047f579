#pragma once

#include "errors.hpp"

#include <functional>
#include <atomic>
#include <thread>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

namespace voicetype {

class HotkeyManager {
public:
    using Callback = std::function<void()>;

    virtual ~HotkeyManager() = default;

    // Binds a global key combination. on_press fires when the whole combo is
    // down, on_release when any key of it goes up again.
    virtual Status register_push_to_talk(const std::string& id,
                                         const std::string& combo,
                                         Callback on_press,
                                         Callback on_release) = 0;

    virtual void unregister(const std::string& id) = 0;
};

// "ctrl+shift+v", "KEY_RIGHTALT", "100" -> evdev key codes.
// Returns false if any part is not a known key.
bool parse_key_combo(const std::string& combo, std::vector<uint32_t>& keycodes);

// Reads keyboards under /dev/input directly, so it works without a display
// server but needs read access to the devices (the 'input' group).
class EvdevHotkeyManager : public HotkeyManager {
public:
    EvdevHotkeyManager();
    ~EvdevHotkeyManager() override;

    Status register_push_to_talk(const std::string& id,
                                 const std::string& combo,
                                 Callback on_press,
                                 Callback on_release) override;
    void unregister(const std::string& id) override;

private:
    struct Binding {
        std::vector<uint32_t> keys;
        Callback on_press;
        Callback on_release;
        bool active = false;
    };

    bool start();
    void stop();
    void run_loop();
    void handle_key(uint32_t code, int value);

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    std::mutex mutex_;
    std::map<std::string, Binding> bindings_;
    std::set<uint32_t> pressed_;

    // Platform-specific handle
    void* platform_handle_ = nullptr;
};

} // namespace voicetype
