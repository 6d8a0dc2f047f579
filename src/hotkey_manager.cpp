#include "hotkey_manager.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <map>
#include <linux/input-event-codes.h>

#ifdef HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace voicetype {

static std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

// Letters follow the physical rows, not the alphabet
static bool letter_keycode(char c, uint32_t& code) {
    static const char* rows[] = {"qwertyuiop", "asdfghjkl", "zxcvbnm"};
    static const uint32_t starts[] = {KEY_Q, KEY_A, KEY_Z};
    for (int r = 0; r < 3; ++r) {
        const char* pos = std::strchr(rows[r], c);
        if (pos && c != '\0') {
            code = starts[r] + static_cast<uint32_t>(pos - rows[r]);
            return true;
        }
    }
    return false;
}

static bool key_from_name(const std::string& raw, uint32_t& code) {
    std::string name = lowercase(trim(raw));
    if (name.empty()) return false;

    // Numeric keycode
    if (std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        code = static_cast<uint32_t>(std::strtoul(name.c_str(), nullptr, 10));
        return code > 0 && code <= KEY_MAX;
    }

    static const std::map<std::string, uint32_t> aliases = {
        {"ctrl", KEY_LEFTCTRL}, {"control", KEY_LEFTCTRL}, {"rctrl", KEY_RIGHTCTRL},
        {"shift", KEY_LEFTSHIFT}, {"rshift", KEY_RIGHTSHIFT},
        {"alt", KEY_LEFTALT}, {"ralt", KEY_RIGHTALT}, {"altgr", KEY_RIGHTALT},
        {"super", KEY_LEFTMETA}, {"meta", KEY_LEFTMETA}, {"win", KEY_LEFTMETA},
        {"space", KEY_SPACE}, {"tab", KEY_TAB}, {"esc", KEY_ESC}, {"enter", KEY_ENTER},
        {"f11", KEY_F11}, {"f12", KEY_F12},
    };
    auto it = aliases.find(name);
    if (it != aliases.end()) {
        code = it->second;
        return true;
    }

    if (name.size() == 1 && letter_keycode(name[0], code)) return true;

    // F1-F10 are contiguous
    if (name.size() >= 2 && name[0] == 'f' && std::isdigit(static_cast<unsigned char>(name[1]))) {
        int n = std::atoi(name.c_str() + 1);
        if (n >= 1 && n <= 10) {
            code = KEY_F1 + static_cast<uint32_t>(n - 1);
            return true;
        }
    }

#ifdef HAS_LIBEVDEV
    std::string evdev_name = name.compare(0, 4, "key_") == 0 ? name : "key_" + name;
    std::transform(evdev_name.begin(), evdev_name.end(), evdev_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    int evdev_code = libevdev_event_code_from_name(EV_KEY, evdev_name.c_str());
    if (evdev_code >= 0) {
        code = static_cast<uint32_t>(evdev_code);
        return true;
    }
#else
    static const std::map<std::string, uint32_t> names = {
        {"key_leftctrl", KEY_LEFTCTRL}, {"key_rightctrl", KEY_RIGHTCTRL},
        {"key_leftshift", KEY_LEFTSHIFT}, {"key_rightshift", KEY_RIGHTSHIFT},
        {"key_leftalt", KEY_LEFTALT}, {"key_rightalt", KEY_RIGHTALT},
        {"key_leftmeta", KEY_LEFTMETA}, {"key_rightmeta", KEY_RIGHTMETA},
        {"key_capslock", KEY_CAPSLOCK}, {"key_scrolllock", KEY_SCROLLLOCK},
        {"key_pause", KEY_PAUSE}, {"key_insert", KEY_INSERT},
    };
    auto named = names.find(name);
    if (named != names.end()) {
        code = named->second;
        return true;
    }
#endif

    return false;
}

bool parse_key_combo(const std::string& combo, std::vector<uint32_t>& keycodes) {
    keycodes.clear();

    size_t start = 0;
    while (start <= combo.size()) {
        size_t plus = combo.find('+', start);
        std::string part = combo.substr(start, plus == std::string::npos ? std::string::npos : plus - start);

        uint32_t code = 0;
        if (!key_from_name(part, code)) {
            keycodes.clear();
            return false;
        }
        if (std::find(keycodes.begin(), keycodes.end(), code) == keycodes.end()) {
            keycodes.push_back(code);
        }

        if (plus == std::string::npos) break;
        start = plus + 1;
    }

    return !keycodes.empty();
}

// Platform-specific implementations in platform/*/hotkey_*.cpp

} // namespace voicetype
