#include "hotkey_manager.hpp"
#include <iostream>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/input.h>
#include <sys/select.h>

#ifdef HAS_LIBEVDEV
#include <libevdev/libevdev.h>
#endif

namespace voicetype {

static constexpr int MAX_EVENT_DEVICES = 32;

struct KeyboardDevice {
    int fd = -1;
    std::string path;
#ifdef HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
#endif
};

struct LinuxHotkeyState {
    std::vector<KeyboardDevice> keyboards;
};

static LinuxHotkeyState* state_of(void* handle) {
    return static_cast<LinuxHotkeyState*>(handle);
}

static void close_keyboard(KeyboardDevice& keyboard) {
#ifdef HAS_LIBEVDEV
    if (keyboard.dev) {
        libevdev_free(keyboard.dev);
        keyboard.dev = nullptr;
    }
#endif
    if (keyboard.fd >= 0) {
        close(keyboard.fd);
        keyboard.fd = -1;
    }
}

// Devices reporting KEY_A are treated as keyboards
static bool open_keyboard(const std::string& path, KeyboardDevice& keyboard) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) return false;

#ifdef HAS_LIBEVDEV
    struct libevdev* dev = nullptr;
    if (libevdev_new_from_fd(fd, &dev) < 0) {
        close(fd);
        return false;
    }
    if (!libevdev_has_event_type(dev, EV_KEY) || !libevdev_has_event_code(dev, EV_KEY, KEY_A)) {
        libevdev_free(dev);
        close(fd);
        return false;
    }
    keyboard.dev = dev;
#else
    unsigned long key_bits[(KEY_MAX + 8 * sizeof(unsigned long)) / (8 * sizeof(unsigned long))] = {0};
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(key_bits)), key_bits) < 0) {
        close(fd);
        return false;
    }
    const size_t bits_per_word = 8 * sizeof(unsigned long);
    if (!(key_bits[KEY_A / bits_per_word] & (1UL << (KEY_A % bits_per_word)))) {
        close(fd);
        return false;
    }
#endif

    keyboard.fd = fd;
    keyboard.path = path;
    return true;
}

EvdevHotkeyManager::EvdevHotkeyManager() = default;

EvdevHotkeyManager::~EvdevHotkeyManager() {
    stop();
}

Status EvdevHotkeyManager::register_push_to_talk(const std::string& id,
                                                 const std::string& combo,
                                                 Callback on_press,
                                                 Callback on_release) {
    std::vector<uint32_t> keys;
    if (!parse_key_combo(combo, keys)) {
        return Status::failure(DictationError::unknown("Unrecognized hotkey: " + combo));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Binding binding;
        binding.keys = keys;
        binding.on_press = std::move(on_press);
        binding.on_release = std::move(on_release);
        bindings_[id] = std::move(binding);
    }

    if (!start()) {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings_.erase(id);
        return Status::failure(DictationError::accessibility_permission_missing(
            "cannot read keyboards under /dev/input, add your user to the 'input' group"));
    }

    std::cout << "Hotkey '" << id << "' bound to " << combo << std::endl;
    return Status::success();
}

void EvdevHotkeyManager::unregister(const std::string& id) {
    bool empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings_.erase(id);
        empty = bindings_.empty();
    }
    if (empty) stop();
}

bool EvdevHotkeyManager::start() {
    if (running_.load()) return true;

    auto* state = new LinuxHotkeyState();
    for (int i = 0; i < MAX_EVENT_DEVICES; ++i) {
        KeyboardDevice keyboard;
        std::string path = "/dev/input/event" + std::to_string(i);
        if (open_keyboard(path, keyboard)) {
            std::cout << "Using keyboard: " << path << std::endl;
            state->keyboards.push_back(keyboard);
        }
    }

    if (state->keyboards.empty()) {
        std::cerr << "Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        delete state;
        return false;
    }

    platform_handle_ = state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pressed_.clear();
    }
    running_.store(true);

    // Start listener thread
    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void EvdevHotkeyManager::stop() {
    if (running_.load()) {
        running_.store(false);
        if (listener_thread_.joinable()) {
            listener_thread_.join();
        }
    }

    if (platform_handle_) {
        LinuxHotkeyState* state = state_of(platform_handle_);
        for (auto& keyboard : state->keyboards) {
            close_keyboard(keyboard);
        }
        delete state;
        platform_handle_ = nullptr;
    }
}

void EvdevHotkeyManager::run_loop() {
    LinuxHotkeyState* state = state_of(platform_handle_);
    struct input_event ev;

    while (running_.load()) {
        fd_set fds;
        FD_ZERO(&fds);
        int max_fd = -1;
        for (const auto& keyboard : state->keyboards) {
            FD_SET(keyboard.fd, &fds);
            if (keyboard.fd > max_fd) max_fd = keyboard.fd;
        }

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(max_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        for (auto& keyboard : state->keyboards) {
            if (!FD_ISSET(keyboard.fd, &fds)) continue;

#ifdef HAS_LIBEVDEV
            int rc;
            do {
                rc = libevdev_next_event(keyboard.dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
                if (rc == LIBEVDEV_READ_STATUS_SUCCESS && ev.type == EV_KEY) {
                    handle_key(ev.code, ev.value);
                }
            } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);
#else
            while (read(keyboard.fd, &ev, sizeof(ev)) == static_cast<ssize_t>(sizeof(ev))) {
                if (ev.type == EV_KEY) {
                    handle_key(ev.code, ev.value);
                }
            }
#endif
        }
    }
}

void EvdevHotkeyManager::handle_key(uint32_t code, int value) {
    // value: 1 = press, 0 = release, 2 = autorepeat
    if (value == 2) return;

    std::vector<Callback> fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (value == 1) {
            pressed_.insert(code);
        } else {
            pressed_.erase(code);
        }

        for (auto& entry : bindings_) {
            Binding& binding = entry.second;
            bool all_down = true;
            for (uint32_t key : binding.keys) {
                if (!pressed_.count(key)) {
                    all_down = false;
                    break;
                }
            }

            if (all_down && !binding.active) {
                binding.active = true;
                if (binding.on_press) fire.push_back(binding.on_press);
            } else if (!all_down && binding.active) {
                binding.active = false;
                if (binding.on_release) fire.push_back(binding.on_release);
            }
        }
    }

    for (const auto& callback : fire) {
        callback();
    }
}

} // namespace voicetype
