#include "permission_manager.hpp"
#include <iostream>
#include <memory>
#include <utility>

#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>

namespace voicetype {

void LinuxPermissionManager::update_microphone_permission(PermissionState state) {
    if (microphone_.exchange(state) != state) {
        notify(Permission::Microphone, state);
    }
}

bool LinuxPermissionManager::has_accessibility_permission() {
    std::unique_ptr<Display, decltype(&XCloseDisplay)> display(XOpenDisplay(nullptr), XCloseDisplay);

    bool granted = false;
    if (display) {
        int event_base, error_base, major, minor;
        granted = XTestQueryExtension(display.get(), &event_base, &error_base, &major, &minor);
    }

    PermissionState state = granted ? PermissionState::Granted : PermissionState::Denied;
    if (accessibility_.exchange(state) != state) {
        notify(Permission::Accessibility, state);
    }
    return granted;
}

void LinuxPermissionManager::show_permission_guidance(Permission permission) {
    switch (permission) {
        case Permission::Microphone:
            std::cerr << "Microphone access denied.\n"
                      << "  Check that an input device is connected and that your user\n"
                      << "  can open it (e.g. 'sudo usermod -aG audio $USER', then log in again)."
                      << std::endl;
            break;
        case Permission::Accessibility:
            std::cerr << "Text insertion unavailable.\n"
                      << "  An X11 session with the XTest extension is required. Under Wayland,\n"
                      << "  transcripts are copied to the clipboard instead."
                      << std::endl;
            break;
    }
}

void LinuxPermissionManager::set_change_callback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void LinuxPermissionManager::notify(Permission permission, PermissionState state) {
    std::cout << "Permission " << permission_name(permission) << ": " << permission_state_name(state) << std::endl;

    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = callback_;
    }
    if (callback) callback(permission, state);
}

} // namespace voicetype
