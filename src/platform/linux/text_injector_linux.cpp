#include "x11_text_injector.hpp"
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>

#include <X11/Xlib.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace voicetype {

using DisplayPtr = std::unique_ptr<Display, decltype(&XCloseDisplay)>;

static DisplayPtr open_display() {
    return DisplayPtr(XOpenDisplay(nullptr), XCloseDisplay);
}

static void send_key(Display* display, KeyCode keycode, bool shift) {
    KeyCode shift_keycode = XKeysymToKeycode(display, XK_Shift_L);

    if (shift) XTestFakeKeyEvent(display, shift_keycode, True, 0);
    XTestFakeKeyEvent(display, keycode, True, 0);
    XTestFakeKeyEvent(display, keycode, False, 0);
    if (shift) XTestFakeKeyEvent(display, shift_keycode, False, 0);
    XFlush(display);
}

static InjectionResult paste_from_clipboard(Display* display, Clipboard& clipboard, const std::string& text) {
    if (!clipboard.set_text(text)) {
        return InjectionResult::failed(InjectionFailure::Failed, "clipboard unavailable");
    }

    // Delay to ensure clipboard is fully set before pasting
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // Simulate Ctrl+V
    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);
    if (ctrl_keycode == 0 || v_keycode == 0) {
        return InjectionResult::failed(InjectionFailure::Failed, "no keycode for Ctrl+V");
    }

    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, False, 0);
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    return InjectionResult::succeeded(X11TextInjector::strategy_name(X11TextInjector::Strategy::ClipboardPaste));
}

static InjectionResult type_keys(Display* display, const std::string& text) {
    // Resolve every key first so a partial string is never typed
    struct Key {
        KeyCode keycode;
        bool shift;
    };
    std::vector<Key> keys;
    keys.reserve(text.size());

    for (unsigned char c : text) {
        KeySym sym;
        if (c == '\n') {
            sym = XK_Return;
        } else if (c == '\t') {
            sym = XK_Tab;
        } else if (c >= 0x20 && c < 0x7f) {
            sym = static_cast<KeySym>(c);
        } else {
            return InjectionResult::failed(InjectionFailure::Failed, "text contains characters that cannot be typed");
        }

        KeyCode keycode = XKeysymToKeycode(display, sym);
        if (keycode == 0) {
            return InjectionResult::failed(InjectionFailure::Failed, "no keycode for character");
        }

        bool shift;
        if (XkbKeycodeToKeysym(display, keycode, 0, 0) == sym) {
            shift = false;
        } else if (XkbKeycodeToKeysym(display, keycode, 0, 1) == sym) {
            shift = true;
        } else {
            return InjectionResult::failed(InjectionFailure::Failed, "character not on the current layout");
        }
        keys.push_back({keycode, shift});
    }

    for (const auto& key : keys) {
        send_key(display, key.keycode, key.shift);
    }

    return InjectionResult::succeeded(X11TextInjector::strategy_name(X11TextInjector::Strategy::TypeKeys));
}

X11TextInjector::X11TextInjector(Clipboard& clipboard)
    : clipboard_(clipboard)
    , strategies_{Strategy::ClipboardPaste, Strategy::TypeKeys} {
}

const char* X11TextInjector::strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::ClipboardPaste: return "clipboard-paste";
        case Strategy::TypeKeys: return "xtest-type";
    }
    return "unknown";
}

InjectionResult X11TextInjector::inject(const std::string& text) {
    if (text.empty()) {
        return InjectionResult::failed(InjectionFailure::Failed, "nothing to insert");
    }

    DisplayPtr display = open_display();
    if (!display) {
        return InjectionResult::failed(InjectionFailure::PermissionDenied, "cannot open X display");
    }

    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(display.get(), &event_base, &error_base, &major, &minor)) {
        return InjectionResult::failed(InjectionFailure::PermissionDenied, "XTest extension not available");
    }

    Window focus = None;
    int revert_to = 0;
    XGetInputFocus(display.get(), &focus, &revert_to);
    if (focus == None || focus == DefaultRootWindow(display.get())) {
        return InjectionResult::failed(InjectionFailure::NoFocusedElement, "no window has input focus");
    }

    InjectionResult last = InjectionResult::failed(InjectionFailure::Failed, "no injection strategy configured");
    for (Strategy strategy : strategies_) {
        switch (strategy) {
            case Strategy::ClipboardPaste:
                last = paste_from_clipboard(display.get(), clipboard_, text);
                break;
            case Strategy::TypeKeys:
                last = type_keys(display.get(), text);
                break;
        }

        if (last.success) {
            std::cout << "Inserted " << text.size() << " bytes via " << last.method << std::endl;
            return last;
        }
        std::cerr << "Injection via " << strategy_name(strategy) << " failed: " << last.detail << std::endl;
    }

    return last;
}

} // namespace voicetype
