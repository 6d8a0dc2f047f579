#include "permission_manager.hpp"

namespace voicetype {

const char* permission_name(Permission permission) {
    switch (permission) {
        case Permission::Microphone: return "microphone";
        case Permission::Accessibility: return "accessibility";
    }
    return "unknown";
}

const char* permission_state_name(PermissionState state) {
    switch (state) {
        case PermissionState::NotDetermined: return "not determined";
        case PermissionState::Granted: return "granted";
        case PermissionState::Denied: return "denied";
    }
    return "unknown";
}

} // namespace voicetype
