#pragma once

#include <atomic>
#include <functional>
#include <mutex>

namespace voicetype {

enum class Permission {
    Microphone,
    Accessibility
};

enum class PermissionState {
    NotDetermined,
    Granted,
    Denied
};

const char* permission_name(Permission permission);
const char* permission_state_name(PermissionState state);

class PermissionManager {
public:
    using ChangeCallback = std::function<void(Permission, PermissionState)>;

    virtual ~PermissionManager() = default;

    // Last known states
    virtual PermissionState microphone_permission() const = 0;
    virtual PermissionState accessibility_permission() const = 0;

    // Record the result of a microphone probe made by the audio collaborator
    virtual void update_microphone_permission(PermissionState state) = 0;

    // Probes and records accessibility state
    virtual bool has_accessibility_permission() = 0;

    // Explains to the user how to grant the permission
    virtual void show_permission_guidance(Permission permission) = 0;

    virtual void set_change_callback(ChangeCallback callback) = 0;
};

// Linux: "accessibility" means an X display with the XTest extension,
// since that is what text injection needs.
class LinuxPermissionManager : public PermissionManager {
public:
    LinuxPermissionManager() = default;

    PermissionState microphone_permission() const override { return microphone_.load(); }
    PermissionState accessibility_permission() const override { return accessibility_.load(); }

    void update_microphone_permission(PermissionState state) override;
    bool has_accessibility_permission() override;
    void show_permission_guidance(Permission permission) override;
    void set_change_callback(ChangeCallback callback) override;

private:
    void notify(Permission permission, PermissionState state);

    std::atomic<PermissionState> microphone_{PermissionState::NotDetermined};
    std::atomic<PermissionState> accessibility_{PermissionState::NotDetermined};

    std::mutex callback_mutex_;
    ChangeCallback callback_;
};

} // namespace voicetype
