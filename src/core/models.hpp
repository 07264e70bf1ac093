#ifndef CORE_MODELS_HPP
#define CORE_MODELS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

struct CameraSpec {
    std::string name;
    int input_pin = -1;
    std::optional<int> led_pin;
    int timeout_minutes = 60;
    bool enabled = true;
};

struct GlobalSettings {
    double debounce_seconds = 0.3;
    double polling_interval_seconds = 0.1;
    int startup_delay_seconds = 5;
    std::string state_file_template = "/opt/unifi-camera-privacy/privacy_state_{camera}.json";
    std::string gpio_chip = "gpiochip0";
    double shutdown_grace_seconds = 5.0;
    int timeout_retry_seconds = 30;
    std::string remote_command;
    int remote_command_timeout_seconds = 10;
};

struct DaemonConfig {
    std::vector<CameraSpec> cameras;
    GlobalSettings settings;

    std::vector<CameraSpec> enabled_cameras() const;
};

// enabled_at is set iff privacy_enabled.
struct PrivacyState {
    std::string camera_name;
    bool privacy_enabled = false;
    std::optional<TimePoint> enabled_at;
};

inline bool operator==(const PrivacyState& a, const PrivacyState& b) {
    return a.camera_name == b.camera_name && a.privacy_enabled == b.privacy_enabled &&
           a.enabled_at == b.enabled_at;
}

inline bool privacy_state_consistent(const PrivacyState& state) {
    return state.privacy_enabled == state.enabled_at.has_value();
}

inline std::vector<CameraSpec> DaemonConfig::enabled_cameras() const {
    std::vector<CameraSpec> result;
    for (const auto& camera : cameras) {
        if (camera.enabled) {
            result.push_back(camera);
        }
    }
    return result;
}

#endif
