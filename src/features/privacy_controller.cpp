#include "features/privacy_controller.hpp"

#include "core/errors.hpp"

#include <glib.h>

#include <map>
#include <utility>

PrivacyController::PrivacyController(DaemonConfig config, GpioBackend& gpio, RemoteControl& remote,
                                     TransitionRunner& runner, StateStore& store, const Clock& clock)
    : m_config(std::move(config)),
      m_gpio(gpio),
      m_remote(remote),
      m_runner(runner),
      m_store(store),
      m_clock(clock) {}

PrivacyController::~PrivacyController() {
    shutdown();
}

PrivacyController::CameraChannel* PrivacyController::find_channel(const std::string& name) {
    for (auto& channel : m_channels) {
        if (channel->spec.name == name) {
            return channel.get();
        }
    }
    return nullptr;
}

const PrivacyController::CameraChannel* PrivacyController::find_channel(const std::string& name) const {
    for (const auto& channel : m_channels) {
        if (channel->spec.name == name) {
            return channel.get();
        }
    }
    return nullptr;
}

std::vector<CameraSpec> PrivacyController::cameras_known_to_remote() {
    std::optional<std::vector<RemoteCamera>> remote_cameras = m_remote.list_cameras();
    if (!remote_cameras) {
        throw RemoteUnavailableError("Could not enumerate cameras from the camera-control service");
    }
    g_message("Camera-control service reports %zu camera(s)", remote_cameras->size());

    std::vector<CameraSpec> known;
    for (const auto& spec : m_config.enabled_cameras()) {
        if (!find_remote_camera(*remote_cameras, spec.name)) {
            g_warning("[%s] Camera not found on the camera-control service, skipping", spec.name.c_str());
            for (const auto& remote_camera : *remote_cameras) {
                g_info("  available: %s (%s)", remote_camera.name.c_str(), remote_camera.id.c_str());
            }
            continue;
        }
        known.push_back(spec);
    }
    return known;
}

bool PrivacyController::claim_lines(const CameraSpec& spec, bool& led_available) {
    try {
        m_gpio.claim_input(spec.input_pin);
    } catch (const HardwareAcquisitionError& e) {
        g_warning("[%s] Button GPIO %d unavailable, camera disabled: %s", spec.name.c_str(), spec.input_pin,
                  e.what());
        return false;
    }

    led_available = false;
    if (spec.led_pin) {
        try {
            m_gpio.claim_output(*spec.led_pin, false);
            led_available = true;
        } catch (const HardwareAcquisitionError& e) {
            g_warning("[%s] LED GPIO %d unavailable, LED disabled: %s", spec.name.c_str(), *spec.led_pin,
                      e.what());
        }
    }
    return true;
}

void PrivacyController::start() {
    if (m_started) {
        return;
    }

    std::vector<CameraSpec> cameras = cameras_known_to_remote();
    if (cameras.empty()) {
        throw ConfigurationError("None of the configured cameras exist on the camera-control service");
    }

    std::vector<std::string> names;
    for (const auto& spec : cameras) {
        names.push_back(spec.name);
    }
    const TimePoint now = m_clock.now();
    g_message("State storage: %s", m_store.describe().c_str());
    std::map<std::string, PrivacyState> restored = m_store.load(names, now);

    for (const auto& spec : cameras) {
        bool led_available = false;
        if (!claim_lines(spec, led_available)) {
            continue;
        }

        PrivacyState initial;
        initial.camera_name = spec.name;
        auto it = restored.find(spec.name);
        if (it != restored.end()) {
            initial = it->second;
        }

        auto channel = std::make_unique<CameraChannel>();
        channel->spec = spec;
        channel->input = DebouncedInput(m_config.settings.debounce_seconds);
        channel->led_available = led_available;
        channel->machine = std::make_unique<CameraStateMachine>(spec, initial, m_store,
                                                                m_config.settings.timeout_retry_seconds);

        std::string led = led_available ? "GPIO " + std::to_string(*spec.led_pin) : std::string("none");
        g_message("[%s] Button GPIO %d, LED %s, timeout %d min, privacy %s", spec.name.c_str(),
                  spec.input_pin, led.c_str(), spec.timeout_minutes, initial.privacy_enabled ? "ON" : "OFF");
        if (std::optional<TimePoint> deadline = channel->machine->timeout_deadline()) {
            auto remaining = std::chrono::duration_cast<std::chrono::minutes>(*deadline - now).count();
            if (remaining <= 0) {
                g_message("[%s] Restored privacy timeout already expired, will disable", spec.name.c_str());
            } else {
                g_message("[%s] Auto-disable in %lld minutes", spec.name.c_str(),
                          static_cast<long long>(remaining));
            }
        }

        drive_led(*channel);
        m_channels.push_back(std::move(channel));
    }

    if (m_channels.empty()) {
        m_gpio.release_all();
        throw HardwareAcquisitionError(-1, "No camera button could be acquired");
    }

    m_started = true;
    m_accepting_events = true;
}

void PrivacyController::tick() {
    if (!m_accepting_events) {
        return;
    }

    const TimePoint now = m_clock.now();
    for (auto& channel : m_channels) {
        poll_camera(*channel, now);
    }
}

void PrivacyController::poll_camera(CameraChannel& channel, TimePoint now) {
    bool level = true;
    if (!m_gpio.read(channel.spec.input_pin, level)) {
        if (!channel.read_error_reported) {
            g_warning("[%s] Reading button GPIO %d failed", channel.spec.name.c_str(), channel.spec.input_pin);
            channel.read_error_reported = true;
        }
    } else {
        channel.read_error_reported = false;
        // Pull-up wiring: the line reads low while the button is held.
        std::optional<ButtonEdge> edge = channel.input.sample(!level, now);
        if (edge == ButtonEdge::Pressed) {
            if (std::optional<TransitionRequest> request = channel.machine->on_press(now)) {
                dispatch(channel, *request);
            }
        }
    }

    if (std::optional<TransitionRequest> request = channel.machine->on_timeout_check(now)) {
        dispatch(channel, *request);
    }

    drive_led(channel);
}

void PrivacyController::dispatch(CameraChannel& channel, const TransitionRequest& request) {
    g_debug("[%s] Dispatching %s of privacy (%s)", channel.spec.name.c_str(),
            request.enable_privacy ? "enable" : "disable", transition_reason_name(request.reason));
    m_runner.submit(request, [this](const TransitionOutcome& outcome) { on_transition_finished(outcome); });
}

void PrivacyController::on_transition_finished(const TransitionOutcome& outcome) {
    CameraChannel* channel = find_channel(outcome.request.camera_name);
    if (!channel) {
        return;
    }

    channel->machine->on_transition_complete(outcome, m_clock.now());
    if (m_started) {
        drive_led(*channel);
    }
}

void PrivacyController::drive_led(CameraChannel& channel) {
    if (!channel.led_available) {
        return;
    }

    bool desired = channel.led_override ? *channel.led_override : !channel.machine->privacy_enabled();
    if (channel.led_written == desired) {
        return;
    }

    if (m_gpio.write(*channel.spec.led_pin, desired)) {
        channel.led_written = desired;
    } else {
        g_warning("[%s] Writing LED GPIO %d failed", channel.spec.name.c_str(), *channel.spec.led_pin);
    }
}

bool PrivacyController::set_led_override(const std::string& camera, std::optional<bool> on) {
    CameraChannel* channel = find_channel(camera);
    if (!channel || !channel->led_available) {
        return false;
    }

    channel->led_override = on;
    if (on) {
        g_info("[%s] LED forced %s", camera.c_str(), *on ? "on" : "off");
    } else {
        g_info("[%s] LED follows privacy state again", camera.c_str());
    }
    if (m_started) {
        drive_led(*channel);
    }
    return true;
}

void PrivacyController::begin_shutdown() {
    if (m_accepting_events) {
        g_message("No longer accepting button presses; %zu transition(s) in flight", m_runner.in_flight());
    }
    m_accepting_events = false;
}

void PrivacyController::shutdown() {
    if (!m_started) {
        return;
    }
    m_accepting_events = false;
    m_started = false;

    for (auto& channel : m_channels) {
        if (channel->led_available && !m_gpio.write(*channel->spec.led_pin, false)) {
            g_warning("[%s] Could not turn LED off", channel->spec.name.c_str());
        }
    }
    m_gpio.release_all();
    g_message("GPIO released");
}

std::vector<std::string> PrivacyController::active_cameras() const {
    std::vector<std::string> names;
    for (const auto& channel : m_channels) {
        names.push_back(channel->spec.name);
    }
    return names;
}

const CameraStateMachine* PrivacyController::camera(const std::string& name) const {
    const CameraChannel* channel = find_channel(name);
    return channel ? channel->machine.get() : nullptr;
}

const DebouncedInput* PrivacyController::input(const std::string& name) const {
    const CameraChannel* channel = find_channel(name);
    return channel ? &channel->input : nullptr;
}
