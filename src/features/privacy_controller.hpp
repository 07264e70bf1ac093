#ifndef PRIVACY_CONTROLLER_HPP
#define PRIVACY_CONTROLLER_HPP

#include "core/clock.hpp"
#include "core/debounced_input.hpp"
#include "core/models.hpp"
#include "core/privacy_state_machine.hpp"
#include "core/state_store.hpp"
#include "features/transition_runner.hpp"
#include "platform/gpio_backend.hpp"
#include "platform/remote_control.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Owns the camera table and every GPIO line for the life of the process. All
// methods must be called from the polling loop's thread; that single writer is
// what keeps the per-camera state machines free of locks.
class PrivacyController {
public:
    PrivacyController(DaemonConfig config, GpioBackend& gpio, RemoteControl& remote,
                      TransitionRunner& runner, StateStore& store, const Clock& clock);
    ~PrivacyController();

    PrivacyController(const PrivacyController&) = delete;
    PrivacyController& operator=(const PrivacyController&) = delete;

    // Validates cameras against the remote, claims GPIO lines, restores state and
    // sets the LEDs. Throws RemoteUnavailableError, or HardwareAcquisitionError /
    // ConfigurationError when no camera is left to run.
    void start();

    // One polling pass over every active camera.
    void tick();

    // Stops reacting to buttons and timeouts. In-flight transitions still complete.
    void begin_shutdown();
    // Turns LEDs off and releases every GPIO line.
    void shutdown();

    // Forces a camera's status LED on or off; std::nullopt returns it to following
    // the privacy state. Returns false for an unknown or inactive camera.
    bool set_led_override(const std::string& camera, std::optional<bool> on);

    std::vector<std::string> active_cameras() const;
    const CameraStateMachine* camera(const std::string& name) const;
    const DebouncedInput* input(const std::string& name) const;
    std::size_t pending_transitions() const { return m_runner.in_flight(); }
    bool accepting_events() const { return m_accepting_events; }

private:
    struct CameraChannel {
        CameraSpec spec;
        std::unique_ptr<CameraStateMachine> machine;
        DebouncedInput input;
        bool led_available = false;
        std::optional<bool> led_override;
        std::optional<bool> led_written;
        bool read_error_reported = false;
    };

    CameraChannel* find_channel(const std::string& name);
    const CameraChannel* find_channel(const std::string& name) const;
    std::vector<CameraSpec> cameras_known_to_remote();
    bool claim_lines(const CameraSpec& spec, bool& led_available);
    void poll_camera(CameraChannel& channel, TimePoint now);
    void dispatch(CameraChannel& channel, const TransitionRequest& request);
    void on_transition_finished(const TransitionOutcome& outcome);
    void drive_led(CameraChannel& channel);

    DaemonConfig m_config;
    GpioBackend& m_gpio;
    RemoteControl& m_remote;
    TransitionRunner& m_runner;
    StateStore& m_store;
    const Clock& m_clock;
    std::vector<std::unique_ptr<CameraChannel>> m_channels;
    bool m_started = false;
    bool m_accepting_events = false;
};

#endif
