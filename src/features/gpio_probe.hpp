#ifndef FEATURES_GPIO_PROBE_HPP
#define FEATURES_GPIO_PROBE_HPP

#include "core/clock.hpp"
#include "core/debounced_input.hpp"
#include "core/models.hpp"
#include "platform/gpio_backend.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Hardware self-test: blinks every configured LED three times, then reports
// debounced button presses until interrupted. Needs no camera-control service.
class GpioProbe {
public:
    static constexpr int kBlinkCount = 3;

    GpioProbe(const DaemonConfig& config, GpioBackend& gpio, const Clock& clock);
    ~GpioProbe();

    // Claims lines for enabled cameras. Unavailable lines are reported and skipped.
    std::size_t claim();

    // Advances the LED blink pattern one half-period. Returns false once finished.
    bool blink_step();

    // Samples every button once, logging and counting presses.
    void poll();

    // Blinks, then polls until SIGINT/SIGTERM. Returns the process exit code.
    int run();

    int presses(const std::string& camera) const;

private:
    struct ProbeChannel {
        CameraSpec spec;
        DebouncedInput input;
        bool led_available = false;
        int presses = 0;
    };

    const DaemonConfig& m_config;
    GpioBackend& m_gpio;
    const Clock& m_clock;
    std::vector<ProbeChannel> m_channels;
    int m_blink_half_periods = 0;
};

#endif
