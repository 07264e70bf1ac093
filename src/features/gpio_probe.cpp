#include "features/gpio_probe.hpp"

#include "core/errors.hpp"

#include <glib-unix.h>
#include <glib.h>
#include <glibmm/main.h>

#include <algorithm>
#include <cmath>
#include <csignal>
#include <iostream>

namespace {
constexpr unsigned int kBlinkHalfPeriodMs = 500;

gboolean quit_loop(gpointer data) {
    static_cast<Glib::MainLoop*>(data)->quit();
    return G_SOURCE_CONTINUE;
}
}

GpioProbe::GpioProbe(const DaemonConfig& config, GpioBackend& gpio, const Clock& clock)
    : m_config(config), m_gpio(gpio), m_clock(clock) {}

GpioProbe::~GpioProbe() {
    m_gpio.release_all();
}

std::size_t GpioProbe::claim() {
    for (const auto& spec : m_config.enabled_cameras()) {
        ProbeChannel channel;
        channel.spec = spec;
        channel.input = DebouncedInput(m_config.settings.debounce_seconds);

        try {
            m_gpio.claim_input(spec.input_pin);
        } catch (const HardwareAcquisitionError& e) {
            std::cerr << "Button GPIO " << spec.input_pin << " (" << spec.name << "): " << e.what() << '\n';
            continue;
        }

        if (spec.led_pin) {
            try {
                m_gpio.claim_output(*spec.led_pin, false);
                channel.led_available = true;
            } catch (const HardwareAcquisitionError& e) {
                std::cerr << "LED GPIO " << *spec.led_pin << " (" << spec.name << "): " << e.what() << '\n';
            }
        }

        std::cout << "GPIO setup OK for " << spec.name << ": button " << spec.input_pin;
        if (channel.led_available) {
            std::cout << ", LED " << *spec.led_pin;
        }
        std::cout << '\n';
        m_channels.push_back(std::move(channel));
    }
    return m_channels.size();
}

bool GpioProbe::blink_step() {
    if (m_blink_half_periods >= kBlinkCount * 2) {
        return false;
    }

    bool on = m_blink_half_periods % 2 == 0;
    for (const auto& channel : m_channels) {
        if (channel.led_available && !m_gpio.write(*channel.spec.led_pin, on)) {
            std::cerr << "Writing LED GPIO " << *channel.spec.led_pin << " failed\n";
        }
    }
    std::cout << "  LED " << (on ? "ON" : "OFF") << '\n';

    ++m_blink_half_periods;
    return m_blink_half_periods < kBlinkCount * 2;
}

void GpioProbe::poll() {
    const TimePoint now = m_clock.now();
    for (auto& channel : m_channels) {
        bool level = true;
        if (!m_gpio.read(channel.spec.input_pin, level)) {
            continue;
        }
        if (channel.input.sample(!level, now) == ButtonEdge::Pressed) {
            ++channel.presses;
            std::cout << "BUTTON PRESSED: " << channel.spec.name << " (GPIO " << channel.spec.input_pin << ")\n";
        }
    }
}

int GpioProbe::presses(const std::string& camera) const {
    for (const auto& channel : m_channels) {
        if (channel.spec.name == camera) {
            return channel.presses;
        }
    }
    return 0;
}

int GpioProbe::run() {
    if (claim() == 0) {
        std::cerr << "No button GPIO could be set up\n"
                  << "Check that the user is in the gpio group and the chip name is right\n";
        return 1;
    }

    auto loop = Glib::MainLoop::create();
    guint sigint = g_unix_signal_add(SIGINT, &quit_loop, loop.get());
    guint sigterm = g_unix_signal_add(SIGTERM, &quit_loop, loop.get());

    std::cout << "Testing LEDs...\n";
    Glib::signal_timeout().connect([this]() {
        if (blink_step()) {
            return true;
        }
        std::cout << "LED test complete\nPress the buttons (Ctrl+C to exit)\n";
        return false;
    }, kBlinkHalfPeriodMs);

    const unsigned int interval_ms = static_cast<unsigned int>(
        std::max(1L, std::lround(m_config.settings.polling_interval_seconds * 1000.0)));
    Glib::signal_timeout().connect([this]() {
        poll();
        return true;
    }, interval_ms);

    loop->run();
    g_source_remove(sigint);
    g_source_remove(sigterm);

    bool all_pressed = true;
    for (const auto& channel : m_channels) {
        if (channel.presses > 0) {
            std::cout << channel.spec.name << ": button working (" << channel.presses << " press(es))\n";
        } else {
            all_pressed = false;
            std::cout << channel.spec.name << ": no press detected on GPIO " << channel.spec.input_pin
                      << "; check wiring to GND and that the button is normally open\n";
        }
    }
    return all_pressed ? 0 : 1;
}
