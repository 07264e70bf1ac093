#include "platform/libgpiod_backend.hpp"

#include "core/errors.hpp"

#include <glib.h>
#include <gpiod.h>

#include <cerrno>
#include <cstring>
#include <utility>

LibgpiodBackend::LibgpiodBackend(std::string chip, std::string consumer)
    : m_chip_name(std::move(chip)), m_consumer(std::move(consumer)) {}

LibgpiodBackend::~LibgpiodBackend() {
    release_all();
    if (m_chip) {
        gpiod_chip_close(m_chip);
    }
}

void LibgpiodBackend::open() {
    if (m_chip) {
        return;
    }

    m_chip = gpiod_chip_open_lookup(m_chip_name.c_str());
    if (!m_chip) {
        throw HardwareAcquisitionError(-1, "Cannot open GPIO chip " + m_chip_name + ": " + std::strerror(errno));
    }
}

gpiod_line* LibgpiodBackend::line_for(int pin) {
    if (!m_chip) {
        throw HardwareAcquisitionError(pin, "GPIO chip " + m_chip_name + " is not open");
    }
    if (m_lines.count(pin) > 0) {
        throw HardwareAcquisitionError(pin, "GPIO " + std::to_string(pin) + " is already claimed");
    }

    gpiod_line* line = gpiod_chip_get_line(m_chip, static_cast<unsigned int>(pin));
    if (!line) {
        throw HardwareAcquisitionError(pin, "GPIO " + std::to_string(pin) + " does not exist on " + m_chip_name);
    }
    return line;
}

void LibgpiodBackend::claim_input(int pin) {
    gpiod_line* line = line_for(pin);
    if (gpiod_line_request_input_flags(line, m_consumer.c_str(), GPIOD_LINE_REQUEST_FLAG_BIAS_PULL_UP) < 0) {
        throw HardwareAcquisitionError(pin, "Cannot request GPIO " + std::to_string(pin) +
                                                " as input: " + std::strerror(errno));
    }
    m_lines[pin] = line;
}

void LibgpiodBackend::claim_output(int pin, bool initial_level) {
    gpiod_line* line = line_for(pin);
    if (gpiod_line_request_output(line, m_consumer.c_str(), initial_level ? 1 : 0) < 0) {
        throw HardwareAcquisitionError(pin, "Cannot request GPIO " + std::to_string(pin) +
                                                " as output: " + std::strerror(errno));
    }
    m_lines[pin] = line;
}

bool LibgpiodBackend::read(int pin, bool& level) {
    auto it = m_lines.find(pin);
    if (it == m_lines.end()) {
        return false;
    }

    int value = gpiod_line_get_value(it->second);
    if (value < 0) {
        return false;
    }
    level = value != 0;
    return true;
}

bool LibgpiodBackend::write(int pin, bool level) {
    auto it = m_lines.find(pin);
    if (it == m_lines.end()) {
        return false;
    }
    return gpiod_line_set_value(it->second, level ? 1 : 0) == 0;
}

void LibgpiodBackend::release(int pin) {
    auto it = m_lines.find(pin);
    if (it == m_lines.end()) {
        return;
    }
    gpiod_line_release(it->second);
    m_lines.erase(it);
}

void LibgpiodBackend::release_all() {
    for (auto& entry : m_lines) {
        gpiod_line_release(entry.second);
    }
    if (!m_lines.empty()) {
        g_debug("Released %zu GPIO line(s) on %s", m_lines.size(), m_chip_name.c_str());
    }
    m_lines.clear();
}
