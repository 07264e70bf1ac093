#include "core/debounced_input.hpp"

#include <cmath>

DebouncedInput::DebouncedInput(double debounce_seconds)
    : m_window(static_cast<std::chrono::microseconds::rep>(std::llround(debounce_seconds * 1e6))) {}

std::optional<ButtonEdge> DebouncedInput::sample(bool level, TimePoint now) {
    if (!m_primed) {
        m_primed = true;
        m_state.raw_level = level;
        m_state.stable_level = level;
        m_state.last_change = now;
        return std::nullopt;
    }

    if (level != m_state.raw_level) {
        m_state.raw_level = level;
        m_state.last_change = now;
    }

    if (level == m_state.stable_level) {
        // Either nothing changed or a bounce ended inside the window.
        m_debouncing = false;
        return std::nullopt;
    }

    if (!m_debouncing) {
        m_debouncing = true;
        m_candidate_since = now;
    }

    if (now - m_candidate_since < m_window) {
        return std::nullopt;
    }

    m_debouncing = false;
    m_state.stable_level = level;
    return level ? ButtonEdge::Pressed : ButtonEdge::Released;
}
