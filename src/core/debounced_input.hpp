#ifndef CORE_DEBOUNCED_INPUT_HPP
#define CORE_DEBOUNCED_INPUT_HPP

#include "core/models.hpp"

#include <optional>

enum class ButtonEdge { Pressed, Released };

struct ButtonState {
    bool raw_level = false;
    bool stable_level = false;
    TimePoint last_change{};
};

// Turns raw samples of one logical button (true = pressed) into debounced edges.
// A new level must hold for the whole debounce window before it is accepted; a
// bounce back to the settled level inside the window is dropped without an event.
class DebouncedInput {
public:
    explicit DebouncedInput(double debounce_seconds = 0.3);

    // The first sample only primes the settled level.
    std::optional<ButtonEdge> sample(bool level, TimePoint now);

    bool primed() const { return m_primed; }
    bool debouncing() const { return m_debouncing; }
    const ButtonState& state() const { return m_state; }

private:
    std::chrono::microseconds m_window;
    bool m_primed = false;
    bool m_debouncing = false;
    TimePoint m_candidate_since{};
    ButtonState m_state;
};

#endif
