#ifndef CORE_CLOCK_HPP
#define CORE_CLOCK_HPP

#include "core/models.hpp"

#include <string>

class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

// Wall clock, truncated to microseconds so persisted timestamps round-trip exactly.
class SystemClock : public Clock {
public:
    TimePoint now() const override;
};

namespace timestamps {
std::string to_iso8601(TimePoint time);
// Naive timestamps (no offset) are interpreted as local time.
bool from_iso8601(const std::string& text, TimePoint& out);
}

#endif
