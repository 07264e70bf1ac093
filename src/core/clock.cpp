#include "core/clock.hpp"

#include <glibmm/datetime.h>
#include <glibmm/timezone.h>

TimePoint SystemClock::now() const {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string timestamps::to_iso8601(TimePoint time) {
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
    gint64 seconds = micros / 1000000;
    gint64 remainder = micros % 1000000;
    if (remainder < 0) {
        remainder += 1000000;
        seconds -= 1;
    }

    Glib::DateTime stamp = Glib::DateTime::create_from_unix_utc(seconds).add(remainder);
    return stamp.format_iso8601().raw();
}

bool timestamps::from_iso8601(const std::string& text, TimePoint& out) {
    if (text.empty()) {
        return false;
    }

    Glib::DateTime stamp = Glib::DateTime::create_from_iso8601(text, Glib::TimeZone::create_local());
    if (!stamp) {
        return false;
    }

    out = TimePoint(std::chrono::seconds(stamp.to_unix()) +
                    std::chrono::microseconds(stamp.get_microsecond()));
    return true;
}
