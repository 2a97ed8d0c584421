#include "ivgreeks/clock.hpp"

#include <chrono>
#include <cmath>
#include <ctime>

namespace ivgreeks {

Timestamp Timestamp::at(const QuantLib::Date& date, int hour, int minute,
                        int second) {
    return Timestamp{date, hour * 3600.0 + minute * 60.0 + second};
}

double seconds_between(const Timestamp& from, const Timestamp& to) {
    const double days = static_cast<double>(to.date - from.date);
    return days * SECONDS_IN_A_DAY + (to.seconds - from.seconds);
}

bool operator<(const Timestamp& lhs, const Timestamp& rhs) {
    return seconds_between(lhs, rhs) > 0.0;
}

bool operator==(const Timestamp& lhs, const Timestamp& rhs) {
    return lhs.date == rhs.date && lhs.seconds == rhs.seconds;
}

Timestamp from_time_point(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::time_t t = system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&t, &tm);

    const double fraction =
        duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000 /
        1e6;
    QuantLib::Date date(tm.tm_mday, static_cast<QuantLib::Month>(tm.tm_mon + 1),
                        tm.tm_year + 1900);
    return Timestamp{date, tm.tm_hour * 3600.0 + tm.tm_min * 60.0 +
                               tm.tm_sec + fraction};
}

Timestamp SystemClock::now() const {
    return from_time_point(std::chrono::system_clock::now());
}

void ManualClock::advance(double seconds) {
    double total = now_.seconds + seconds;
    const auto days =
        static_cast<QuantLib::Date::serial_type>(std::floor(total / SECONDS_IN_A_DAY));
    now_.date += days;
    now_.seconds = total - days * SECONDS_IN_A_DAY;
}

std::shared_ptr<const Clock> system_clock() {
    static const auto clock = std::make_shared<SystemClock>();
    return clock;
}

}  // namespace ivgreeks
