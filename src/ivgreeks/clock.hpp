#pragma once

#include <chrono>
#include <memory>

#include <ql/time/date.hpp>

namespace ivgreeks {

constexpr double SECONDS_IN_A_DAY = 86400.0;

// Local wall-clock instant: a calendar date plus seconds since midnight.
struct Timestamp {
    QuantLib::Date date;
    double seconds = 0.0;

    static Timestamp at(const QuantLib::Date& date, int hour, int minute,
                        int second = 0);
};

// Elapsed seconds from `from` to `to` (negative when `to` is earlier).
double seconds_between(const Timestamp& from, const Timestamp& to);

// Local wall-clock reading of a system time point.
Timestamp from_time_point(std::chrono::system_clock::time_point tp);

bool operator<(const Timestamp& lhs, const Timestamp& rhs);
bool operator==(const Timestamp& lhs, const Timestamp& rhs);

// Source of the valuation instant for dynamic contexts.
class Clock {
  public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

// Reads the host's local time.
class SystemClock : public Clock {
  public:
    Timestamp now() const override;
};

// Clock that only moves when told to.
class ManualClock : public Clock {
  public:
    explicit ManualClock(const Timestamp& start) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(const Timestamp& t) { now_ = t; }
    void advance(double seconds);

  private:
    Timestamp now_;
};

std::shared_ptr<const Clock> system_clock();

}  // namespace ivgreeks
