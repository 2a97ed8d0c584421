#pragma once

#include <vector>

#include <ql/time/calendars/bespokecalendar.hpp>
#include <ql/time/date.hpp>

#include "ivgreeks/clock.hpp"

namespace ivgreeks {

constexpr double CALENDAR_YEAR_DAYS = 365.0;

enum class DayCountConvention { CalendarDays, BusinessDays, TradingDays };

// Distance between the valuation year and the expiry year, as used by the
// year-fraction divisor.
enum class YearSpan { SameYear, NextYear, MultiYear, Unmatched };

YearSpan classify_year_span(QuantLib::Year valuation_year,
                            QuantLib::Year expiry_year);

// NSE trading holidays for 2025 and 2026.
std::vector<QuantLib::Date> nse_holidays();

struct SessionTimes {
    // Options settle at the close on the expiry date.
    double expiry_close = 15 * 3600.0 + 30 * 60.0;
    // Intraday offset subtracted from business/trading day counts.
    double session_offset = 8 * 3600.0 + 30 * 60.0;
};

// Weekday and trading-day calendars plus the session times that turn a
// valuation instant and an expiry date into a year fraction.
class SessionCalendar {
  public:
    explicit SessionCalendar(
        const std::vector<QuantLib::Date>& holidays = nse_holidays(),
        const SessionTimes& times = SessionTimes{});

    // Days from `from` to `to`, both inclusive. Mon-Fri for business days,
    // Mon-Fri minus holidays for trading days, every day otherwise.
    long count_days(DayCountConvention convention, const QuantLib::Date& from,
                    const QuantLib::Date& to) const;

    bool is_trading_day(const QuantLib::Date& d) const;

    // Expiry date at the close.
    Timestamp settlement(const QuantLib::Date& expiry) const;

    // Numerator of the year fraction, in days.
    double days_to_expiry(DayCountConvention convention,
                          const Timestamp& valuation,
                          const QuantLib::Date& expiry) const;

    // Denominator of the year fraction, in days.
    double divisor(DayCountConvention convention, const Timestamp& valuation,
                   const QuantLib::Date& expiry) const;

    double year_fraction(DayCountConvention convention,
                         const Timestamp& valuation,
                         const QuantLib::Date& expiry) const;

    const SessionTimes& times() const { return times_; }

  private:
    QuantLib::BespokeCalendar weekdays_;
    QuantLib::BespokeCalendar trading_;
    SessionTimes times_;
};

}  // namespace ivgreeks
