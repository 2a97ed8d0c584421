#include "ivgreeks/day_count.hpp"

namespace ivgreeks {

namespace {

using QuantLib::Date;

Date first_of_year(QuantLib::Year y) {
    return Date(1, QuantLib::January, y);
}

Date last_of_year(QuantLib::Year y) {
    return Date(31, QuantLib::December, y);
}

QuantLib::BespokeCalendar weekend_calendar(const std::string& name) {
    QuantLib::BespokeCalendar calendar(name);
    calendar.addWeekend(QuantLib::Saturday);
    calendar.addWeekend(QuantLib::Sunday);
    return calendar;
}

}  // namespace

YearSpan classify_year_span(QuantLib::Year valuation_year,
                            QuantLib::Year expiry_year) {
    const int gap = expiry_year - valuation_year;
    if (gap == 0)
        return YearSpan::SameYear;
    if (gap == 1)
        return YearSpan::NextYear;
    if (gap >= 2)
        return YearSpan::MultiYear;
    return YearSpan::Unmatched;
}

std::vector<Date> nse_holidays() {
    using namespace QuantLib;
    return {
        Date(26, February, 2025), Date(14, March, 2025),
        Date(31, March, 2025),    Date(10, April, 2025),
        Date(14, April, 2025),    Date(18, April, 2025),
        Date(1, May, 2025),       Date(15, August, 2025),
        Date(27, August, 2025),   Date(2, October, 2025),
        Date(21, October, 2025),  Date(22, October, 2025),
        Date(5, November, 2025),  Date(25, December, 2025),
        Date(15, January, 2026),  Date(26, January, 2026),
        Date(3, March, 2026),     Date(26, March, 2026),
        Date(31, March, 2026),    Date(3, April, 2026),
        Date(14, April, 2026),    Date(1, May, 2026),
        Date(28, May, 2026),      Date(26, June, 2026),
        Date(14, September, 2026), Date(2, October, 2026),
        Date(20, October, 2026),  Date(10, November, 2026),
        Date(24, November, 2026), Date(25, December, 2026),
    };
}

SessionCalendar::SessionCalendar(const std::vector<Date>& holidays,
                                 const SessionTimes& times)
    : weekdays_(weekend_calendar("weekdays")),
      trading_(weekend_calendar("trading days")), times_(times) {
    for (const auto& d : holidays)
        trading_.addHoliday(d);
}

long SessionCalendar::count_days(DayCountConvention convention,
                                 const Date& from, const Date& to) const {
    switch (convention) {
    case DayCountConvention::CalendarDays:
        return static_cast<long>(to - from) + 1;
    case DayCountConvention::BusinessDays:
        return static_cast<long>(
            weekdays_.businessDaysBetween(from, to, true, true));
    case DayCountConvention::TradingDays:
        return static_cast<long>(
            trading_.businessDaysBetween(from, to, true, true));
    }
    return 0;
}

bool SessionCalendar::is_trading_day(const Date& d) const {
    return trading_.isBusinessDay(d);
}

Timestamp SessionCalendar::settlement(const Date& expiry) const {
    return Timestamp{expiry, times_.expiry_close};
}

double SessionCalendar::days_to_expiry(DayCountConvention convention,
                                       const Timestamp& valuation,
                                       const Date& expiry) const {
    if (convention == DayCountConvention::CalendarDays)
        return seconds_between(valuation, settlement(expiry)) /
               SECONDS_IN_A_DAY;

    const double counted =
        static_cast<double>(count_days(convention, valuation.date, expiry));
    return (counted * SECONDS_IN_A_DAY - times_.session_offset -
            valuation.seconds) /
           SECONDS_IN_A_DAY;
}

double SessionCalendar::divisor(DayCountConvention convention,
                                const Timestamp& valuation,
                                const Date& expiry) const {
    if (convention == DayCountConvention::CalendarDays)
        return CALENDAR_YEAR_DAYS;

    const QuantLib::Year vy = valuation.date.year();
    const QuantLib::Year ey = expiry.year();
    switch (classify_year_span(vy, ey)) {
    case YearSpan::SameYear:
        return static_cast<double>(
            count_days(convention, first_of_year(vy), last_of_year(vy)));
    case YearSpan::NextYear:
        return static_cast<double>(
            count_days(convention, valuation.date, last_of_year(vy)) +
            count_days(convention, first_of_year(ey), last_of_year(ey)));
    case YearSpan::MultiYear:
        return static_cast<double>(
            count_days(convention, valuation.date, expiry));
    case YearSpan::Unmatched:
        break;
    }
    return CALENDAR_YEAR_DAYS;
}

double SessionCalendar::year_fraction(DayCountConvention convention,
                                      const Timestamp& valuation,
                                      const Date& expiry) const {
    return days_to_expiry(convention, valuation, expiry) /
           divisor(convention, valuation, expiry);
}

}  // namespace ivgreeks
