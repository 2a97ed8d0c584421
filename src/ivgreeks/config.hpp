#pragma once

#include <string>
#include <vector>

#include <ql/time/date.hpp>

#include "ivgreeks/core.hpp"
#include "ivgreeks/day_count.hpp"

namespace ivgreeks {

struct EngineConfig {
    DayCountConvention day_count = DayCountConvention::CalendarDays;
    double risk_free_rate_percent = 0.0;

    // Minimum tradable tick; premiums below it are raised to it.
    double premium_floor = 0.05;
    // ATM parity gap tolerated before warning, as a fraction of the future.
    double parity_tolerance = 0.01;

    SolverSettings solver;
    SessionTimes session;
    std::vector<QuantLib::Date> holidays = nse_holidays();

    // Used when the published T-bill yield cannot be read.
    double fallback_rate_percent = 6.0;
    bool use_otm_liquidity = true;
};

DayCountConvention parse_day_count(const std::string& name);
std::string to_string(DayCountConvention convention);

// Reads the [ENGINE] group of an INI file. Keys that are absent keep their
// defaults; malformed values throw InvalidInput.
EngineConfig load_engine_config(const std::string& path);

}  // namespace ivgreeks
