#pragma once

#include <optional>
#include <string>

#include "ivgreeks/config.hpp"

namespace ivgreeks {

constexpr double DEFAULT_RISK_FREE_RATE_PERCENT = 6.0;

// Security whose yield stands in for the risk-free rate.
inline const std::string TBILL_364_DAY = "364 day T-bills";

// Reads the percent yield of `security` from the published feed: a JSON
// array of {"GovernmentSecurityName": ..., "Percent": ...} records.
// Absent when the payload does not parse or has no such record.
std::optional<double> parse_risk_free_rate(
    const std::string& payload, const std::string& security = TBILL_364_DAY);

// Rate in percent for ContextOptions::risk_free_rate_percent. Falls back to
// `fallback_percent` when the fetch produced nothing or the feed is unusable.
double risk_free_rate_percent(
    const std::optional<std::string>& payload,
    double fallback_percent = DEFAULT_RISK_FREE_RATE_PERCENT,
    const std::string& security = TBILL_364_DAY);

// Same, falling back to config.fallback_rate_percent.
double risk_free_rate_percent(const std::optional<std::string>& payload,
                              const EngineConfig& config,
                              const std::string& security = TBILL_364_DAY);

}  // namespace ivgreeks
