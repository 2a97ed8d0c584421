#pragma once

#include <memory>
#include <optional>

#include "ivgreeks/clock.hpp"
#include "ivgreeks/config.hpp"
#include "ivgreeks/core.hpp"
#include "ivgreeks/day_count.hpp"

namespace ivgreeks {

enum class ExpiryType { Weekly, Monthly };

// Which broker's figures the caller tries to reproduce. Carried into every
// report; has no effect on the numbers.
enum class MatchProfile { Nse, Custom, Sensibull };

enum class ValuationMode { Fixed, Dynamic };

// Future and ATM pair as quoted.
struct MarketQuote {
    double future_price;
    double atm_strike;
    double atm_call_premium;
    double atm_put_premium;
};

struct ContextOptions {
    std::optional<double> strike;
    std::optional<double> call_premium;
    std::optional<double> put_premium;
    ExpiryType expiry_type = ExpiryType::Monthly;
    // Supplying a valuation time makes the context FIXED.
    std::optional<Timestamp> valuation_time;
    MatchProfile profile = MatchProfile::Custom;
    std::optional<DayCountConvention> day_count;
    std::optional<double> risk_free_rate_percent;
};

// One strike with floored premiums; built per evaluation and thrown away.
struct PricingQuery {
    double strike;
    std::optional<double> call_premium;
    std::optional<double> put_premium;
};

// Presentation-rounded figures for one strike. IVs are in percent. Absent
// values mark a side with no premium or a strike that could not be priced.
struct GreeksReport {
    double strike = 0.0;
    double future_price = 0.0;
    bool is_otm_call = false;
    std::optional<double> impl_vol;
    std::optional<double> call_iv;
    std::optional<double> put_iv;
    std::optional<double> call_delta;
    std::optional<double> put_delta;
    std::optional<double> theta;
    std::optional<double> vega;
    std::optional<double> gamma;
    std::optional<double> rho_call;
    std::optional<double> rho_put;
    MatchProfile profile = MatchProfile::Custom;
};

double round_to(double value, int decimals);

// Inputs for one option series. Construction validates and fixes the
// expiry; update() replaces the market quote. A context built without a
// valuation time is DYNAMIC and re-reads its clock before every query.
class ValuationContext {
  public:
    ValuationContext(const MarketQuote& quote, const Timestamp& expiry,
                     const ContextOptions& options = ContextOptions{},
                     const EngineConfig& config = EngineConfig{},
                     std::shared_ptr<const Clock> clock = system_clock());

    // Replace the quote, and for FIXED contexts optionally the valuation
    // time. Recomputes T.
    void update(const MarketQuote& quote,
                const std::optional<Timestamp>& valuation_time = std::nullopt);

    // Re-sample the clock (DYNAMIC only) and recompute T.
    void refresh();

    // Unset `use_otm_liquidity` takes the configured choice.
    GreeksReport get_implied_vol_and_greeks(
        std::optional<double> strike = std::nullopt,
        std::optional<double> call_premium = std::nullopt,
        std::optional<double> put_premium = std::nullopt,
        std::optional<bool> use_otm_liquidity = std::nullopt);

    // Price one query against the current valuation time without
    // refreshing. Used for snapshot pricing.
    GreeksReport evaluate(const PricingQuery& query,
                          bool use_otm_liquidity) const;

    PricingQuery make_query(double strike, std::optional<double> call_premium,
                            std::optional<double> put_premium) const;

    // Raw solved IV (fraction) of the current query's sides, after a
    // refresh. Absent when that side has no premium.
    std::optional<double> call_implied_vol();
    std::optional<double> put_implied_vol();

    Black76 pricer(double strike) const;

    const MarketQuote& quote() const { return quote_; }
    const Timestamp& expiry() const { return expiry_; }
    const Timestamp& valuation_time() const { return valuation_; }
    ValuationMode mode() const { return mode_; }
    DayCountConvention day_count() const { return day_count_; }
    ExpiryType expiry_type() const { return expiry_type_; }
    MatchProfile profile() const { return profile_; }
    double rate() const { return rate_; }
    double time_to_expiry() const { return T_; }
    const PricingQuery& current_query() const { return query_; }
    const EngineConfig& config() const { return config_; }

    // |C0 - P0 + K0 - F| from the last quote.
    double parity_gap() const { return parity_gap_; }
    bool parity_violated() const;

  private:
    void set_quote(const MarketQuote& quote);
    void check_atm_quote() const;
    void recompute_time();
    double floor_premium(double premium) const;

    MarketQuote quote_;
    MarketQuote raw_quote_;
    Timestamp expiry_;
    Timestamp valuation_;
    ValuationMode mode_;
    DayCountConvention day_count_;
    ExpiryType expiry_type_;
    MatchProfile profile_;
    double rate_;
    double T_ = 0.0;
    double parity_gap_ = 0.0;
    PricingQuery query_{};
    // Query was defaulted from the ATM pair and tracks it across updates.
    bool query_follows_atm_ = false;
    EngineConfig config_;
    SessionCalendar calendar_;
    std::shared_ptr<const Clock> clock_;
};

}  // namespace ivgreeks
