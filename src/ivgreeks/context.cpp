#include "ivgreeks/context.hpp"

#include <cmath>
#include <utility>

#include <QDebug>

namespace ivgreeks {

namespace {

void validate_quote(const MarketQuote& quote) {
    if (!(quote.future_price > 0.0))
        throw InvalidInput("future price must be positive");
    if (!(quote.atm_strike > 0.0))
        throw InvalidInput("ATM strike must be positive");
}

void validate_strike(double strike) {
    if (!(strike > 0.0))
        throw InvalidInput("strike must be positive");
}

}  // namespace

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

ValuationContext::ValuationContext(const MarketQuote& quote,
                                   const Timestamp& expiry,
                                   const ContextOptions& options,
                                   const EngineConfig& config,
                                   std::shared_ptr<const Clock> clock)
    : quote_(quote), raw_quote_(quote), expiry_(expiry),
      mode_(options.valuation_time ? ValuationMode::Fixed
                                   : ValuationMode::Dynamic),
      day_count_(options.day_count.value_or(config.day_count)),
      expiry_type_(options.expiry_type), profile_(options.profile),
      rate_(options.risk_free_rate_percent.value_or(
                config.risk_free_rate_percent) /
            100.0),
      config_(config), calendar_(config.holidays, config.session),
      clock_(clock ? std::move(clock) : system_clock()) {
    validate_quote(quote);
    if (options.strike)
        validate_strike(*options.strike);

    valuation_ = options.valuation_time ? *options.valuation_time
                                        : clock_->now();
    if (!(valuation_ < calendar_.settlement(expiry_.date)))
        throw InvalidInput("expiry must be after the valuation time");

    set_quote(quote);

    if (options.strike) {
        query_ = make_query(*options.strike, options.call_premium,
                            options.put_premium);
        query_follows_atm_ = false;
    } else {
        query_ = make_query(
            quote.atm_strike,
            options.call_premium.value_or(quote.atm_call_premium),
            options.put_premium.value_or(quote.atm_put_premium));
        query_follows_atm_ = !options.call_premium && !options.put_premium;
    }

    recompute_time();
}

void ValuationContext::update(const MarketQuote& quote,
                              const std::optional<Timestamp>& valuation_time) {
    validate_quote(quote);
    if (valuation_time) {
        if (mode_ == ValuationMode::Dynamic)
            throw InvalidInput(
                "a dynamic context reads its valuation time from the clock");
        if (!(*valuation_time < calendar_.settlement(expiry_.date)))
            throw InvalidInput("expiry must be after the valuation time");
        valuation_ = *valuation_time;
    }

    set_quote(quote);
    if (query_follows_atm_)
        query_ = make_query(quote.atm_strike, quote.atm_call_premium,
                            quote.atm_put_premium);
    refresh();
}

void ValuationContext::refresh() {
    if (mode_ == ValuationMode::Dynamic)
        valuation_ = clock_->now();
    recompute_time();
}

void ValuationContext::recompute_time() {
    T_ = calendar_.year_fraction(day_count_, valuation_, expiry_.date);
}

double ValuationContext::floor_premium(double premium) const {
    return premium > config_.premium_floor ? premium : config_.premium_floor;
}

void ValuationContext::set_quote(const MarketQuote& quote) {
    raw_quote_ = quote;
    quote_ = quote;
    quote_.atm_call_premium = floor_premium(quote.atm_call_premium);
    quote_.atm_put_premium = floor_premium(quote.atm_put_premium);

    const double synthetic =
        quote_.atm_call_premium - quote_.atm_put_premium + quote_.atm_strike;
    parity_gap_ = std::fabs(synthetic - quote_.future_price);
    check_atm_quote();
}

void ValuationContext::check_atm_quote() const {
    if (raw_quote_.atm_call_premium <= 0.01 &&
        raw_quote_.atm_put_premium <= 0.01) {
        qWarning() << "[ValuationContext] Both ATM prices are low: Call="
                   << raw_quote_.atm_call_premium
                   << "Put=" << raw_quote_.atm_put_premium;
    }
    if (parity_violated()) {
        qWarning() << "[ValuationContext] Put-call parity violation for ATM:"
                   << "Future=" << quote_.future_price << "Synthetic="
                   << quote_.atm_call_premium - quote_.atm_put_premium +
                          quote_.atm_strike
                   << "Diff=" << parity_gap_;
    }
}

bool ValuationContext::parity_violated() const {
    return parity_gap_ > quote_.future_price * config_.parity_tolerance;
}

PricingQuery ValuationContext::make_query(
    double strike, std::optional<double> call_premium,
    std::optional<double> put_premium) const {
    PricingQuery query{strike, std::nullopt, std::nullopt};
    if (call_premium)
        query.call_premium = floor_premium(*call_premium);
    if (put_premium)
        query.put_premium = floor_premium(*put_premium);
    return query;
}

Black76 ValuationContext::pricer(double strike) const {
    return Black76(quote_.future_price, strike, T_, rate_);
}

GreeksReport ValuationContext::get_implied_vol_and_greeks(
    std::optional<double> strike, std::optional<double> call_premium,
    std::optional<double> put_premium,
    std::optional<bool> use_otm_liquidity) {
    if (strike) {
        validate_strike(*strike);
        query_.strike = *strike;
    }
    if (call_premium)
        query_.call_premium = floor_premium(*call_premium);
    if (put_premium)
        query_.put_premium = floor_premium(*put_premium);
    if (strike || call_premium || put_premium)
        query_follows_atm_ = false;

    refresh();
    return evaluate(query_,
                    use_otm_liquidity.value_or(config_.use_otm_liquidity));
}

GreeksReport ValuationContext::evaluate(const PricingQuery& query,
                                        bool use_otm_liquidity) const {
    GreeksReport report;
    report.strike = query.strike;
    report.future_price = round_to(quote_.future_price, 2);
    report.profile = profile_;
    report.is_otm_call = query.strike >= quote_.future_price;

    if (!(query.strike > 0.0))
        return report;

    const Black76 model = pricer(query.strike);

    std::optional<double> call_iv;
    std::optional<double> put_iv;
    if (query.call_premium)
        call_iv = solve_implied_vol(model, OptionSide::Call,
                                    *query.call_premium, config_.solver);
    if (query.put_premium)
        put_iv = solve_implied_vol(model, OptionSide::Put, *query.put_premium,
                                   config_.solver);

    // The OTM side trades more and quotes tighter.
    std::optional<double> iv;
    if (use_otm_liquidity)
        iv = report.is_otm_call ? call_iv : put_iv;
    else if (call_iv && put_iv)
        iv = 0.5 * (*call_iv + *put_iv);

    if (call_iv)
        report.call_iv = round_to(*call_iv * 100.0, 2);
    if (put_iv)
        report.put_iv = round_to(*put_iv * 100.0, 2);
    if (!iv)
        return report;

    const double sigma = *iv;
    const double call_delta = model.call_delta(sigma);
    report.impl_vol = round_to(sigma * 100.0, 2);
    report.call_delta = round_to(call_delta, 4);
    report.put_delta = round_to(call_delta - model.discount(), 4);
    report.theta = round_to(model.put_theta(sigma) / CALENDAR_YEAR_DAYS, 4);
    report.vega = round_to(model.vega(sigma) / 100.0, 4);
    report.gamma = round_to(model.gamma(sigma), 6);
    if (call_iv)
        report.rho_call = round_to(model.call_rho(*call_iv) / 100.0, 4);
    if (put_iv)
        report.rho_put = round_to(model.put_rho(*put_iv) / 100.0, 4);
    return report;
}

std::optional<double> ValuationContext::call_implied_vol() {
    refresh();
    if (!query_.call_premium)
        return std::nullopt;
    return solve_implied_vol(pricer(query_.strike), OptionSide::Call,
                             *query_.call_premium, config_.solver);
}

std::optional<double> ValuationContext::put_implied_vol() {
    refresh();
    if (!query_.put_premium)
        return std::nullopt;
    return solve_implied_vol(pricer(query_.strike), OptionSide::Put,
                             *query_.put_premium, config_.solver);
}

}  // namespace ivgreeks
