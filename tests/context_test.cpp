#include "ivgreeks/context.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <ql/time/date.hpp>

using QuantLib::Date;
using ivgreeks::ContextOptions;
using ivgreeks::MarketQuote;
using ivgreeks::Timestamp;
using ivgreeks::ValuationContext;

namespace {

QStringList warnings;

void capture_warnings(QtMsgType type, const QMessageLogContext&,
                      const QString& msg) {
    if (type == QtWarningMsg)
        warnings << msg;
}

bool warned(const QString& text) {
    for (const QString& msg : warnings) {
        if (msg.contains(text))
            return true;
    }
    return false;
}

class ContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        warnings.clear();
        previous_handler_ = qInstallMessageHandler(capture_warnings);
    }

    void TearDown() override { qInstallMessageHandler(previous_handler_); }

    const MarketQuote quote{24000.0, 24000.0, 150.0, 145.0};
    // Monday morning, expiry the following Monday
    const Timestamp valuation = Timestamp::at(Date(1, QuantLib::December, 2025), 10, 0);
    const Timestamp expiry = Timestamp::at(Date(8, QuantLib::December, 2025), 15, 30);
    std::shared_ptr<ivgreeks::ManualClock> clock =
        std::make_shared<ivgreeks::ManualClock>(valuation);

    ContextOptions fixed(double rate_percent = 0.0) const {
        ContextOptions options;
        options.valuation_time = valuation;
        options.risk_free_rate_percent = rate_percent;
        return options;
    }

    ValuationContext dynamic_context() const {
        ContextOptions options;
        options.risk_free_rate_percent = 0.0;
        return ValuationContext(quote, expiry, options, ivgreeks::EngineConfig{},
                                clock);
    }

private:
    QtMessageHandler previous_handler_ = nullptr;
};

}  // namespace

TEST_F(ContextTest, RoundTo) {
    EXPECT_DOUBLE_EQ(ivgreeks::round_to(12.34567, 2), 12.35);
    EXPECT_DOUBLE_EQ(ivgreeks::round_to(-0.123456, 4), -0.1235);
    EXPECT_DOUBLE_EQ(ivgreeks::round_to(0.0000004, 6), 0.0);
}

TEST_F(ContextTest, FixedTimeToExpiry) {
    ValuationContext ctx(quote, expiry, fixed());
    EXPECT_EQ(ctx.mode(), ivgreeks::ValuationMode::Fixed);
    EXPECT_EQ(ctx.day_count(), ivgreeks::DayCountConvention::CalendarDays);
    EXPECT_NEAR(ctx.time_to_expiry(), (7.0 + 5.5 / 24.0) / 365.0, 1e-12);
}

// OTM call quoted against the ATM pair, priced from a pinned time
TEST_F(ContextTest, OtmCallReport) {
    ValuationContext ctx(quote, expiry, fixed());
    const auto report = ctx.get_implied_vol_and_greeks(24100.0, 90.0);

    EXPECT_EQ(report.strike, 24100.0);
    EXPECT_EQ(report.future_price, 24000.0);
    EXPECT_TRUE(report.is_otm_call);
    ASSERT_TRUE(report.impl_vol && report.call_iv && report.put_iv);
    EXPECT_EQ(*report.impl_vol, *report.call_iv);
    EXPECT_GT(*report.call_iv, 1.0);
    EXPECT_LT(*report.call_iv, 50.0);

    ASSERT_TRUE(report.call_delta && report.put_delta);
    EXPECT_GT(*report.call_delta, 0.0);
    EXPECT_LT(*report.call_delta, 1.0);
    EXPECT_NEAR(*report.put_delta,
                *report.call_delta - std::exp(-ctx.rate() * ctx.time_to_expiry()),
                1.5e-4);

    ASSERT_TRUE(report.theta && report.vega && report.gamma);
    EXPECT_LT(*report.theta, 0.0);
    EXPECT_GT(*report.vega, 0.0);
    EXPECT_GT(*report.gamma, 0.0);
    EXPECT_TRUE(report.rho_call.has_value());
    EXPECT_TRUE(report.rho_put.has_value());
}

// IVs come back at two decimals, deltas at four, gamma at six
TEST_F(ContextTest, ReportIsRounded) {
    ValuationContext ctx(quote, expiry, fixed(6.5));
    const auto report = ctx.get_implied_vol_and_greeks(24100.0, 90.0, 180.0);
    ASSERT_TRUE(report.call_iv && report.call_delta && report.gamma);
    EXPECT_DOUBLE_EQ(*report.call_iv, ivgreeks::round_to(*report.call_iv, 2));
    EXPECT_DOUBLE_EQ(*report.call_delta, ivgreeks::round_to(*report.call_delta, 4));
    EXPECT_DOUBLE_EQ(*report.gamma, ivgreeks::round_to(*report.gamma, 6));
}

TEST_F(ContextTest, ImpossiblePremiumGivesLowerBound) {
    ContextOptions options = fixed();
    options.strike = 24100.0;
    options.call_premium = 30000.0;
    ValuationContext ctx(quote, expiry, options);

    const auto iv = ctx.call_implied_vol();
    ASSERT_TRUE(iv.has_value());
    EXPECT_EQ(*iv, ivgreeks::IV_LOWER_BOUND);
    EXPECT_FALSE(ctx.put_implied_vol().has_value());
}

TEST_F(ContextTest, RejectsBadInputs) {
    EXPECT_THROW(ValuationContext({0.0, 24000.0, 150.0, 145.0}, expiry, fixed()),
                 ivgreeks::InvalidInput);
    EXPECT_THROW(ValuationContext({24000.0, -1.0, 150.0, 145.0}, expiry, fixed()),
                 ivgreeks::InvalidInput);

    ContextOptions bad_strike = fixed();
    bad_strike.strike = 0.0;
    EXPECT_THROW(ValuationContext(quote, expiry, bad_strike), ivgreeks::InvalidInput);

    const Timestamp past = Timestamp::at(Date(28, QuantLib::November, 2025), 15, 30);
    EXPECT_THROW(ValuationContext(quote, past, fixed()), ivgreeks::InvalidInput);

    ValuationContext ctx(quote, expiry, fixed());
    EXPECT_THROW(ctx.get_implied_vol_and_greeks(-5.0), ivgreeks::InvalidInput);
    EXPECT_THROW(ctx.update({24000.0, 0.0, 150.0, 145.0}), ivgreeks::InvalidInput);
}

// Expiry day itself is valid until the close
TEST_F(ContextTest, ExpiryDayBeforeClose) {
    ContextOptions options;
    options.valuation_time = Timestamp::at(expiry.date, 14, 0);
    ValuationContext ctx(quote, expiry, options);
    EXPECT_GT(ctx.time_to_expiry(), 0.0);

    options.valuation_time = Timestamp::at(expiry.date, 15, 45);
    EXPECT_THROW(ValuationContext(quote, expiry, options), ivgreeks::InvalidInput);
}

TEST_F(ContextTest, DynamicReadsClockOnEveryQuery) {
    auto ctx = dynamic_context();
    EXPECT_EQ(ctx.mode(), ivgreeks::ValuationMode::Dynamic);
    const double t0 = ctx.time_to_expiry();

    clock->advance(3600.0);
    ctx.get_implied_vol_and_greeks();
    EXPECT_EQ(ctx.valuation_time(), clock->now());
    EXPECT_NEAR(t0 - ctx.time_to_expiry(), 1.0 / 24.0 / 365.0, 1e-12);

    clock->advance(86400.0);
    ctx.call_implied_vol();
    EXPECT_EQ(ctx.valuation_time().date, Date(2, QuantLib::December, 2025));
}

TEST_F(ContextTest, FixedIgnoresClock) {
    ContextOptions options = fixed();
    ValuationContext ctx(quote, expiry, options, ivgreeks::EngineConfig{}, clock);
    const auto first = ctx.get_implied_vol_and_greeks(24100.0, 90.0);
    const double t0 = ctx.time_to_expiry();

    clock->advance(7200.0);
    const auto second = ctx.get_implied_vol_and_greeks();
    EXPECT_EQ(ctx.time_to_expiry(), t0);
    EXPECT_EQ(ctx.valuation_time(), valuation);
    EXPECT_EQ(first.impl_vol, second.impl_vol);
    EXPECT_EQ(first.theta, second.theta);
}

TEST_F(ContextTest, FixedUpdateMovesValuationTime) {
    ValuationContext ctx(quote, expiry, fixed());
    const double t0 = ctx.time_to_expiry();
    ctx.update(quote, Timestamp::at(Date(2, QuantLib::December, 2025), 10, 0));
    EXPECT_NEAR(t0 - ctx.time_to_expiry(), 1.0 / 365.0, 1e-12);

    EXPECT_THROW(ctx.update(quote, Timestamp::at(Date(9, QuantLib::December, 2025), 9, 15)),
                 ivgreeks::InvalidInput);
}

TEST_F(ContextTest, DynamicRejectsPinnedUpdate) {
    auto ctx = dynamic_context();
    EXPECT_THROW(ctx.update(quote, valuation), ivgreeks::InvalidInput);
    EXPECT_NO_THROW(ctx.update(quote));
}

// Parity gap is reported, never corrected
TEST_F(ContextTest, ParityGap) {
    ValuationContext ctx(quote, expiry, fixed());
    EXPECT_NEAR(ctx.parity_gap(), 5.0, 1e-9);
    EXPECT_FALSE(ctx.parity_violated());
    EXPECT_FALSE(warned("[ValuationContext] Put-call parity violation"));
    EXPECT_FALSE(warned("[ValuationContext] Both ATM prices are low"));

    ctx.update({24000.0, 24000.0, 600.0, 100.0});
    EXPECT_NEAR(ctx.parity_gap(), 500.0, 1e-9);
    EXPECT_TRUE(ctx.parity_violated());
    EXPECT_TRUE(warned("[ValuationContext] Put-call parity violation"));
    EXPECT_EQ(ctx.quote().atm_call_premium, 600.0);
}

TEST_F(ContextTest, LowAtmPremiumsWarn) {
    ValuationContext ctx({24000.0, 24000.0, 0.0, 0.01}, expiry, fixed());
    EXPECT_TRUE(warned("[ValuationContext] Both ATM prices are low"));
    // Both sides floor to the same tick, so parity holds
    EXPECT_FALSE(warned("[ValuationContext] Put-call parity violation"));

    warnings.clear();
    ctx.update({24000.0, 24000.0, 0.0, 145.0});
    EXPECT_FALSE(warned("[ValuationContext] Both ATM prices are low"));
}

TEST_F(ContextTest, PremiumsAreFloored) {
    ValuationContext ctx({24000.0, 24000.0, 0.0, 145.0}, expiry, fixed());
    EXPECT_EQ(ctx.quote().atm_call_premium, 0.05);
    ASSERT_TRUE(ctx.current_query().call_premium.has_value());
    EXPECT_EQ(*ctx.current_query().call_premium, 0.05);

    ctx.get_implied_vol_and_greeks(std::nullopt, std::nullopt, 0.01);
    EXPECT_EQ(*ctx.current_query().put_premium, 0.05);
}

TEST_F(ContextTest, DefaultQueryIsAtm) {
    ValuationContext ctx(quote, expiry, fixed());
    EXPECT_EQ(ctx.current_query().strike, 24000.0);
    EXPECT_EQ(*ctx.current_query().call_premium, 150.0);
    EXPECT_EQ(*ctx.current_query().put_premium, 145.0);
}

TEST_F(ContextTest, AtmQueryFollowsUpdates) {
    ValuationContext ctx(quote, expiry, fixed());
    ctx.update({24060.0, 24050.0, 140.0, 150.0});
    EXPECT_EQ(ctx.current_query().strike, 24050.0);
    EXPECT_EQ(*ctx.current_query().call_premium, 140.0);
}

// Once a caller overrides the query it stays put
TEST_F(ContextTest, OverridesAreSticky) {
    ValuationContext ctx(quote, expiry, fixed());
    const auto first = ctx.get_implied_vol_and_greeks(24100.0, 90.0);
    const auto again = ctx.get_implied_vol_and_greeks();
    EXPECT_EQ(again.strike, 24100.0);
    EXPECT_EQ(again.call_iv, first.call_iv);

    ctx.update({24060.0, 24050.0, 140.0, 150.0});
    EXPECT_EQ(ctx.current_query().strike, 24100.0);
    EXPECT_EQ(*ctx.current_query().call_premium, 90.0);
}

TEST_F(ContextTest, AverageOfBothSides) {
    ValuationContext ctx(quote, expiry, fixed());
    const auto report = ctx.get_implied_vol_and_greeks(24100.0, 90.0, 185.0, false);
    ASSERT_TRUE(report.impl_vol && report.call_iv && report.put_iv);
    EXPECT_NEAR(*report.impl_vol, 0.5 * (*report.call_iv + *report.put_iv), 0.011);
}

TEST_F(ContextTest, MissingPutPremium) {
    ContextOptions options = fixed();
    options.strike = 24100.0;
    options.call_premium = 90.0;
    ValuationContext ctx(quote, expiry, options);

    const auto report = ctx.get_implied_vol_and_greeks();
    EXPECT_TRUE(report.call_iv.has_value());
    EXPECT_FALSE(report.put_iv.has_value());
    EXPECT_TRUE(report.impl_vol.has_value());
    EXPECT_TRUE(report.rho_call.has_value());
    EXPECT_FALSE(report.rho_put.has_value());
}

// ITM call: the put is the representative side and it has no quote
TEST_F(ContextTest, MissingRepresentativeSide) {
    ContextOptions options = fixed();
    options.strike = 23900.0;
    options.call_premium = 170.0;
    ValuationContext ctx(quote, expiry, options);

    const auto report = ctx.get_implied_vol_and_greeks();
    EXPECT_FALSE(report.is_otm_call);
    EXPECT_TRUE(report.call_iv.has_value());
    EXPECT_FALSE(report.impl_vol.has_value());
    EXPECT_FALSE(report.call_delta.has_value());
    EXPECT_FALSE(report.gamma.has_value());
    EXPECT_FALSE(report.rho_call.has_value());
}

TEST_F(ContextTest, ConfigDrivesDefaults) {
    ivgreeks::EngineConfig config;
    config.day_count = ivgreeks::DayCountConvention::TradingDays;
    config.risk_free_rate_percent = 6.5;
    ContextOptions options;
    options.valuation_time = valuation;
    options.profile = ivgreeks::MatchProfile::Nse;
    ValuationContext ctx(quote, expiry, options, config);

    EXPECT_EQ(ctx.day_count(), ivgreeks::DayCountConvention::TradingDays);
    EXPECT_DOUBLE_EQ(ctx.rate(), 0.065);
    EXPECT_EQ(ctx.get_implied_vol_and_greeks().profile, ivgreeks::MatchProfile::Nse);
}

// With no per-call choice the configured one applies
TEST_F(ContextTest, ConfiguredAveraging) {
    ivgreeks::EngineConfig config;
    config.use_otm_liquidity = false;
    ValuationContext ctx(quote, expiry, fixed(), config);

    const auto averaged = ctx.get_implied_vol_and_greeks(24100.0, 90.0, 185.0);
    ASSERT_TRUE(averaged.impl_vol && averaged.call_iv && averaged.put_iv);
    EXPECT_NE(*averaged.call_iv, *averaged.put_iv);
    EXPECT_NEAR(*averaged.impl_vol,
                0.5 * (*averaged.call_iv + *averaged.put_iv), 0.011);

    const auto otm = ctx.get_implied_vol_and_greeks(std::nullopt, std::nullopt,
                                                    std::nullopt, true);
    ASSERT_TRUE(otm.impl_vol.has_value());
    EXPECT_EQ(*otm.impl_vol, *otm.call_iv);
}
