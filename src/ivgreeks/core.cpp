#include "ivgreeks/core.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <ql/errors.hpp>
#include <ql/math/distributions/normaldistribution.hpp>
#include <ql/math/solvers1d/brent.hpp>

namespace ivgreeks {

namespace {

constexpr double inf = std::numeric_limits<double>::infinity();

const QuantLib::NormalDistribution standard_normal;

// Functor for the Brent solver: returns model price - observed premium
class PremiumObjective {
  public:
    PremiumObjective(const Black76& pricer, OptionSide side, double premium)
        : pricer_(pricer), side_(side), premium_(premium) {}

    double operator()(double sigma) const {
        return pricer_.price(side_, sigma) - premium_;
    }

  private:
    const Black76& pricer_;
    OptionSide side_;
    double premium_;
};

}  // namespace

double normal_cdf(double d) {
    constexpr double A1 = 0.31938153;
    constexpr double A2 = -0.356563782;
    constexpr double A3 = 1.781477937;
    constexpr double A4 = -1.821255978;
    constexpr double A5 = 1.330274429;
    constexpr double RSQRT2PI = 0.39894228040143267793994605993438;

    const double k = 1.0 / (1.0 + 0.2316419 * std::fabs(d));
    const double tail = RSQRT2PI * std::exp(-0.5 * d * d) *
                        (k * (A1 + k * (A2 + k * (A3 + k * (A4 + k * A5)))));
    return d > 0.0 ? 1.0 - tail : tail;
}

double normal_pdf(double d) {
    return standard_normal(d);
}

Black76::Black76(double forward, double strike, double T, double r)
    : forward_(forward), strike_(strike), T_(T), r_(r),
      sqrtT_(std::sqrt(std::max(T, 0.0))), discount_(std::exp(-r * T)) {
    if (!(forward > 0.0))
        throw InvalidInput("future price must be positive");
    if (!(strike > 0.0))
        throw InvalidInput("strike must be positive");
}

// Past expiry (T <= 0) takes the same branch as a vanishing volatility.
bool Black76::degenerate(double sigma) const {
    return sigma <= IV_LOWER_BOUND || T_ <= 0.0;
}

double Black76::d1(double sigma) const {
    if (degenerate(sigma))
        return forward_ > strike_ ? inf : -inf;
    return (std::log(forward_ / strike_) + 0.5 * sigma * sigma * T_) /
           (sigma * sqrtT_);
}

double Black76::d2(double sigma) const {
    return d1(sigma) - sigma * sqrtT_;
}

double Black76::call_price(double sigma) const {
    return discount_ * (forward_ * normal_cdf(d1(sigma)) -
                        strike_ * normal_cdf(d2(sigma)));
}

double Black76::put_price(double sigma) const {
    return discount_ * (strike_ * (1.0 - normal_cdf(d2(sigma))) -
                        forward_ * (1.0 - normal_cdf(d1(sigma))));
}

double Black76::price(OptionSide side, double sigma) const {
    return side == OptionSide::Call ? call_price(sigma) : put_price(sigma);
}

double Black76::call_delta(double sigma) const {
    return discount_ * normal_cdf(d1(sigma));
}

double Black76::put_delta(double sigma) const {
    return call_delta(sigma) - discount_;
}

double Black76::gamma(double sigma) const {
    if (degenerate(sigma))
        return 0.0;
    return discount_ * normal_pdf(d1(sigma)) / (forward_ * sigma * sqrtT_);
}

double Black76::vega(double sigma) const {
    return discount_ * forward_ * sqrtT_ * normal_pdf(d1(sigma));
}

double Black76::decay(double sigma) const {
    if (degenerate(sigma))
        return 0.0;
    return -discount_ * forward_ * sigma * normal_pdf(d1(sigma)) /
           (2.0 * sqrtT_);
}

double Black76::call_theta(double sigma) const {
    return decay(sigma) - r_ * call_price(sigma);
}

double Black76::put_theta(double sigma) const {
    return decay(sigma) + r_ * put_price(sigma);
}

double Black76::call_rho(double sigma) const {
    return -T_ * call_price(sigma);
}

double Black76::put_rho(double sigma) const {
    return -T_ * put_price(sigma);
}

double solve_implied_vol(const Black76& pricer, OptionSide side,
                         double premium, const SolverSettings& settings) {
    double guess = settings.guess;
    if (guess <= settings.lower || guess >= settings.upper)
        guess = 0.5 * (settings.lower + settings.upper);

    double iv;
    try {
        PremiumObjective objective(pricer, side, premium);
        QuantLib::Brent solver;
        solver.setMaxEvaluations(settings.max_iterations);
        iv = solver.solve(objective, settings.tolerance, guess,
                          settings.lower, settings.upper);
    } catch (const QuantLib::Error&) {
        // Not bracketed or out of evaluations.
        return IV_LOWER_BOUND;
    }

    if (!(iv > IV_LOWER_BOUND))
        return IV_LOWER_BOUND;
    return iv;
}

}  // namespace ivgreeks
