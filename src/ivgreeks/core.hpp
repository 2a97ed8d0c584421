#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

namespace ivgreeks {

// Sentinel for an unresolvable implied volatility. Never exactly zero so the
// Greeks formulas stay division-safe.
constexpr double IV_LOWER_BOUND = 1e-11;

// Thrown for inputs the engine refuses to price.
class InvalidInput : public std::runtime_error {
  public:
    explicit InvalidInput(const std::string& what)
        : std::runtime_error(what) {}
};

enum class OptionSide { Call, Put };

// Standard normal CDF, Zelen-Severo rational approximation (~1e-7).
double normal_cdf(double d);

// Standard normal density.
double normal_pdf(double d);

// Black-76 pricer for European options on a future.
// forward: future price, strike, T (years), r (annual rate, discounting only)
class Black76 {
  public:
    Black76(double forward, double strike, double T, double r);

    double d1(double sigma) const;
    double d2(double sigma) const;

    double call_price(double sigma) const;
    double put_price(double sigma) const;
    double price(OptionSide side, double sigma) const;

    double call_delta(double sigma) const;
    double put_delta(double sigma) const;
    double gamma(double sigma) const;
    double vega(double sigma) const;
    double call_theta(double sigma) const;
    double put_theta(double sigma) const;
    double call_rho(double sigma) const;
    double put_rho(double sigma) const;

    double discount() const { return discount_; }
    double forward() const { return forward_; }
    double strike() const { return strike_; }
    double time() const { return T_; }

  private:
    bool degenerate(double sigma) const;
    double decay(double sigma) const;

    double forward_;
    double strike_;
    double T_;
    double r_;
    double sqrtT_;
    double discount_;
};

struct SolverSettings {
    double lower = 0.001;
    double upper = 5.0;
    double tolerance = 1e-12;
    int max_iterations = 100;
    double guess = 0.2;
};

// Solve pricer.price(side, sigma) == premium for sigma on
// [settings.lower, settings.upper]. Returns IV_LOWER_BOUND when the root
// cannot be bracketed or the solver runs out of evaluations.
double solve_implied_vol(const Black76& pricer, OptionSide side,
                         double premium,
                         const SolverSettings& settings = SolverSettings{});

}  // namespace ivgreeks
