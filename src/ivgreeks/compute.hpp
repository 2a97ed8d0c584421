#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <arrow/api.h>
#include <arrow/c/abi.h>

#include "ivgreeks/context.hpp"

namespace ivgreeks {

// Strike nearest to the future price. Of equally distant strikes the first
// in `strikes` wins.
double find_atm_strike(const std::vector<double>& strikes, double future_price);

struct ChainSnapshot {
    Timestamp valuation_time;
    double time_to_expiry = 0.0;
    std::vector<GreeksReport> reports;  // one per input row, same order
};

// Prices every row against one refreshed copy of `context`: the clock is
// read once for the whole chain. Rows are raw quotes; premiums are floored
// here. A row with a non-positive strike comes back with every figure
// absent. Unset `use_otm_liquidity` takes the context's configured choice.
ChainSnapshot price_chain(const ValuationContext& context,
                          const std::vector<PricingQuery>& rows,
                          std::optional<bool> use_otm_liquidity = std::nullopt);

// Takes a table with columns: strike, call_premium, put_premium (float64;
// premiums nullable, null meaning no quote).
// Returns the input columns plus: is_otm_call (bool), impl_vol, call_iv,
// put_iv, call_delta, put_delta, theta, vega, gamma, rho_call, rho_put
// (float64, null where the report has no figure).
std::shared_ptr<arrow::Table> compute_chain_table(
    const ValuationContext& context,
    const std::shared_ptr<arrow::Table>& input,
    std::optional<bool> use_otm_liquidity = std::nullopt);

// Releases a stream nobody consumed, then frees the struct.
struct ArrowStreamDeleter {
    void operator()(ArrowArrayStream* stream) const;
};
using ChainStream = std::unique_ptr<ArrowArrayStream, ArrowStreamDeleter>;

// Exports `table` through the Arrow C stream interface. A consumer that
// imports the stream marks it released; otherwise the deleter releases it.
ChainStream export_chain_stream(const std::shared_ptr<arrow::Table>& table);

}  // namespace ivgreeks
