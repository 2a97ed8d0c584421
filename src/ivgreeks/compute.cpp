#include "ivgreeks/compute.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <arrow/api.h>
#include <arrow/c/bridge.h>
#include <arrow/table.h>

#include <QDebug>

namespace ivgreeks {

namespace {

using ReportField = std::optional<double> GreeksReport::*;

// Requires a single-chunk, non-empty table.
std::shared_ptr<arrow::DoubleArray> get_double_col(
    const std::shared_ptr<arrow::Table>& table, const std::string& name) {
    auto col = table->GetColumnByName(name);
    if (!col)
        throw std::runtime_error("Missing column: " + name);
    if (col->type()->id() != arrow::Type::DOUBLE)
        throw std::runtime_error("Column is not float64: " + name);
    return std::static_pointer_cast<arrow::DoubleArray>(col->chunk(0));
}

std::optional<double> cell(const arrow::DoubleArray& arr, int64_t i) {
    if (arr.IsNull(i))
        return std::nullopt;
    return arr.Value(i);
}

std::shared_ptr<arrow::ChunkedArray> build_report_col(
    const std::string& name, const std::vector<GreeksReport>& reports,
    ReportField field) {
    arrow::DoubleBuilder builder;
    auto status = builder.Reserve(static_cast<int64_t>(reports.size()));
    for (const auto& report : reports) {
        if (!status.ok())
            break;
        const auto& value = report.*field;
        status = value ? builder.Append(*value) : builder.AppendNull();
    }
    if (!status.ok())
        throw std::runtime_error("Append failed for " + name + ": " +
                                 status.ToString());
    std::shared_ptr<arrow::Array> arr;
    status = builder.Finish(&arr);
    if (!status.ok())
        throw std::runtime_error("Finish failed for " + name);
    return std::make_shared<arrow::ChunkedArray>(arr);
}

std::shared_ptr<arrow::ChunkedArray> build_otm_col(
    const std::vector<GreeksReport>& reports) {
    arrow::BooleanBuilder builder;
    auto status = builder.Reserve(static_cast<int64_t>(reports.size()));
    for (const auto& report : reports) {
        if (!status.ok())
            break;
        status = builder.Append(report.is_otm_call);
    }
    if (!status.ok())
        throw std::runtime_error("Append failed for is_otm_call: " +
                                 status.ToString());
    std::shared_ptr<arrow::Array> arr;
    status = builder.Finish(&arr);
    if (!status.ok())
        throw std::runtime_error("Finish failed for is_otm_call");
    return std::make_shared<arrow::ChunkedArray>(arr);
}

std::shared_ptr<arrow::Table> append_col(
    const std::shared_ptr<arrow::Table>& table,
    const std::shared_ptr<arrow::Field>& field,
    const std::shared_ptr<arrow::ChunkedArray>& column) {
    auto result = table->AddColumn(table->num_columns(), field, column);
    if (!result.ok())
        throw std::runtime_error("AddColumn failed for " + field->name() +
                                 ": " + result.status().ToString());
    return result.MoveValueUnsafe();
}

}  // namespace

double find_atm_strike(const std::vector<double>& strikes,
                       double future_price) {
    if (strikes.empty())
        throw InvalidInput("no strikes to search for the ATM strike");
    auto it = std::min_element(
        strikes.begin(), strikes.end(), [future_price](double a, double b) {
            return std::fabs(a - future_price) < std::fabs(b - future_price);
        });
    return *it;
}

ChainSnapshot price_chain(const ValuationContext& context,
                          const std::vector<PricingQuery>& rows,
                          std::optional<bool> use_otm_liquidity) {
    ValuationContext snapshot = context;
    snapshot.refresh();
    const bool use_otm =
        use_otm_liquidity.value_or(snapshot.config().use_otm_liquidity);

    const int64_t n = static_cast<int64_t>(rows.size());
    ChainSnapshot result;
    result.valuation_time = snapshot.valuation_time();
    result.time_to_expiry = snapshot.time_to_expiry();
    result.reports.resize(rows.size());

    // Each thread prices against its own copy of the snapshot.
    #pragma omp parallel firstprivate(snapshot)
    {
        #pragma omp for schedule(dynamic, 64)
        for (int64_t i = 0; i < n; ++i) {
            const PricingQuery& row = rows[i];
            const PricingQuery query = snapshot.make_query(
                row.strike, row.call_premium, row.put_premium);
            result.reports[i] = snapshot.evaluate(query, use_otm);
        }
    }

    const auto skipped = std::count_if(
        rows.begin(), rows.end(),
        [](const PricingQuery& row) { return !(row.strike > 0.0); });
    if (skipped > 0) {
        qWarning() << "[ChainPricer] Skipped" << static_cast<qlonglong>(skipped)
                   << "rows without a positive strike";
    }
    qDebug() << "[ChainPricer] Priced" << static_cast<qlonglong>(n)
             << "strikes at T=" << result.time_to_expiry;
    return result;
}

std::shared_ptr<arrow::Table> compute_chain_table(
    const ValuationContext& context,
    const std::shared_ptr<arrow::Table>& input,
    std::optional<bool> use_otm_liquidity) {

    // Combine chunks upfront so each column is a single array.
    auto combined_result = input->CombineChunks();
    if (!combined_result.ok()) {
        throw std::runtime_error("Failed to combine chunks: " +
                                 combined_result.status().ToString());
    }
    auto table = combined_result.MoveValueUnsafe();
    const int64_t n = table->num_rows();

    std::vector<PricingQuery> rows(static_cast<size_t>(n));
    if (n > 0) {
        auto strike = get_double_col(table, "strike");
        auto call_premium = get_double_col(table, "call_premium");
        auto put_premium = get_double_col(table, "put_premium");
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();
        for (int64_t i = 0; i < n; ++i) {
            rows[i].strike = strike->IsNull(i) ? nan : strike->Value(i);
            rows[i].call_premium = cell(*call_premium, i);
            rows[i].put_premium = cell(*put_premium, i);
        }
    }

    const auto snapshot = price_chain(context, rows, use_otm_liquidity);
    const auto& reports = snapshot.reports;

    auto result = append_col(table, arrow::field("is_otm_call", arrow::boolean()),
                             build_otm_col(reports));
    const std::pair<const char*, ReportField> outputs[] = {
        {"impl_vol", &GreeksReport::impl_vol},
        {"call_iv", &GreeksReport::call_iv},
        {"put_iv", &GreeksReport::put_iv},
        {"call_delta", &GreeksReport::call_delta},
        {"put_delta", &GreeksReport::put_delta},
        {"theta", &GreeksReport::theta},
        {"vega", &GreeksReport::vega},
        {"gamma", &GreeksReport::gamma},
        {"rho_call", &GreeksReport::rho_call},
        {"rho_put", &GreeksReport::rho_put},
    };
    for (const auto& [name, field] : outputs) {
        result = append_col(result, arrow::field(name, arrow::float64()),
                            build_report_col(name, reports, field));
    }
    return result;
}

void ArrowStreamDeleter::operator()(ArrowArrayStream* stream) const {
    if (stream->release)
        stream->release(stream);
    delete stream;
}

ChainStream export_chain_stream(const std::shared_ptr<arrow::Table>& table) {
    auto reader = std::make_shared<arrow::TableBatchReader>(table);
    ChainStream stream(new ArrowArrayStream());
    auto status = arrow::ExportRecordBatchReader(reader, stream.get());
    if (!status.ok()) {
        throw std::runtime_error("ExportRecordBatchReader failed: " +
                                 status.ToString());
    }
    return stream;
}

}  // namespace ivgreeks
