#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <ql/time/date.hpp>

#include "ivgreeks/arrow_interop.hpp"
#include "ivgreeks/clock.hpp"
#include "ivgreeks/compute.hpp"
#include "ivgreeks/config.hpp"
#include "ivgreeks/context.hpp"
#include "ivgreeks/risk_free_rate.hpp"

namespace py = pybind11;

namespace {

using TimePoint = std::chrono::system_clock::time_point;

py::object optional_value(const std::optional<double>& v) {
    return v ? py::cast(*v) : py::none();
}

// Same keys as the reports the desk scripts consume.
py::dict report_to_dict(const ivgreeks::GreeksReport& r) {
    py::dict d;
    d["Strike"] = r.strike;
    d["FuturePrice"] = r.future_price;
    d["IsOTMCall"] = r.is_otm_call;
    d["ImplVol"] = optional_value(r.impl_vol);
    d["CallIV"] = optional_value(r.call_iv);
    d["PutIV"] = optional_value(r.put_iv);
    d["CallDelta"] = optional_value(r.call_delta);
    d["PutDelta"] = optional_value(r.put_delta);
    d["Theta"] = optional_value(r.theta);
    d["Vega"] = optional_value(r.vega);
    d["Gamma"] = optional_value(r.gamma);
    d["RhoCall"] = optional_value(r.rho_call);
    d["RhoPut"] = optional_value(r.rho_put);
    return d;
}

py::object to_py_date(const QuantLib::Date& d) {
    py::object date_type = py::module_::import("datetime").attr("date");
    return date_type(static_cast<int>(d.year()), static_cast<int>(d.month()),
                     d.dayOfMonth());
}

// Accepts datetime.date (or anything with year/month/day attributes).
QuantLib::Date from_py_date(const py::handle& obj) {
    return QuantLib::Date(obj.attr("day").cast<int>(),
                          static_cast<QuantLib::Month>(
                              obj.attr("month").cast<int>()),
                          obj.attr("year").cast<int>());
}

std::optional<ivgreeks::Timestamp> to_timestamp(
    const std::optional<TimePoint>& tp) {
    if (!tp)
        return std::nullopt;
    return ivgreeks::from_time_point(*tp);
}

}  // namespace

PYBIND11_MODULE(_core, m) {
    m.doc() = "ivgreeks: Black-76 implied volatility and Greeks for index options";

    py::register_exception<ivgreeks::InvalidInput>(m, "InvalidInput",
                                                   PyExc_ValueError);

    py::enum_<ivgreeks::DayCountConvention>(m, "DayCountConvention")
        .value("CALENDAR_DAYS", ivgreeks::DayCountConvention::CalendarDays)
        .value("BUSINESS_DAYS", ivgreeks::DayCountConvention::BusinessDays)
        .value("TRADING_DAYS", ivgreeks::DayCountConvention::TradingDays);

    py::enum_<ivgreeks::ExpiryType>(m, "ExpiryType")
        .value("WEEKLY", ivgreeks::ExpiryType::Weekly)
        .value("MONTHLY", ivgreeks::ExpiryType::Monthly);

    py::enum_<ivgreeks::MatchProfile>(m, "MatchProfile")
        .value("NSE", ivgreeks::MatchProfile::Nse)
        .value("CUSTOM", ivgreeks::MatchProfile::Custom)
        .value("SENSIBULL", ivgreeks::MatchProfile::Sensibull);

    py::enum_<ivgreeks::ValuationMode>(m, "ValuationMode")
        .value("FIXED", ivgreeks::ValuationMode::Fixed)
        .value("DYNAMIC", ivgreeks::ValuationMode::Dynamic);

    py::class_<ivgreeks::SolverSettings>(m, "SolverSettings")
        .def(py::init<>())
        .def_readwrite("lower", &ivgreeks::SolverSettings::lower)
        .def_readwrite("upper", &ivgreeks::SolverSettings::upper)
        .def_readwrite("tolerance", &ivgreeks::SolverSettings::tolerance)
        .def_readwrite("max_iterations",
                       &ivgreeks::SolverSettings::max_iterations)
        .def_readwrite("guess", &ivgreeks::SolverSettings::guess);

    // Times are seconds since midnight.
    py::class_<ivgreeks::SessionTimes>(m, "SessionTimes")
        .def(py::init<>())
        .def_readwrite("expiry_close", &ivgreeks::SessionTimes::expiry_close)
        .def_readwrite("session_offset",
                       &ivgreeks::SessionTimes::session_offset);

    py::class_<ivgreeks::EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_readwrite("day_count", &ivgreeks::EngineConfig::day_count)
        .def_readwrite("risk_free_rate_percent",
                       &ivgreeks::EngineConfig::risk_free_rate_percent)
        .def_readwrite("premium_floor", &ivgreeks::EngineConfig::premium_floor)
        .def_readwrite("parity_tolerance",
                       &ivgreeks::EngineConfig::parity_tolerance)
        .def_readwrite("fallback_rate_percent",
                       &ivgreeks::EngineConfig::fallback_rate_percent)
        .def_readwrite("use_otm_liquidity",
                       &ivgreeks::EngineConfig::use_otm_liquidity)
        .def_readwrite("solver", &ivgreeks::EngineConfig::solver)
        .def_readwrite("session", &ivgreeks::EngineConfig::session)
        .def_property(
            "holidays",
            [](const ivgreeks::EngineConfig& c) {
                py::list out;
                for (const auto& d : c.holidays)
                    out.append(to_py_date(d));
                return out;
            },
            [](ivgreeks::EngineConfig& c, const py::iterable& dates) {
                std::vector<QuantLib::Date> holidays;
                for (const auto& d : dates)
                    holidays.push_back(from_py_date(d));
                c.holidays = std::move(holidays);
            });

    m.def("load_engine_config", &ivgreeks::load_engine_config, py::arg("path"));

    py::class_<ivgreeks::ValuationContext>(m, "ValuationContext")
        .def(py::init([](double future_price, double atm_strike,
                         double atm_call_premium, double atm_put_premium,
                         TimePoint expiry, std::optional<double> strike,
                         std::optional<double> call_premium,
                         std::optional<double> put_premium,
                         ivgreeks::ExpiryType expiry_type,
                         std::optional<TimePoint> valuation_time,
                         ivgreeks::MatchProfile profile,
                         std::optional<ivgreeks::DayCountConvention> day_count,
                         std::optional<double> risk_free_rate_percent,
                         const ivgreeks::EngineConfig& config) {
                 ivgreeks::ContextOptions options;
                 options.strike = strike;
                 options.call_premium = call_premium;
                 options.put_premium = put_premium;
                 options.expiry_type = expiry_type;
                 options.valuation_time = to_timestamp(valuation_time);
                 options.profile = profile;
                 options.day_count = day_count;
                 options.risk_free_rate_percent = risk_free_rate_percent;
                 return ivgreeks::ValuationContext(
                     {future_price, atm_strike, atm_call_premium,
                      atm_put_premium},
                     ivgreeks::from_time_point(expiry), options, config);
             }),
             py::arg("future_price"), py::arg("atm_strike"),
             py::arg("atm_call_premium"), py::arg("atm_put_premium"),
             py::arg("expiry"), py::arg("strike") = py::none(),
             py::arg("call_premium") = py::none(),
             py::arg("put_premium") = py::none(),
             py::arg("expiry_type") = ivgreeks::ExpiryType::Monthly,
             py::arg("valuation_time") = py::none(),
             py::arg("profile") = ivgreeks::MatchProfile::Custom,
             py::arg("day_count") = py::none(),
             py::arg("risk_free_rate_percent") = py::none(),
             py::arg("config") = ivgreeks::EngineConfig{})
        .def("update",
             [](ivgreeks::ValuationContext& self, double future_price,
                double atm_strike, double atm_call_premium,
                double atm_put_premium,
                std::optional<TimePoint> valuation_time) {
                 self.update({future_price, atm_strike, atm_call_premium,
                              atm_put_premium},
                             to_timestamp(valuation_time));
             },
             py::arg("future_price"), py::arg("atm_strike"),
             py::arg("atm_call_premium"), py::arg("atm_put_premium"),
             py::arg("valuation_time") = py::none())
        .def("refresh", &ivgreeks::ValuationContext::refresh)
        .def("get_implied_vol_and_greeks",
             [](ivgreeks::ValuationContext& self, std::optional<double> strike,
                std::optional<double> call_premium,
                std::optional<double> put_premium,
                std::optional<bool> use_otm_liquidity) {
                 return report_to_dict(self.get_implied_vol_and_greeks(
                     strike, call_premium, put_premium, use_otm_liquidity));
             },
             py::arg("strike") = py::none(),
             py::arg("call_premium") = py::none(),
             py::arg("put_premium") = py::none(),
             py::arg("use_otm_liquidity") = py::none())
        .def("call_implied_vol",
             &ivgreeks::ValuationContext::call_implied_vol)
        .def("put_implied_vol", &ivgreeks::ValuationContext::put_implied_vol)
        .def_property_readonly("time_to_expiry",
                               &ivgreeks::ValuationContext::time_to_expiry)
        .def_property_readonly("mode", &ivgreeks::ValuationContext::mode)
        .def_property_readonly("rate", &ivgreeks::ValuationContext::rate)
        .def_property_readonly("parity_gap",
                               &ivgreeks::ValuationContext::parity_gap);

    m.def("find_atm_strike", &ivgreeks::find_atm_strike, py::arg("strikes"),
          py::arg("future_price"));

    m.def("risk_free_rate_percent",
          [](std::optional<std::string> payload,
             std::optional<double> fallback_percent,
             const ivgreeks::EngineConfig& config) {
              if (fallback_percent)
                  return ivgreeks::risk_free_rate_percent(payload,
                                                          *fallback_percent);
              return ivgreeks::risk_free_rate_percent(payload, config);
          },
          py::arg("payload") = py::none(),
          py::arg("fallback_percent") = py::none(),
          py::arg("config") = ivgreeks::EngineConfig{},
          R"(Rate in percent from the published T-bill feed (JSON text), or
        the fallback when the payload is missing or unusable. The fallback
        is `fallback_percent` when given, else config.fallback_rate_percent.)");

    m.def(
        "compute_chain",
        [](const ivgreeks::ValuationContext& context, py::object chain,
           std::optional<bool> use_otm_liquidity) -> py::object {
            // Import pyarrow table -> C++ Arrow table (needs GIL for PyArrow)
            auto table = ivgreeks::import_chain(chain);

            // Release GIL for the CPU-bound pricing so OpenMP threads can run
            std::shared_ptr<arrow::Table> result;
            {
                py::gil_scoped_release release;
                result = ivgreeks::compute_chain_table(context, table,
                                                       use_otm_liquidity);
            }
            return ivgreeks::export_chain(result);
        },
        py::arg("context"), py::arg("chain"),
        py::arg("use_otm_liquidity") = py::none(),
        R"(Price every strike of an option chain against one clock reading.

        Parameters
        ----------
        context : ValuationContext
            Series inputs; its clock is sampled once for the whole chain.
        chain : pyarrow.Table
            Must contain float64 columns: strike, call_premium, put_premium
            (premiums nullable).
        use_otm_liquidity : bool, optional
            Price off the OTM side's IV, or the average of both sides when
            False. Defaults to the context's EngineConfig.

        Returns
        -------
        pyarrow.Table
            Input columns plus: is_otm_call, impl_vol, call_iv, put_iv,
            call_delta, put_delta, theta, vega, gamma, rho_call, rho_put.
        )");
}
