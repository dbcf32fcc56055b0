// SPDX-License-Identifier: MIT
/**
 * @file yieldsolve_bindings.cpp
 * @brief Python bindings for the yieldsolve library using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>
#include <vector>
#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/cashflow/irr_batch.hpp"
#include "yieldsolve/tvm/amortization.hpp"
#include "yieldsolve/tvm/tvm.hpp"

namespace py = pybind11;

namespace {

// Validation errors surface as ValueError
template <typename T>
T unwrap_or_throw(std::expected<T, yieldsolve::ValidationError> result, const char* what) {
    if (!result.has_value()) {
        std::ostringstream oss;
        oss << what << ": " << result.error();
        throw py::value_error(oss.str());
    }
    return std::move(result.value());
}

yieldsolve::RateSolverConfig make_config(double guess, double tolerance,
                                         size_t max_iter, bool early_exit) {
    return yieldsolve::RateSolverConfig{
        .guess = guess,
        .tolerance = tolerance,
        .max_iter = max_iter,
        .early_exit = early_exit
    };
}

}  // namespace

PYBIND11_MODULE(yieldsolve, m) {
    m.doc() = "Python bindings for yieldsolve IRR/XIRR and time-value-of-money formulas";

    py::enum_<yieldsolve::PaymentTiming>(m, "PaymentTiming")
        .value("END", yieldsolve::PaymentTiming::End)
        .value("BEGIN", yieldsolve::PaymentTiming::Begin);

    py::class_<yieldsolve::RateResult>(m, "RateResult")
        .def_readonly("rate", &yieldsolve::RateResult::rate)
        .def_readonly("iterations", &yieldsolve::RateResult::iterations)
        .def_readonly("converged", &yieldsolve::RateResult::converged)
        .def_readonly("final_error", &yieldsolve::RateResult::final_error)
        .def("__repr__", [](const yieldsolve::RateResult& r) {
            std::ostringstream oss;
            oss << "<RateResult rate=";
            if (r.rate) {
                oss << *r.rate;
            } else {
                oss << "None";
            }
            oss << " iterations=" << r.iterations
                << " converged=" << (r.converged ? "True" : "False") << ">";
            return oss.str();
        });

    py::class_<yieldsolve::AmortizationRow>(m, "AmortizationRow")
        .def_readonly("period", &yieldsolve::AmortizationRow::period)
        .def_readonly("payment", &yieldsolve::AmortizationRow::payment)
        .def_readonly("interest", &yieldsolve::AmortizationRow::interest)
        .def_readonly("principal", &yieldsolve::AmortizationRow::principal)
        .def_readonly("cumulative_interest", &yieldsolve::AmortizationRow::cumulative_interest)
        .def_readonly("cumulative_principal", &yieldsolve::AmortizationRow::cumulative_principal)
        .def_readonly("remaining_balance", &yieldsolve::AmortizationRow::remaining_balance);

    m.def("irr",
        [](const std::vector<double>& cashflows, double guess, double tolerance,
           size_t max_iter, bool early_exit) {
            return unwrap_or_throw(
                yieldsolve::irr(cashflows, make_config(guess, tolerance, max_iter, early_exit)),
                "irr failed");
        },
        py::arg("cashflows"),
        py::arg("guess") = 0.1,
        py::arg("tolerance") = 1e-7,
        py::arg("max_iter") = yieldsolve::kMaxNewtonIterations,
        py::arg("early_exit") = true,
        R"pbdoc(
            Internal rate of return of evenly spaced cash flows.

            Returns:
                RateResult; rate is None when the solve did not converge

            Raises:
                ValueError: if cashflows is empty
        )pbdoc");

    m.def("xirr",
        [](const std::vector<double>& cashflows, const std::vector<std::string>& dates,
           double guess, double tolerance, size_t max_iter, bool early_exit) {
            return unwrap_or_throw(
                yieldsolve::xirr(cashflows, dates,
                                 make_config(guess, tolerance, max_iter, early_exit)),
                "xirr failed");
        },
        py::arg("cashflows"),
        py::arg("dates"),
        py::arg("guess") = 0.1,
        py::arg("tolerance") = 1e-7,
        py::arg("max_iter") = yieldsolve::kMaxNewtonIterations,
        py::arg("early_exit") = true,
        R"pbdoc(
            Internal rate of return of date-stamped cash flows (Actual/365).

            Args:
                cashflows: Amounts (negative = outflow)
                dates: ISO "YYYY-MM-DD" strings, same length as cashflows

            Raises:
                ValueError: on empty input, length mismatch or an invalid date
        )pbdoc");

    m.def("npv",
        [](double rate, const std::vector<double>& cashflows) {
            return yieldsolve::npv(rate, cashflows);
        },
        py::arg("rate"), py::arg("cashflows"));

    m.def("xnpv",
        [](double rate, const std::vector<double>& cashflows,
           const std::vector<std::string>& dates) {
            return unwrap_or_throw(yieldsolve::xnpv(rate, cashflows, dates), "xnpv failed");
        },
        py::arg("rate"), py::arg("cashflows"), py::arg("dates"));

    m.def("irr_batch",
        [](const std::vector<std::vector<double>>& series, double guess, double tolerance) {
            yieldsolve::BatchRateResult batch;
            {
                py::gil_scoped_release release;
                batch = yieldsolve::solve_irr_batch(
                    series, make_config(guess, tolerance, yieldsolve::kMaxNewtonIterations, true));
            }
            // Invalid series map to None, like non-converged rates
            py::list rates;
            for (const auto& r : batch.results) {
                if (r.has_value() && r->rate.has_value()) {
                    rates.append(*r->rate);
                } else {
                    rates.append(py::none());
                }
            }
            return rates;
        },
        py::arg("series"),
        py::arg("guess") = 0.1,
        py::arg("tolerance") = 1e-7,
        "Solve IRR for many series in parallel; returns a list of rates (None if unsolved)");

    m.def("xirr_batch",
        [](const std::vector<std::vector<double>>& amounts,
           const std::vector<std::vector<std::string>>& dates,
           double guess, double tolerance) {
            if (amounts.size() != dates.size()) {
                throw py::value_error("amounts and dates must contain the same number of series");
            }
            // Dates are parsed per series: a bad date yields None in its slot
            std::vector<yieldsolve::IsoDatedCashflows> series;
            series.reserve(amounts.size());
            for (size_t i = 0; i < amounts.size(); ++i) {
                series.push_back(yieldsolve::IsoDatedCashflows{
                    .amounts = amounts[i], .dates = dates[i]});
            }

            yieldsolve::BatchRateResult batch;
            {
                py::gil_scoped_release release;
                batch = yieldsolve::solve_xirr_batch(
                    series, make_config(guess, tolerance, yieldsolve::kMaxNewtonIterations, true));
            }
            py::list rates;
            for (const auto& r : batch.results) {
                if (r.has_value() && r->rate.has_value()) {
                    rates.append(*r->rate);
                } else {
                    rates.append(py::none());
                }
            }
            return rates;
        },
        py::arg("amounts"),
        py::arg("dates"),
        py::arg("guess") = 0.1,
        py::arg("tolerance") = 1e-7,
        "Solve XIRR for many series in parallel; None for unsolved or invalid series");

    m.def("fv", &yieldsolve::fv,
        py::arg("rate"), py::arg("nper"), py::arg("pmt"), py::arg("pv"),
        py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("pv", &yieldsolve::pv,
        py::arg("rate"), py::arg("nper"), py::arg("pmt"), py::arg("fv") = 0.0,
        py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("pmt", &yieldsolve::pmt,
        py::arg("rate"), py::arg("nper"), py::arg("pv"), py::arg("fv") = 0.0,
        py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("nper", &yieldsolve::nper,
        py::arg("rate"), py::arg("pmt"), py::arg("pv"), py::arg("fv") = 0.0,
        py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("ipmt",
        [](double rate, double per, double nper, double pv, double fv,
           yieldsolve::PaymentTiming when) {
            return unwrap_or_throw(yieldsolve::ipmt(rate, per, nper, pv, fv, when),
                                   "ipmt failed");
        },
        py::arg("rate"), py::arg("per"), py::arg("nper"), py::arg("pv"),
        py::arg("fv") = 0.0, py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("ppmt",
        [](double rate, double per, double nper, double pv, double fv,
           yieldsolve::PaymentTiming when) {
            return unwrap_or_throw(yieldsolve::ppmt(rate, per, nper, pv, fv, when),
                                   "ppmt failed");
        },
        py::arg("rate"), py::arg("per"), py::arg("nper"), py::arg("pv"),
        py::arg("fv") = 0.0, py::arg("when") = yieldsolve::PaymentTiming::End);

    m.def("mirr",
        [](const std::vector<double>& cashflows, double finance_rate, double reinvest_rate) {
            return unwrap_or_throw(yieldsolve::mirr(cashflows, finance_rate, reinvest_rate),
                                   "mirr failed");
        },
        py::arg("cashflows"), py::arg("finance_rate"), py::arg("reinvest_rate"));

    m.def("amortization_schedule",
        [](double rate, int nper, double pv, double fv, yieldsolve::PaymentTiming when) {
            return unwrap_or_throw(
                yieldsolve::amortization_schedule(rate, nper, pv, fv, when),
                "amortization_schedule failed");
        },
        py::arg("rate"), py::arg("nper"), py::arg("pv"), py::arg("fv") = 0.0,
        py::arg("when") = yieldsolve::PaymentTiming::End,
        "Per-period schedule as a list of AmortizationRow");
}
