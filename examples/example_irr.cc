/**
 * @file example_irr.cc
 * @brief IRR, XIRR and NPV with std::expected error handling
 *
 * Demonstrates:
 * - Periodic IRR and checking convergence
 * - XIRR from ISO date strings, verified with XNPV
 * - Validation errors for malformed input
 * - Series that have no rate (no sign change)
 */

#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/tvm/tvm.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace yieldsolve;

namespace {

void print_result(const std::string& label,
                  const std::expected<RateResult, ValidationError>& result) {
    std::cout << label << ": ";
    if (!result.has_value()) {
        std::cout << "invalid input, " << result.error() << "\n";
        return;
    }
    if (!result->converged) {
        std::cout << "did not converge after " << result->iterations
                  << " steps (|NPV| = " << result->final_error << ")\n";
        return;
    }
    std::cout << std::setprecision(10) << *result->rate
              << " (" << result->iterations << " steps)\n";
}

}  // namespace

int main() {
    std::cout << "=== Periodic IRR ===\n";
    std::vector<double> project{-100.0, 39.0, 59.0, 55.0, 20.0};
    auto project_irr = irr(project);
    print_result("Project IRR", project_irr);

    if (project_irr && project_irr->converged) {
        std::cout << "NPV at IRR: " << npv(*project_irr->rate, project) << "\n";
        std::cout << "NPV at 8%:  " << npv(0.08, project) << "\n";
    }

    std::vector<double> outlay_then_return{-100.0, 0.0, 0.0, 74.0};
    print_result("Losing investment", irr(outlay_then_return));

    std::cout << "\n=== XIRR (irregular dates) ===\n";
    std::vector<double> amounts{-10000.0, 2750.0, 4250.0, 3250.0, 2750.0};
    std::vector<std::string> dates{
        "2008-01-01", "2008-03-01", "2008-10-30", "2009-02-15", "2009-04-01"};

    auto dated = xirr(amounts, dates);
    print_result("XIRR", dated);
    if (dated && dated->converged) {
        auto check = xnpv(*dated->rate, amounts, dates);
        if (check) {
            std::cout << "XNPV at XIRR: " << *check << "\n";
        }
    }

    std::cout << "\n=== MIRR ===\n";
    std::vector<double> mixed{-100.0, 50.0, -60.0, 70.0};
    auto modified = mirr(mixed, 0.10, 0.12);
    if (modified) {
        std::cout << "MIRR (finance 10%, reinvest 12%): " << *modified << "\n";
    } else {
        std::cout << "MIRR failed: " << modified.error() << "\n";
    }

    std::cout << "\n=== Error handling ===\n";
    std::vector<double> empty;
    print_result("Empty series", irr(empty));

    std::vector<std::string> bad_dates{"2008-01-01", "2008-02-30", "2009-04-01",
                                       "2009-05-01", "2009-06-01"};
    print_result("Bad date", xirr(amounts, bad_dates));

    std::vector<double> all_inflows{100.0, 50.0, 25.0};
    print_result("No sign change", irr(all_inflows));

    return 0;
}
