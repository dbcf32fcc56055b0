/**
 * @file example_amortization.cc
 * @brief Loan payment and amortization schedule
 *
 * Prints the level payment for a 15-year mortgage and the first and last
 * rows of its schedule.
 */

#include "yieldsolve/tvm/amortization.hpp"
#include "yieldsolve/tvm/tvm.hpp"
#include <cstdio>
#include <iostream>

int main() {
    const double annual_rate = 0.075;
    const double rate = annual_rate / 12;
    const int periods = 180;
    const double principal = 200000.0;

    std::printf("Loan: %.2f at %.3f%% over %d months\n", principal, annual_rate * 100, periods);
    std::printf("Monthly payment: %.2f\n", -yieldsolve::pmt(rate, periods, principal));
    std::printf("Months to repay at 2500/month: %.1f\n\n",
                yieldsolve::nper(rate, -2500.0, principal));

    auto schedule = yieldsolve::amortization_schedule(rate, periods, principal);
    if (!schedule) {
        std::cerr << "Error: " << schedule.error() << "\n";
        return 1;
    }

    std::printf("%6s %10s %10s %10s %12s %12s %12s\n",
                "period", "payment", "interest", "principal",
                "cum int", "cum prin", "balance");

    auto print_row = [](const yieldsolve::AmortizationRow& row) {
        std::printf("%6d %10.2f %10.2f %10.2f %12.2f %12.2f %12.2f\n",
                    row.period, row.payment, row.interest, row.principal,
                    row.cumulative_interest, row.cumulative_principal,
                    row.remaining_balance);
    };

    for (size_t i = 0; i < 6; ++i) {
        print_row((*schedule)[i]);
    }
    std::printf("%6s\n", "...");
    for (size_t i = schedule->size() - 3; i < schedule->size(); ++i) {
        print_row((*schedule)[i]);
    }

    std::printf("\nTotal interest: %.2f\n", schedule->back().cumulative_interest);
    return 0;
}
