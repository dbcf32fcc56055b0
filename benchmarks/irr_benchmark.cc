/**
 * @file irr_benchmark.cc
 * @brief Rate solver throughput: single IRR/XIRR solves and parallel batches
 *
 * Measures:
 * 1. Single IRR solve vs. series length (early-exit vs. fixed-step)
 * 2. Single XIRR solve on a monthly schedule
 * 3. Batch IRR throughput (OpenMP when available)
 * 4. Amortization schedule generation
 */

#include <benchmark/benchmark.h>
#include <chrono>
#include <vector>

#include "yieldsolve/cashflow/irr.hpp"
#include "yieldsolve/cashflow/irr_batch.hpp"
#include "yieldsolve/tvm/amortization.hpp"

namespace yieldsolve {
namespace {

// Investment followed by n-1 level inflows yielding ~8% per period
std::vector<double> make_level_series(size_t n) {
    std::vector<double> flows(n, 0.0);
    flows[0] = -1000.0;
    const double coupon = 1080.0 / static_cast<double>(n - 1) + 40.0;
    for (size_t i = 1; i < n; ++i) {
        flows[i] = coupon;
    }
    return flows;
}

// Monthly schedule starting 2020-01-01
DatedCashflows make_monthly_schedule(size_t n) {
    DatedCashflows dc;
    dc.amounts = make_level_series(n);
    const std::chrono::year_month_day start{std::chrono::year{2020} / 1 / 1};
    for (size_t i = 0; i < n; ++i) {
        dc.dates.push_back(Date{start + std::chrono::months{static_cast<int>(i)}});
    }
    return dc;
}

static void BM_IRR_EarlyExit(benchmark::State& state) {
    auto flows = make_level_series(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = irr(flows);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("early exit");
}

static void BM_IRR_FixedStep(benchmark::State& state) {
    auto flows = make_level_series(static_cast<size_t>(state.range(0)));
    const RateSolverConfig config{.early_exit = false};

    for (auto _ : state) {
        auto result = irr(flows, config);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("fixed 16 steps");
}

static void BM_XIRR_Monthly(benchmark::State& state) {
    auto schedule = make_monthly_schedule(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto result = xirr(schedule.amounts, schedule.dates);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_IRR_Batch(benchmark::State& state) {
    const size_t n_series = static_cast<size_t>(state.range(0));
    std::vector<std::vector<double>> portfolio;
    portfolio.reserve(n_series);
    for (size_t i = 0; i < n_series; ++i) {
        portfolio.push_back(make_level_series(12 + i % 48));
    }

    for (auto _ : state) {
        auto batch = solve_irr_batch(portfolio);
        benchmark::DoNotOptimize(batch.failed_count);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n_series));
}

static void BM_AmortizationSchedule(benchmark::State& state) {
    const int periods = static_cast<int>(state.range(0));

    for (auto _ : state) {
        auto schedule = amortization_schedule(0.065 / 12, periods, 350000.0);
        benchmark::DoNotOptimize(schedule);
    }
}

BENCHMARK(BM_IRR_EarlyExit)->Arg(5)->Arg(30)->Arg(120)->Arg(360);
BENCHMARK(BM_IRR_FixedStep)->Arg(5)->Arg(30)->Arg(120)->Arg(360);
BENCHMARK(BM_XIRR_Monthly)->Arg(12)->Arg(60)->Arg(240);
BENCHMARK(BM_IRR_Batch)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Unit(benchmark::kMillisecond);
BENCHMARK(BM_AmortizationSchedule)->Arg(180)->Arg(360);

}  // namespace
}  // namespace yieldsolve

BENCHMARK_MAIN();
