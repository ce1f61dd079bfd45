#ifndef POLICY_SWEEP_H
#define POLICY_SWEEP_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "kernel/Model.h"
#include "modules/Parameters.h"

// ---------- Sweep configuration ----------
struct SweepSettings {
    ModelConfig base;            // population, tier tables and sweep seed
    CountryConfig country;       // record every swept country starts from
    std::uint32_t countries = 1; // copies of `country` per model
    int steps = 20;
    int runs = 5;                // independent runs per policy point
    std::size_t tailWindow = 5;  // steps averaged at the end of each run
};

// Default sweep country: a developed, wealthy economy
CountryConfig richCountryConfig();

// Averages over the tail window (then over countries and runs)
struct SweepOutcome {
    PolicyLevers policy;
    double avgHappiness = 0.0;
    double avgGrowth = 0.0;
    double avgRevenue = 0.0;
    double avgSpending = 0.0;
    double avgInflation = 0.0;
    double avgMoneySupply = 0.0;
    double avgInterestRate = 0.0;
};

struct BudgetBalance {
    PolicyLevers policy;
    double avgRevenue = 0.0;
    double avgSpending = 0.0;
    int iterations = 0;
    bool balanced = false;
};

// Lever values combined as a Cartesian product
struct PolicyGrid {
    std::vector<double> taxRates;
    std::vector<double> interestRates;
    std::vector<double> socialSpending;
    std::vector<double> immigrationIncentives;
    std::vector<double> importDutyRates;

    static PolicyGrid defaults();
    std::size_t size() const {
        return taxRates.size() * interestRates.size() * socialSpending.size() *
               immigrationIncentives.size() * importDutyRates.size();
    }
};

// n evenly spaced values from a to b inclusive
std::vector<double> linspace(double a, double b, int n);

// Simulates one model built from `settings` with `levers` applied to every
// country and summarises its tail window. Throws std::invalid_argument for
// steps < 1.
SweepOutcome simulatePolicy(const SweepSettings& settings, const PolicyLevers& levers, std::uint64_t seed);

// One outcome per duty rate, averaged over settings.runs runs
std::vector<SweepOutcome> runDutyRateSweep(const SweepSettings& settings,
                                           const std::vector<double>& duty_rates = linspace(0.0, 0.5, 6));

// One outcome per starting interest rate, averaged over settings.runs runs
std::vector<SweepOutcome> runMonetaryPolicyAnalysis(const SweepSettings& settings,
                                                    const std::vector<double>& interest_rates = linspace(0.01, 0.10, 5));

// Duty-rate sweep over five rates around base_duty_rate
std::vector<SweepOutcome> runSensitivityAnalysis(const SweepSettings& settings,
                                                 double base_duty_rate = 0.2,
                                                 double variation = 0.1);

// Nudges social spending, then taxes, then duties until the spending of a
// short trial run is within `tolerance` of its revenue
BudgetBalance balanceBudget(const SweepSettings& settings,
                            PolicyLevers levers,
                            std::uint64_t seed,
                            int max_iterations = 10,
                            double tolerance = 0.1);

// Every grid point, settings.runs times: balance the budget, then simulate.
// One outcome per run, in grid order.
std::vector<SweepOutcome> runPolicyCombinations(const SweepSettings& settings,
                                                const PolicyGrid& grid = PolicyGrid::defaults());

#endif
