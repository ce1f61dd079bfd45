#include "modules/PolicySweep.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <omp.h>

namespace {
constexpr int kBudgetTrialSteps = 5;
constexpr std::size_t kBudgetTrialWindow = 3;

void validateSettings(const SweepSettings& settings) {
    if (settings.steps < 1) {
        throw std::invalid_argument("Sweep steps must be >= 1 (got " + std::to_string(settings.steps) + ")");
    }
    if (settings.runs < 1) {
        throw std::invalid_argument("Sweep runs must be >= 1 (got " + std::to_string(settings.runs) + ")");
    }
}

// Levers of the sweep's base country record, library defaults where unset
PolicyLevers baseLevers(const SweepSettings& settings) {
    const PolicyLevers defaults{};
    const CountryConfig& c = settings.country;
    PolicyLevers levers;
    levers.tax_rate = c.tax_rate.value_or(defaults.tax_rate);
    levers.interest_rate = c.interest_rate.value_or(defaults.interest_rate);
    levers.social_services_spending = c.social_services_spending.value_or(defaults.social_services_spending);
    levers.immigration_incentives = c.immigration_incentives.value_or(defaults.immigration_incentives);
    levers.import_duty_rate = c.import_duty_rate.value_or(defaults.import_duty_rate);
    levers.bonds_issued = c.bonds_issued.value_or(defaults.bonds_issued);
    return levers;
}

ModelConfig buildModelConfig(const SweepSettings& settings, const PolicyLevers& levers, std::uint64_t seed) {
    ModelConfig cfg = settings.base;
    cfg.seed = seed;
    CountryConfig country = settings.country;
    country.applyPolicy(levers);
    cfg.countries.assign(std::max<std::uint32_t>(1, settings.countries), country);
    return cfg;
}

double tailAcrossCountries(const MetricsStore& store, Metric metric, std::size_t window) {
    if (store.countries() == 0) return 0.0;
    double sum = 0.0;
    for (std::uint32_t c = 0; c < store.countries(); ++c) {
        sum += store.tailMean(c, metric, window);
    }
    return sum / store.countries();
}

SweepOutcome averageOutcomes(const std::vector<SweepOutcome>& outcomes, std::size_t begin, std::size_t count) {
    SweepOutcome avg;
    avg.policy = outcomes[begin].policy;
    for (std::size_t i = begin; i < begin + count; ++i) {
        const auto& o = outcomes[i];
        avg.avgHappiness += o.avgHappiness;
        avg.avgGrowth += o.avgGrowth;
        avg.avgRevenue += o.avgRevenue;
        avg.avgSpending += o.avgSpending;
        avg.avgInflation += o.avgInflation;
        avg.avgMoneySupply += o.avgMoneySupply;
        avg.avgInterestRate += o.avgInterestRate;
    }
    const double inv = 1.0 / static_cast<double>(count);
    avg.avgHappiness *= inv;
    avg.avgGrowth *= inv;
    avg.avgRevenue *= inv;
    avg.avgSpending *= inv;
    avg.avgInflation *= inv;
    avg.avgMoneySupply *= inv;
    avg.avgInterestRate *= inv;
    return avg;
}

// Runs `job(i)` for i in [0, count) across OpenMP threads. Each job builds
// its own Model, so jobs share nothing. The first exception is rethrown
// after the loop.
template <typename Job>
void parallelJobs(long long count, Job job) {
    std::exception_ptr error;
    #pragma omp parallel for schedule(dynamic)
    for (long long i = 0; i < count; ++i) {
        try {
            job(i);
        } catch (...) {
            #pragma omp critical(sweep_error)
            {
                if (!error) error = std::current_exception();
            }
        }
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

// settings.runs runs of every point, averaged per point
std::vector<SweepOutcome> sweepPoints(const SweepSettings& settings, const std::vector<PolicyLevers>& points) {
    validateSettings(settings);
    const auto runs = static_cast<std::size_t>(settings.runs);
    const long long jobs = static_cast<long long>(points.size() * runs);

    std::cerr << "[Sweep] " << points.size() << " policy points x " << runs << " runs on "
              << omp_get_max_threads() << " threads\n";

    std::vector<SweepOutcome> raw(static_cast<std::size_t>(jobs));
    parallelJobs(jobs, [&](long long i) {
        const auto idx = static_cast<std::size_t>(i);
        raw[idx] = simulatePolicy(settings, points[idx / runs],
                                  RandomSource::deriveSeed(settings.base.seed, static_cast<std::uint64_t>(i)));
    });

    std::vector<SweepOutcome> grouped;
    grouped.reserve(points.size());
    for (std::size_t p = 0; p < points.size(); ++p) {
        grouped.push_back(averageOutcomes(raw, p * runs, runs));
    }
    return grouped;
}
}

CountryConfig richCountryConfig() {
    CountryConfig cfg;
    cfg.country_id = 1;
    cfg.name = "Rich Country";
    cfg.development_level = 0.9;
    cfg.wealth_level = 0.85;
    cfg.homogeneity = 0.7;
    cfg.applyPolicy(PolicyLevers{});
    cfg.external_influences = 50;
    return cfg;
}

PolicyGrid PolicyGrid::defaults() {
    PolicyGrid grid;
    grid.taxRates = linspace(0.2, 0.5, 4);
    grid.interestRates = linspace(0.01, 0.05, 3);
    grid.socialSpending = linspace(0.2, 0.6, 3);
    grid.immigrationIncentives = linspace(0.0, 0.1, 3);
    grid.importDutyRates = linspace(0.05, 0.3, 3);
    return grid;
}

std::vector<double> linspace(double a, double b, int n) {
    std::vector<double> values;
    if (n <= 0) return values;
    values.reserve(static_cast<std::size_t>(n));
    if (n == 1) {
        values.push_back(a);
        return values;
    }
    const double step = (b - a) / (n - 1);
    for (int i = 0; i < n; ++i) {
        values.push_back(i == n - 1 ? b : a + step * i);
    }
    return values;
}

SweepOutcome simulatePolicy(const SweepSettings& settings, const PolicyLevers& levers, std::uint64_t seed) {
    if (settings.steps < 1) {
        throw std::invalid_argument("Sweep steps must be >= 1 (got " + std::to_string(settings.steps) + ")");
    }

    Model model(buildModelConfig(settings, levers, seed));
    model.stepN(settings.steps);

    const MetricsStore& store = model.metrics();
    const std::size_t window = settings.tailWindow;
    SweepOutcome out;
    out.policy = levers;
    out.avgHappiness = tailAcrossCountries(store, Metric::CitizenHappiness, window);
    out.avgGrowth = tailAcrossCountries(store, Metric::EconomicGrowth, window);
    out.avgRevenue = tailAcrossCountries(store, Metric::TotalRevenue, window);
    out.avgSpending = tailAcrossCountries(store, Metric::GovernmentSpending, window);
    out.avgInflation = tailAcrossCountries(store, Metric::Inflation, window);
    out.avgMoneySupply = tailAcrossCountries(store, Metric::MoneySupply, window);
    out.avgInterestRate = tailAcrossCountries(store, Metric::InterestRate, window);
    return out;
}

std::vector<SweepOutcome> runDutyRateSweep(const SweepSettings& settings, const std::vector<double>& duty_rates) {
    std::vector<PolicyLevers> points;
    points.reserve(duty_rates.size());
    for (double duty : duty_rates) {
        PolicyLevers levers = baseLevers(settings);
        levers.import_duty_rate = duty;
        points.push_back(levers);
    }
    return sweepPoints(settings, points);
}

std::vector<SweepOutcome> runMonetaryPolicyAnalysis(const SweepSettings& settings,
                                                    const std::vector<double>& interest_rates) {
    std::vector<PolicyLevers> points;
    points.reserve(interest_rates.size());
    for (double rate : interest_rates) {
        PolicyLevers levers = baseLevers(settings);
        levers.interest_rate = rate;
        points.push_back(levers);
    }
    return sweepPoints(settings, points);
}

std::vector<SweepOutcome> runSensitivityAnalysis(const SweepSettings& settings,
                                                 double base_duty_rate,
                                                 double variation) {
    const double lo = std::max(0.0, base_duty_rate - variation);
    const double hi = std::min(1.0, base_duty_rate + variation);
    return runDutyRateSweep(settings, linspace(lo, hi, 5));
}

BudgetBalance balanceBudget(const SweepSettings& settings,
                            PolicyLevers levers,
                            std::uint64_t seed,
                            int max_iterations,
                            double tolerance) {
    SweepSettings trial = settings;
    trial.steps = kBudgetTrialSteps;
    trial.tailWindow = kBudgetTrialWindow;

    BudgetBalance result;
    result.policy = levers;

    for (int iteration = 0; iteration < max_iterations; ++iteration) {
        const SweepOutcome outcome =
            simulatePolicy(trial, levers, RandomSource::deriveSeed(seed, static_cast<std::uint64_t>(iteration)));
        result.policy = levers;
        result.avgRevenue = outcome.avgRevenue;
        result.avgSpending = outcome.avgSpending;
        result.iterations = iteration + 1;

        if (outcome.avgRevenue > 0.0 &&
            std::abs(outcome.avgSpending - outcome.avgRevenue) / outcome.avgRevenue <= tolerance) {
            result.balanced = true;
            return result;
        }

        const double deficit = outcome.avgSpending - outcome.avgRevenue;
        if (deficit > 0.0) {
            // Spend less or raise more
            if (levers.social_services_spending > 0.2) {
                levers.social_services_spending = std::max(0.2, levers.social_services_spending - 0.05);
            } else if (levers.tax_rate < 0.5) {
                levers.tax_rate = std::min(0.5, levers.tax_rate + 0.05);
            } else if (levers.import_duty_rate < 0.3) {
                levers.import_duty_rate = std::min(0.3, levers.import_duty_rate + 0.05);
            }
        } else {
            // Spend more or raise less
            if (levers.social_services_spending < 0.6) {
                levers.social_services_spending = std::min(0.6, levers.social_services_spending + 0.05);
            } else if (levers.tax_rate > 0.2) {
                levers.tax_rate = std::max(0.2, levers.tax_rate - 0.05);
            } else if (levers.import_duty_rate > 0.05) {
                levers.import_duty_rate = std::max(0.05, levers.import_duty_rate - 0.05);
            }
        }
    }

    return result;
}

std::vector<SweepOutcome> runPolicyCombinations(const SweepSettings& settings, const PolicyGrid& grid) {
    validateSettings(settings);

    std::vector<PolicyLevers> points;
    points.reserve(grid.size());
    const PolicyLevers base = baseLevers(settings);
    for (double tax : grid.taxRates) {
        for (double rate : grid.interestRates) {
            for (double social : grid.socialSpending) {
                for (double immigration : grid.immigrationIncentives) {
                    for (double duty : grid.importDutyRates) {
                        PolicyLevers levers = base;
                        levers.tax_rate = tax;
                        levers.interest_rate = rate;
                        levers.social_services_spending = social;
                        levers.immigration_incentives = immigration;
                        levers.import_duty_rate = duty;
                        points.push_back(levers);
                    }
                }
            }
        }
    }

    const auto runs = static_cast<std::size_t>(settings.runs);
    const long long jobs = static_cast<long long>(points.size() * runs);
    std::cerr << "[Sweep] Policy grid: " << points.size() << " combinations x " << runs << " runs on "
              << omp_get_max_threads() << " threads\n";

    std::vector<SweepOutcome> results(static_cast<std::size_t>(jobs));
    parallelJobs(jobs, [&](long long i) {
        const auto idx = static_cast<std::size_t>(i);
        const auto job = static_cast<std::uint64_t>(i);
        const BudgetBalance balanced =
            balanceBudget(settings, points[idx / runs], RandomSource::deriveSeed(settings.base.seed, 2 * job));
        results[idx] = simulatePolicy(settings, balanced.policy,
                                      RandomSource::deriveSeed(settings.base.seed, 2 * job + 1));
    });
    return results;
}
