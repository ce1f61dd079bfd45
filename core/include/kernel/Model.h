#ifndef MODEL_H
#define MODEL_H

#include <cstdint>
#include <vector>

#include "kernel/MetricsStore.h"
#include "kernel/RandomSource.h"
#include "modules/Country.h"
#include "modules/Parameters.h"

// ---------- Configuration ----------
struct ModelConfig {
    std::uint64_t seed = 42;
    PopulationSizes sizes;                      // citizens / businesses per country
    std::vector<CountryConfig> countries;       // empty: sizes.countries random countries
    CitizenParamsTable citizenParams;           // missing tiers use built-in ranges
    BusinessParamsTable businessParams;
};

// ---------- Model Engine ----------
// One simulated world. A step runs three sequential passes over every country
// (businesses, then citizens, then the country's macro update) and records
// the resulting metrics. Agents read state written earlier in the same pass.
class Model {
public:
    explicit Model(const ModelConfig& cfg);

    // Lifecycle
    void reset(const ModelConfig& cfg);
    void initialize(const std::vector<CountryConfig>& country_configs,
                    const CitizenParamsTable& citizen_params,
                    const BusinessParamsTable& business_params,
                    const PopulationSizes& sizes);
    void step();
    void stepN(int n);

    // Access
    const std::vector<Country>& countries() const { return countries_; }
    std::vector<Country>& countriesMut() { return countries_; }
    const Country& country(std::uint32_t index) const;
    Country& countryMut(std::uint32_t index);
    const MetricsStore& metrics() const { return metrics_; }
    std::uint64_t generation() const { return generation_; }
    const ModelConfig& config() const { return cfg_; }
    RandomSource& rng() { return rng_; }

    // Metrics (lightweight, averaged over countries)
    struct Metrics {
        double inflation = 0.0;
        double economicGrowth = 0.0;
        double interestRate = 0.0;
        double moneySupply = 0.0;
        double totalRevenue = 0.0;
        double governmentSpending = 0.0;
        double citizenHappiness = 0.0;
        double unemploymentRate = 0.0;
    };
    Metrics computeMetrics() const;

    // Detailed Statistics (for probing/analysis)
    struct Statistics {
        // Population
        std::uint32_t countries = 0;
        std::uint32_t citizens = 0;
        std::uint32_t employed = 0;
        std::uint32_t employedByBusinesses = 0;
        std::uint32_t unemployed = 0;
        std::uint32_t expertiseCounts[kExpertiseLevels] = {0, 0, 0, 0};

        // Citizens
        double avgHappiness = 0.0;
        double minHappiness = 0.0;
        double maxHappiness = 0.0;
        double avgSalary = 0.0;
        double avgSavings = 0.0;

        // Businesses
        std::uint32_t businesses = 0;
        std::uint32_t typeCounts[kBusinessTypes] = {0, 0, 0, 0, 0, 0};
        int totalCapacity = 0;
        int totalRoster = 0;
        double totalRevenue = 0.0;
        double totalProfit = 0.0;
        double totalBorrowing = 0.0;
        std::uint32_t profitableBusinesses = 0;
    };
    Statistics getStatistics() const;

private:
    ModelConfig cfg_;
    std::vector<Country> countries_;
    std::uint64_t generation_ = 0;
    RandomSource rng_;
    MetricsStore metrics_;

    void populate(Country& country,
                  const CitizenParamsTable& citizen_params,
                  const BusinessParamsTable& business_params,
                  const PopulationSizes& sizes);
};

#endif // MODEL_H
