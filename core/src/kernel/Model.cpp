#include "kernel/Model.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

Model::Model(const ModelConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

void Model::reset(const ModelConfig& cfg) {
    cfg_ = cfg;
    rng_.seed(cfg.seed);
    initialize(cfg_.countries, cfg_.citizenParams, cfg_.businessParams, cfg_.sizes);
}

void Model::initialize(const std::vector<CountryConfig>& country_configs,
                       const CitizenParamsTable& citizen_params,
                       const BusinessParamsTable& business_params,
                       const PopulationSizes& sizes) {
    countries_.clear();
    generation_ = 0;

    const std::uint32_t count = country_configs.empty()
        ? sizes.countries
        : static_cast<std::uint32_t>(country_configs.size());
    countries_.reserve(count);

    // Countries first, then each country's population
    const CountryConfig defaults{};
    for (std::uint32_t i = 0; i < count; ++i) {
        const CountryConfig& cfg = country_configs.empty() ? defaults : country_configs[i];
        countries_.emplace_back(i, cfg, rng_);
    }
    for (auto& country : countries_) {
        populate(country, citizen_params, business_params, sizes);
    }

    metrics_.reset(count);
}

void Model::populate(Country& country,
                     const CitizenParamsTable& citizen_params,
                     const BusinessParamsTable& business_params,
                     const PopulationSizes& sizes) {
    const CitizenParams builtin_citizen{};
    const BusinessParams builtin_business{};

    const DevelopmentTier tier = country.tier();
    const CitizenParams* cp = citizen_params.forTier(tier);
    const BusinessParams* bp = business_params.forTier(tier);

    country.citizensMut().reserve(sizes.citizens_per_country);
    for (std::uint32_t i = 0; i < sizes.citizens_per_country; ++i) {
        country.addCitizen(Citizen::generate(cp ? *cp : builtin_citizen, rng_));
    }

    country.businessesMut().reserve(sizes.businesses_per_country);
    for (std::uint32_t i = 0; i < sizes.businesses_per_country; ++i) {
        country.addBusiness(Business::generate(bp ? *bp : builtin_business, rng_));
    }
}

void Model::step() {
    for (auto& country : countries_) {
        country.updateBusinesses(rng_);
    }
    for (auto& country : countries_) {
        country.updateCitizens(rng_);
    }
    for (auto& country : countries_) {
        country.updateExternalFactors(rng_);
        metrics_.append(country.index(), country);
    }
    ++generation_;
}

void Model::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

const Country& Model::country(std::uint32_t index) const {
    if (index >= countries_.size()) {
        throw std::out_of_range("Country index " + std::to_string(index) + " out of range (" +
                                std::to_string(countries_.size()) + " countries)");
    }
    return countries_[index];
}

Country& Model::countryMut(std::uint32_t index) {
    if (index >= countries_.size()) {
        throw std::out_of_range("Country index " + std::to_string(index) + " out of range (" +
                                std::to_string(countries_.size()) + " countries)");
    }
    return countries_[index];
}

Model::Metrics Model::computeMetrics() const {
    Metrics m;
    if (countries_.empty()) {
        return m;
    }

    for (const auto& country : countries_) {
        const MacroState& s = country.state();
        m.inflation += s.inflation;
        m.economicGrowth += s.economic_growth;
        m.interestRate += country.policy().interest_rate;
        m.moneySupply += s.money_supply;
        m.totalRevenue += s.total_revenue;
        m.governmentSpending += s.government_spending;
        m.citizenHappiness += s.citizen_happiness;
        m.unemploymentRate += country.unemploymentRate();
    }

    const double inv = 1.0 / static_cast<double>(countries_.size());
    m.inflation *= inv;
    m.economicGrowth *= inv;
    m.interestRate *= inv;
    m.moneySupply *= inv;
    m.totalRevenue *= inv;
    m.governmentSpending *= inv;
    m.citizenHappiness *= inv;
    m.unemploymentRate *= inv;
    return m;
}

Model::Statistics Model::getStatistics() const {
    Statistics stats;
    stats.countries = static_cast<std::uint32_t>(countries_.size());
    stats.minHappiness = std::numeric_limits<double>::max();
    stats.maxHappiness = std::numeric_limits<double>::lowest();

    double happiness_sum = 0.0;
    double salary_sum = 0.0;
    double savings_sum = 0.0;

    for (const auto& country : countries_) {
        for (const auto& c : country.citizens()) {
            stats.citizens++;
            if (c.employed) {
                stats.employed++;
                if (c.hasEmployer()) stats.employedByBusinesses++;
            } else {
                stats.unemployed++;
            }
            stats.expertiseCounts[static_cast<std::size_t>(c.expertise)]++;
            happiness_sum += c.happiness;
            salary_sum += c.salary;
            savings_sum += c.savings;
            stats.minHappiness = std::min(stats.minHappiness, c.happiness);
            stats.maxHappiness = std::max(stats.maxHappiness, c.happiness);
        }

        for (const auto& b : country.businesses()) {
            stats.businesses++;
            stats.typeCounts[static_cast<std::size_t>(b.type())]++;
            stats.totalCapacity += b.maxEmployees();
            stats.totalRoster += static_cast<int>(b.employees().size());
            stats.totalRevenue += b.revenue();
            stats.totalProfit += b.profit();
            stats.totalBorrowing += b.borrowing();
            if (b.profit() > 0.0) stats.profitableBusinesses++;
        }
    }

    if (stats.citizens > 0) {
        const double inv = 1.0 / stats.citizens;
        stats.avgHappiness = happiness_sum * inv;
        stats.avgSalary = salary_sum * inv;
        stats.avgSavings = savings_sum * inv;
    } else {
        stats.minHappiness = 0.0;
        stats.maxHappiness = 0.0;
    }

    return stats;
}
