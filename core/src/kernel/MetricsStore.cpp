#include "kernel/MetricsStore.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "modules/Country.h"

namespace {
constexpr std::array<const char*, kMetricCount> kMetricNames = {
    "inflation",
    "economic_growth",
    "tax_revenue",
    "import_duty_revenue",
    "total_revenue",
    "citizen_happiness",
    "local_manufacturing_boost",
    "money_supply",
    "interest_rate",
    "central_bank_policy",
    "government_spending",
    "money_velocity",
    "unemployment_rate"
};
}

const char* metricName(Metric m) {
    return kMetricNames[static_cast<std::size_t>(m)];
}

Metric metricFromName(const std::string& name) {
    for (std::size_t i = 0; i < kMetricCount; ++i) {
        if (name == kMetricNames[i]) {
            return static_cast<Metric>(i);
        }
    }
    throw std::out_of_range("Unknown metric '" + name + "'");
}

void MetricsStore::reset(std::uint32_t countries) {
    series_.assign(countries, {});
}

void MetricsStore::append(std::uint32_t country, const Country& state) {
    const MacroState& macro = state.state();
    append(country, Metric::Inflation, macro.inflation);
    append(country, Metric::EconomicGrowth, macro.economic_growth);
    append(country, Metric::TaxRevenue, macro.tax_revenue);
    append(country, Metric::ImportDutyRevenue, macro.import_duty_revenue);
    append(country, Metric::TotalRevenue, macro.total_revenue);
    append(country, Metric::CitizenHappiness, macro.citizen_happiness);
    append(country, Metric::LocalManufacturingBoost, macro.local_manufacturing_boost);
    append(country, Metric::MoneySupply, macro.money_supply);
    append(country, Metric::InterestRate, state.policy().interest_rate);
    append(country, Metric::CentralBankPolicy, macro.central_bank_policy);
    append(country, Metric::GovernmentSpending, macro.government_spending);
    append(country, Metric::MoneyVelocity, macro.money_velocity);
    append(country, Metric::UnemploymentRate, state.unemploymentRate());
}

void MetricsStore::append(std::uint32_t country, Metric metric, double value) {
    if (country >= series_.size()) {
        throw std::out_of_range("MetricsStore: country index " + std::to_string(country) +
                                " out of range (" + std::to_string(series_.size()) + " countries)");
    }
    if (static_cast<std::size_t>(metric) >= kMetricCount) {
        throw std::out_of_range("MetricsStore: invalid metric");
    }
    series_[country][static_cast<std::size_t>(metric)].push_back(value);
}

std::size_t MetricsStore::length() const {
    std::size_t shortest = 0;
    bool first = true;
    for (const auto& country : series_) {
        for (const auto& s : country) {
            shortest = first ? s.size() : std::min(shortest, s.size());
            first = false;
        }
    }
    return shortest;
}

const MetricsStore::Series& MetricsStore::series(std::uint32_t country, Metric metric) const {
    if (country >= series_.size()) {
        throw std::out_of_range("MetricsStore: country index " + std::to_string(country) +
                                " out of range (" + std::to_string(series_.size()) + " countries)");
    }
    if (static_cast<std::size_t>(metric) >= kMetricCount) {
        throw std::out_of_range("MetricsStore: invalid metric");
    }
    return series_[country][static_cast<std::size_t>(metric)];
}

const MetricsStore::Series& MetricsStore::series(std::uint32_t country, const std::string& metric) const {
    return series(country, metricFromName(metric));
}

double MetricsStore::tailMean(std::uint32_t country, Metric metric, std::size_t window) const {
    const Series& s = series(country, metric);
    if (s.empty() || window == 0) {
        return 0.0;
    }
    const std::size_t n = std::min(window, s.size());
    const double sum = std::accumulate(s.end() - static_cast<std::ptrdiff_t>(n), s.end(), 0.0);
    return sum / static_cast<double>(n);
}
