#ifndef METRICS_STORE_H
#define METRICS_STORE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class Country;

enum class Metric : std::uint8_t {
    Inflation = 0,
    EconomicGrowth,
    TaxRevenue,
    ImportDutyRevenue,
    TotalRevenue,
    CitizenHappiness,
    LocalManufacturingBoost,
    MoneySupply,
    InterestRate,
    CentralBankPolicy,
    GovernmentSpending,
    MoneyVelocity,
    UnemploymentRate,
    COUNT
};

constexpr std::size_t kMetricCount = static_cast<std::size_t>(Metric::COUNT);

const char* metricName(Metric m);
// Throws std::out_of_range for unknown names
Metric metricFromName(const std::string& name);

// Append-only per-country time series, one value per metric per step
class MetricsStore {
public:
    using Series = std::vector<double>;

    void reset(std::uint32_t countries);

    // Record every metric of the country's current state
    void append(std::uint32_t country, const Country& state);
    void append(std::uint32_t country, Metric metric, double value);

    std::uint32_t countries() const { return static_cast<std::uint32_t>(series_.size()); }
    // Number of recorded steps (length of the shortest series)
    std::size_t length() const;

    // Throw std::out_of_range for an unknown country or metric name
    const Series& series(std::uint32_t country, Metric metric) const;
    const Series& series(std::uint32_t country, const std::string& metric) const;

    // Mean of the last `window` values; all values when fewer, 0 when empty
    double tailMean(std::uint32_t country, Metric metric, std::size_t window) const;

private:
    std::vector<std::array<Series, kMetricCount>> series_;
};

#endif
