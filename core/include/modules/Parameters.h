#ifndef PARAMETERS_H
#define PARAMETERS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "modules/EconomyTypes.h"

// ---------- Generation ranges ----------
struct Range {
    double min = 0.0;
    double max = 1.0;
};

struct IntRange {
    int min = 0;
    int max = 0;
};

// Government levers. interest_rate is also driven by the central bank each step.
struct PolicyLevers {
    double tax_rate = 0.35;
    double interest_rate = 0.02;
    double social_services_spending = 0.4;
    double immigration_incentives = 0.05;
    double import_duty_rate = 0.1;
    double bonds_issued = 0.0;
};

// One country record. Unset fields fall back to the built-in random draws.
struct CountryConfig {
    std::optional<int> country_id;
    std::optional<std::string> name;

    // Fixed traits
    std::optional<double> homogeneity;
    std::optional<double> development_level;
    std::optional<double> wealth_level;

    // Government levers
    std::optional<double> tax_rate;
    std::optional<double> interest_rate;
    std::optional<double> social_services_spending;
    std::optional<double> immigration_incentives;
    std::optional<double> import_duty_rate;
    std::optional<double> bonds_issued;

    std::optional<int> external_influences;

    // Overwrite every lever with the given values
    void applyPolicy(const PolicyLevers& levers) {
        tax_rate = levers.tax_rate;
        interest_rate = levers.interest_rate;
        social_services_spending = levers.social_services_spending;
        immigration_incentives = levers.immigration_incentives;
        import_duty_rate = levers.import_duty_rate;
        bonds_issued = levers.bonds_issued;
    }
};

// Citizen generation ranges for one development tier
struct CitizenParams {
    IntRange salary{40, 60};
    // low, medium, high, expert (normalised at draw time)
    std::array<double, kExpertiseLevels> expertise_weights = {0.25, 0.25, 0.25, 0.25};
    Range savings{10.0, 100.0};
    Range values_social_services{0.0, 1.0};
    Range values_economic_freedom{0.0, 1.0};
    Range trust_in_government{0.0, 1.0};
    Range import_goods_preference{0.2, 0.8};
    Range import_price_sensitivity{0.3, 1.0};
    Range inflation_sensitivity{0.3, 1.0};
    double initial_employment_rate = 0.8;
};

// Business generation ranges for one development tier
struct BusinessParams {
    // indexed by BusinessType (normalised at draw time)
    std::array<double, kBusinessTypes> type_weights = {1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
    Range automation_level{0.1, 0.9};
    Range size_factor{0.5, 2.0};
    Range investment_rate{0.1, 0.4};
    Range interest_rate_sensitivity{0.5, 1.5};
};

// Optional record per development tier; a missing tier means built-in defaults
template <typename Params>
struct TierTable {
    std::optional<Params> low;
    std::optional<Params> medium;
    std::optional<Params> high;

    const Params* forTier(DevelopmentTier tier) const {
        const std::optional<Params>* slot = &medium;
        if (tier == DevelopmentTier::Low) slot = &low;
        else if (tier == DevelopmentTier::High) slot = &high;
        return slot->has_value() ? &slot->value() : nullptr;
    }

    std::optional<Params>& slot(DevelopmentTier tier) {
        if (tier == DevelopmentTier::Low) return low;
        if (tier == DevelopmentTier::High) return high;
        return medium;
    }

    bool empty() const { return !low && !medium && !high; }
};

using CitizenParamsTable = TierTable<CitizenParams>;
using BusinessParamsTable = TierTable<BusinessParams>;

struct PopulationSizes {
    std::uint32_t countries = 1;  // used only when no country records are given
    std::uint32_t citizens_per_country = 100;
    std::uint32_t businesses_per_country = 10;
};

#endif
