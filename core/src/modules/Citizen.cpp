#include "modules/Citizen.h"

#include <algorithm>

#include "kernel/RandomSource.h"
#include "modules/Business.h"
#include "modules/Country.h"
#include "utils/Validation.h"

namespace {
// Manufacturing businesses are preferred once import duties make local
// production noticeably attractive
constexpr double kManufacturingPreferenceBoost = 0.1;
constexpr double kEmployedSavingsShare = 0.1;
constexpr double kUnemployedSpendRate = 0.05;

bool matchesExpertise(const Citizen& citizen, const Business& business) {
    return business.hires(collarTierFor(citizen.expertise)) > 0;
}
}

Citizen Citizen::generate(const CitizenParams& params, RandomSource& rng) {
    Citizen c;
    c.salary = rng.uniformInt(params.salary.min, params.salary.max);
    c.expertise = static_cast<Expertise>(rng.weightedIndex(params.expertise_weights));
    c.values_social_services = rng.uniform(params.values_social_services.min, params.values_social_services.max);
    c.values_economic_freedom = rng.uniform(params.values_economic_freedom.min, params.values_economic_freedom.max);
    c.trust_in_government = rng.uniform(params.trust_in_government.min, params.trust_in_government.max);
    c.import_goods_preference = rng.uniform(params.import_goods_preference.min, params.import_goods_preference.max);
    c.import_price_sensitivity = rng.uniform(params.import_price_sensitivity.min, params.import_price_sensitivity.max);
    c.inflation_sensitivity = rng.uniform(params.inflation_sensitivity.min, params.inflation_sensitivity.max);
    c.savings = std::max(0.0, rng.uniform(params.savings.min, params.savings.max));
    c.employed = rng.bernoulli(params.initial_employment_rate);
    c.happiness = rng.uniformInt(40, 60);
    c.employer = kNone;
    c.employment_matches_expertise = false;
    return c;
}

bool Citizen::belongsTo(const Country& country) const {
    return country_index == static_cast<std::int32_t>(country.index());
}

void Citizen::seekEmployment(const Country& country, std::vector<Business>& businesses, RandomSource& rng) {
    if (!belongsTo(country) || employed) {
        return;
    }

    std::vector<std::size_t> candidates;
    candidates.reserve(businesses.size());
    for (std::size_t i = 0; i < businesses.size(); ++i) {
        if (businesses[i].hasOpenings()) {
            candidates.push_back(i);
        }
    }
    if (candidates.empty()) {
        return;
    }

    // Preference, not requirement: fall back to every opening when no
    // manufacturing business is hiring
    if (country.state().local_manufacturing_boost > kManufacturingPreferenceBoost) {
        std::vector<std::size_t> manufacturing;
        for (std::size_t idx : candidates) {
            if (isManufacturing(businesses[idx].type())) {
                manufacturing.push_back(idx);
            }
        }
        if (!manufacturing.empty()) {
            candidates = std::move(manufacturing);
        }
    }

    const std::size_t chosen = candidates[rng.index(candidates.size())];
    Business& business = businesses[chosen];
    if (business.hireEmployee(*this, rng)) {
        employed = true;
        employer = static_cast<std::int32_t>(chosen);
        if (matchesExpertise(*this, business)) {
            employment_matches_expertise = true;
        }
    }
}

void Citizen::updateHappiness(const Country& country, RandomSource& rng) {
    if (!belongsTo(country)) {
        return;
    }

    const PolicyLevers& policy = country.policy();
    const MacroState& macro = country.state();

    double economic_factor = 0.0;
    if (employed) {
        economic_factor = std::min(100.0, salary * (1.0 - policy.tax_rate));
    } else {
        economic_factor = std::min(50.0, policy.social_services_spending * 100.0);
    }

    const double social_services_satisfaction = values_social_services * policy.social_services_spending * 100.0;
    const double economic_freedom_satisfaction = values_economic_freedom * (1.0 - policy.tax_rate) * 100.0;
    const double trust_factor = trust_in_government * 20.0;
    const double import_price_impact =
        -import_goods_preference * import_price_sensitivity * policy.import_duty_rate * 100.0;
    // Unemployed citizens feel new local jobs far more
    const double employment_opportunity_impact =
        macro.local_manufacturing_boost * (employed ? 5.0 : 20.0);
    const double inflation_impact = -inflation_sensitivity * macro.inflation * 200.0;
    const double interest_impact = policy.interest_rate * savings * 0.2;

    const double target =
        HappinessWeights::kEconomic * economic_factor +
        HappinessWeights::kSocialServices * social_services_satisfaction +
        HappinessWeights::kEconomicFreedom * economic_freedom_satisfaction +
        HappinessWeights::kTrust * trust_factor +
        HappinessWeights::kImportPrices * import_price_impact +
        HappinessWeights::kEmploymentOpportunity * employment_opportunity_impact +
        HappinessWeights::kInflation * inflation_impact +
        HappinessWeights::kInterest * interest_impact +
        HappinessWeights::kNoise * rng.uniform(-10.0, 10.0);

    happiness = HappinessWeights::kStickiness * happiness + (1.0 - HappinessWeights::kStickiness) * target;
    happiness = std::clamp(happiness, 0.0, 100.0);

    if (employed) {
        const double change = salary * kEmployedSavingsShare +
                              savings * policy.interest_rate -
                              savings * macro.inflation;
        savings = std::max(0.0, savings + change);
    } else {
        savings = std::max(0.0, savings * (1.0 - macro.inflation - kUnemployedSpendRate));
    }

    validation::checkRange(happiness, 0.0, 100.0, "citizen happiness");
    validation::checkNonNegative(savings, "citizen savings");
}
