#ifndef CITIZEN_H
#define CITIZEN_H

#include <cstdint>
#include <vector>

#include "modules/EconomyTypes.h"
#include "modules/Parameters.h"

class Business;
class Country;
class RandomSource;

// Happiness factor weights (economic, social services, economic freedom,
// trust, import prices, employment opportunity, inflation, interest, noise)
namespace HappinessWeights {
    constexpr double kEconomic = 0.30;
    constexpr double kSocialServices = 0.15;
    constexpr double kEconomicFreedom = 0.15;
    constexpr double kTrust = 0.08;
    constexpr double kImportPrices = 0.08;
    constexpr double kEmploymentOpportunity = 0.08;
    constexpr double kInflation = 0.08;
    constexpr double kInterest = 0.05;
    constexpr double kNoise = 0.03;

    constexpr double kStickiness = 0.7;  // share of previous happiness kept per step
}

// ---------- Citizen ----------
struct Citizen {
    static constexpr std::int32_t kNone = -1;

    // Identity
    std::uint32_t id = 0;                  // index in the owning country's citizen list
    std::int32_t country_index = kNone;    // owning country, kNone when unattached

    // Economic state
    double salary = 50.0;
    double happiness = 50.0;               // 0..100
    double savings = 0.0;                  // never negative
    bool employed = false;
    std::int32_t employer = kNone;         // business index within the same country
    bool employment_matches_expertise = false;

    // Immutable traits (0..1)
    Expertise expertise = Expertise::Medium;
    double values_social_services = 0.5;
    double values_economic_freedom = 0.5;
    double trust_in_government = 0.5;
    double import_goods_preference = 0.5;
    double import_price_sensitivity = 0.5;
    double inflation_sensitivity = 0.5;

    bool attached() const { return country_index != kNone; }
    bool hasEmployer() const { return employer != kNone; }

    // Draw a citizen from one tier's ranges. Initially employed citizens
    // hold work outside the simulated firms and carry no employer.
    static Citizen generate(const CitizenParams& params, RandomSource& rng);

    // Look for a job among the country's businesses with openings
    void seekEmployment(const Country& country, std::vector<Business>& businesses, RandomSource& rng);

    // Sticky happiness update followed by the savings update
    void updateHappiness(const Country& country, RandomSource& rng);

    // Drop the employer link (layoff)
    void becomeUnemployed() {
        employed = false;
        employer = kNone;
    }

private:
    bool belongsTo(const Country& country) const;
};

#endif
