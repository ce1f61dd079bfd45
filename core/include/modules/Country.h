#ifndef COUNTRY_H
#define COUNTRY_H

#include <cstdint>
#include <string>
#include <vector>

#include "modules/Business.h"
#include "modules/Citizen.h"
#include "modules/EconomyTypes.h"
#include "modules/Parameters.h"

class RandomSource;

// ---------- Macro bounds ----------
// Every emergent quantity is clamped into these ranges after it is computed.
namespace MacroBounds {
    constexpr double kInflationMin = 0.0;
    constexpr double kInflationMax = 0.2;
    constexpr double kGrowthMin = -0.05;
    constexpr double kGrowthMax = 0.1;
    constexpr double kInterestMin = 0.005;
    constexpr double kInterestMax = 0.12;
    constexpr double kPolicyMin = -0.2;
    constexpr double kPolicyMax = 0.2;
    constexpr double kVelocityMin = 1.2;
    constexpr double kVelocityMax = 3.0;
    constexpr double kMoneySupplyStep = 0.1;   // max relative change per step
    constexpr int kExternalMin = -100;
    constexpr int kExternalMax = 100;
    constexpr int kExternalStep = 10;
    constexpr double kDefaultHappiness = 50.0; // reported when there are no citizens
}

// Fixed at creation
struct CountryTraits {
    double homogeneity = 0.5;
    double development_level = 0.5;
    double wealth_level = 0.5;
};

// Derived every step by updateExternalFactors
struct MacroState {
    int external_influences = 0;
    double inflation = 0.02;
    double economic_growth = 0.02;
    double money_supply = 1000.0;
    double money_velocity = 2.0;
    double central_bank_policy = 0.0;
    double government_spending = 0.0;
    double tax_revenue = 0.0;
    double import_duty_revenue = 0.0;
    double total_revenue = 0.0;
    double bond_interest_rate = 0.03;
    double interest_payments = 0.0;
    double citizen_happiness = 0.0;
    double local_manufacturing_boost = 0.0;
    double gini_coefficient = 0.0;
};

class Country {
public:
    // Builds the country from a config record; absent fields are drawn from
    // the built-in ranges. All default draws happen regardless of which fields
    // are configured so the random stream does not depend on the record.
    Country(std::uint32_t index, const CountryConfig& cfg, RandomSource& rng);

    // Identity
    std::uint32_t index() const { return index_; }
    int id() const { return id_; }
    const std::string& name() const { return name_; }
    DevelopmentTier tier() const { return developmentTierFor(traits_.development_level); }

    // State
    const CountryTraits& traits() const { return traits_; }
    const PolicyLevers& policy() const { return policy_; }
    PolicyLevers& policyMut() { return policy_; }
    const MacroState& state() const { return state_; }
    MacroState& stateMut() { return state_; }

    // Population (owned)
    Citizen& addCitizen(Citizen citizen);
    Business& addBusiness(Business business);
    const std::vector<Citizen>& citizens() const { return citizens_; }
    std::vector<Citizen>& citizensMut() { return citizens_; }
    const std::vector<Business>& businesses() const { return businesses_; }
    std::vector<Business>& businessesMut() { return businesses_; }

    // Per-step passes, in the order the model calls them
    void updateBusinesses(RandomSource& rng);
    void updateCitizens(RandomSource& rng);
    void updateExternalFactors(RandomSource& rng);

    // Aggregates
    std::uint32_t employedCount() const;
    double unemploymentRate() const;
    int totalCapacity() const;
    int totalRoster() const;

private:
    std::uint32_t index_;
    int id_ = 0;
    std::string name_;

    CountryTraits traits_;
    PolicyLevers policy_;
    MacroState state_;

    std::vector<Citizen> citizens_;
    std::vector<Business> businesses_;

    void updateMoneySupply();
    void updateCentralBank(RandomSource& rng);
    void updateInflation();
    void updateGrowth();
    void collectRevenue();
    void updateVelocity(RandomSource& rng);
};

#endif
