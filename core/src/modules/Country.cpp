#include "modules/Country.h"

#include <algorithm>
#include <numeric>

#include "kernel/RandomSource.h"
#include "utils/Validation.h"

using namespace MacroBounds;

Country::Country(std::uint32_t index, const CountryConfig& cfg, RandomSource& rng) : index_(index) {
    // Built-in ranges, drawn unconditionally
    const int drawn_id = rng.uniformInt(1, 1000);
    const double homogeneity = rng.uniform(0.0, 1.0);
    const double development = rng.uniform(0.3, 1.0);
    const double wealth = rng.uniform(0.2, 1.0);
    const double tax = rng.uniform(0.1, 0.4);
    const double interest = rng.uniform(0.01, 0.05);
    const double social = rng.uniform(0.2, 0.5);
    const double immigration = rng.uniform(0.0, 0.1);
    const double duty = rng.uniform(0.05, 0.25);
    const int external = rng.uniformInt(kExternalMin, kExternalMax);

    id_ = cfg.country_id.value_or(drawn_id);
    name_ = cfg.name.value_or("Country " + std::to_string(id_));

    traits_.homogeneity = cfg.homogeneity.value_or(homogeneity);
    traits_.development_level = cfg.development_level.value_or(development);
    traits_.wealth_level = cfg.wealth_level.value_or(wealth);

    policy_.tax_rate = cfg.tax_rate.value_or(tax);
    policy_.interest_rate = cfg.interest_rate.value_or(interest);
    policy_.social_services_spending = cfg.social_services_spending.value_or(social);
    policy_.immigration_incentives = cfg.immigration_incentives.value_or(immigration);
    policy_.import_duty_rate = cfg.import_duty_rate.value_or(duty);
    policy_.bonds_issued = cfg.bonds_issued.value_or(0.0);

    state_.external_influences = std::clamp(cfg.external_influences.value_or(external), kExternalMin, kExternalMax);
    state_.inflation = rng.uniform(0.01, 0.05);
    state_.economic_growth = rng.uniform(0.01, 0.03);
    state_.gini_coefficient = rng.uniform(0.2, 0.6);
    state_.money_supply = rng.uniform(800.0, 1200.0) * traits_.wealth_level * traits_.development_level;
    state_.money_velocity = rng.uniform(1.5, 2.5);
    state_.central_bank_policy = rng.uniform(-0.1, 0.1);
    state_.bond_interest_rate = policy_.interest_rate + 0.01;
    state_.import_duty_revenue = 0.0;
    state_.tax_revenue = 0.0;
    state_.total_revenue = 0.0;
    state_.interest_payments = 0.0;
    state_.government_spending = 0.0;
    state_.local_manufacturing_boost = 0.0;
    state_.citizen_happiness = 0.0;
}

Citizen& Country::addCitizen(Citizen citizen) {
    citizen.id = static_cast<std::uint32_t>(citizens_.size());
    citizen.country_index = static_cast<std::int32_t>(index_);
    citizens_.push_back(std::move(citizen));
    return citizens_.back();
}

Business& Country::addBusiness(Business business) {
    business.attachTo(static_cast<std::int32_t>(index_), static_cast<std::uint32_t>(businesses_.size()));
    businesses_.push_back(std::move(business));
    return businesses_.back();
}

void Country::updateBusinesses(RandomSource& rng) {
    for (auto& business : businesses_) {
        business.update(*this, citizens_, rng);
    }
}

void Country::updateCitizens(RandomSource& rng) {
    for (auto& citizen : citizens_) {
        citizen.seekEmployment(*this, businesses_, rng);
        citizen.updateHappiness(*this, rng);
    }
}

// Order matters: each stage reads values written by the stages before it.
void Country::updateExternalFactors(RandomSource& rng) {
    state_.external_influences = std::clamp(
        state_.external_influences + rng.uniformInt(-kExternalStep, kExternalStep),
        kExternalMin, kExternalMax);

    // 10% of last step's revenue is held back for other expenses
    state_.government_spending = state_.total_revenue * 0.9 + policy_.bonds_issued * 0.2;

    updateMoneySupply();
    updateCentralBank(rng);
    updateInflation();

    state_.local_manufacturing_boost = policy_.import_duty_rate * 2.0;

    updateGrowth();
    collectRevenue();

    state_.bond_interest_rate = policy_.interest_rate + std::max(0.01, state_.inflation * 0.5);
    state_.interest_payments = policy_.bonds_issued * state_.bond_interest_rate;

    if (citizens_.empty()) {
        state_.citizen_happiness = kDefaultHappiness;
    } else {
        const double total = std::accumulate(
            citizens_.begin(), citizens_.end(), 0.0,
            [](double sum, const Citizen& c) { return sum + c.happiness; });
        state_.citizen_happiness = total / static_cast<double>(citizens_.size());
    }

    updateVelocity(rng);

    validation::checkRange(state_.inflation, kInflationMin, kInflationMax, "inflation");
    validation::checkRange(state_.economic_growth, kGrowthMin, kGrowthMax, "economic_growth");
    validation::checkRange(policy_.interest_rate, kInterestMin, kInterestMax, "interest_rate");
    validation::checkRange(state_.central_bank_policy, kPolicyMin, kPolicyMax, "central_bank_policy");
    validation::checkRange(state_.money_velocity, kVelocityMin, kVelocityMax, "money_velocity");
}

void Country::updateMoneySupply() {
    const double ms = state_.money_supply;
    const double change =
        (0.03 - policy_.interest_rate) * 100.0 +
        state_.government_spending / 1000.0 +
        state_.central_bank_policy * ms * 0.1 +
        state_.economic_growth * ms * 0.5;
    const double lo = ms * (1.0 - kMoneySupplyStep);
    const double hi = ms * (1.0 + kMoneySupplyStep);
    state_.money_supply = std::max(lo, std::min(hi, ms + change));
}

void Country::updateCentralBank(RandomSource& rng) {
    const double adjustment = (0.02 - state_.inflation) * 0.1 + rng.uniform(-0.03, 0.03);
    state_.central_bank_policy = std::clamp(state_.central_bank_policy + adjustment, kPolicyMin, kPolicyMax);

    // Loose policy lowers rates; inflation above target raises them
    const double rate_change =
        state_.central_bank_policy * -0.1 +
        (state_.inflation - 0.02) * 0.2 +
        rng.uniform(-0.002, 0.002);
    policy_.interest_rate = std::clamp(policy_.interest_rate + rate_change, kInterestMin, kInterestMax);
}

void Country::updateInflation() {
    // Quantity theory: P = MV / Y, with Y proxied by wealth and growth
    const double theoretical =
        (state_.money_supply * state_.money_velocity) /
        (traits_.wealth_level * 1000.0 * (1.0 + state_.economic_growth)) - 1.0;

    const double change =
        (theoretical - state_.inflation) * 0.2 +
        0.005 * (policy_.social_services_spending - 0.3) +
        0.01 * (policy_.interest_rate - 0.03) +
        0.002 * (state_.external_influences / 100.0) +
        0.003 * policy_.import_duty_rate;
    state_.inflation = std::clamp(state_.inflation + change, kInflationMin, kInflationMax);
}

void Country::updateGrowth() {
    const double change =
        0.005 * (0.03 - policy_.interest_rate) +
        0.002 * (state_.external_influences / 100.0) +
        0.003 * (0.3 - policy_.tax_rate) +
        0.004 * state_.local_manufacturing_boost -
        0.006 * policy_.import_duty_rate +
        0.003 * (state_.money_supply / 1000.0 - 1.0) -
        0.01 * std::max(0.0, state_.inflation - 0.03);
    state_.economic_growth = std::clamp(state_.economic_growth + change, kGrowthMin, kGrowthMax);
}

void Country::collectRevenue() {
    double tax_revenue = 0.0;
    double duty_revenue = 0.0;
    for (const auto& citizen : citizens_) {
        if (citizen.employed) {
            tax_revenue += citizen.salary * policy_.tax_rate;
        }
    }
    for (const auto& business : businesses_) {
        tax_revenue += business.taxPayable();
        if (isImport(business.type())) {
            duty_revenue += business.revenue() * policy_.import_duty_rate;
        }
    }
    state_.tax_revenue = tax_revenue;
    state_.import_duty_revenue = duty_revenue;
    state_.total_revenue = tax_revenue + duty_revenue;
}

void Country::updateVelocity(RandomSource& rng) {
    const double change =
        state_.economic_growth * 0.5 +
        (policy_.interest_rate - 0.03) * 0.2 +
        rng.uniform(-0.05, 0.05);
    state_.money_velocity = std::clamp(state_.money_velocity + change, kVelocityMin, kVelocityMax);
}

std::uint32_t Country::employedCount() const {
    return static_cast<std::uint32_t>(std::count_if(
        citizens_.begin(), citizens_.end(), [](const Citizen& c) { return c.employed; }));
}

double Country::unemploymentRate() const {
    if (citizens_.empty()) return 0.0;
    return 1.0 - static_cast<double>(employedCount()) / static_cast<double>(citizens_.size());
}

int Country::totalCapacity() const {
    return std::accumulate(businesses_.begin(), businesses_.end(), 0,
                           [](int sum, const Business& b) { return sum + b.maxEmployees(); });
}

int Country::totalRoster() const {
    return std::accumulate(businesses_.begin(), businesses_.end(), 0,
                           [](int sum, const Business& b) { return sum + static_cast<int>(b.employees().size()); });
}
