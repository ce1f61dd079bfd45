#include "modules/Business.h"

#include <algorithm>
#include <numeric>

#include "kernel/RandomSource.h"
#include "modules/Citizen.h"
#include "modules/Country.h"
#include "utils/Validation.h"

using namespace BusinessConstants;

Business::Business(BusinessType type,
                   double automation_level,
                   double size_factor,
                   double investment_rate,
                   double interest_rate_sensitivity)
    : type_(type),
      automation_level_(automation_level),
      size_factor_(size_factor),
      investment_rate_(investment_rate),
      interest_rate_sensitivity_(interest_rate_sensitivity) {
    // AI firms run with a fraction of the staff
    const double staff_per_size = (type == BusinessType::AI) ? 2.0 : 10.0;
    max_employees_ = static_cast<int>(staff_per_size * size_factor);
}

Business Business::generate(const BusinessParams& params, RandomSource& rng) {
    const auto type = static_cast<BusinessType>(rng.weightedIndex(params.type_weights));
    const double automation = rng.uniform(params.automation_level.min, params.automation_level.max);
    const double size = rng.uniform(params.size_factor.min, params.size_factor.max);
    const double investment = rng.uniform(params.investment_rate.min, params.investment_rate.max);
    const double sensitivity = rng.uniform(params.interest_rate_sensitivity.min,
                                           params.interest_rate_sensitivity.max);
    return Business(type, automation, size, investment, sensitivity);
}

double Business::revenueFactor(const Country& country) const {
    const MacroState& macro = country.state();
    const PolicyLevers& policy = country.policy();

    double factor = 1.0;
    if (isManufacturing(type_)) {
        factor += macro.economic_growth * 2.0;
        // Import duties shelter local production
        factor += macro.local_manufacturing_boost;
        if (type_ == BusinessType::ManufacturingExport) {
            factor += macro.external_influences / 200.0;
        }
    } else if (isImport(type_)) {
        factor += macro.economic_growth;
        factor -= policy.import_duty_rate * 2.0;
        factor -= macro.external_influences / 300.0;
    } else {
        factor += macro.economic_growth * 3.0;
        factor += country.traits().development_level * 0.5;
    }

    const double money_supply_effect = (macro.money_supply / 1000.0) * 0.2;
    const double interest_rate_effect =
        (kNeutralInterestRate - policy.interest_rate) * interest_rate_sensitivity_;
    return factor + money_supply_effect + interest_rate_effect;
}

void Business::update(const Country& country, std::vector<Citizen>& citizens, RandomSource& rng) {
    if (country_index_ != static_cast<std::int32_t>(country.index())) {
        return;
    }

    const PolicyLevers& policy = country.policy();
    const MacroState& macro = country.state();

    const double employee_factor =
        static_cast<double>(employees_.size()) / std::max(1, max_employees_);
    revenue_ = kBaseRevenue * size_factor_ * revenueFactor(country) * (0.5 + 0.5 * employee_factor);

    const double employee_costs = std::accumulate(
        employees_.begin(), employees_.end(), 0.0,
        [&citizens](double sum, std::uint32_t idx) { return sum + citizens[idx].salary; });
    const double operating_costs = kBaseOperatingCost * size_factor_ * (1.0 - 0.5 * automation_level_);
    const double interest_costs = borrowing_ * policy.interest_rate;
    double import_duty_costs = 0.0;
    if (isImport(type_)) {
        import_duty_costs = revenue_ * policy.import_duty_rate;
        import_duty_payable_ = import_duty_costs;
    }
    const double inflation_cost_increase = operating_costs * macro.inflation * 2.0;

    costs_ = employee_costs + operating_costs + import_duty_costs + interest_costs + inflation_cost_increase;
    profit_ = revenue_ - costs_;
    tax_payable_ = profit_ > 0.0 ? profit_ * policy.tax_rate : 0.0;

    if (policy.interest_rate < kCheapCreditRate && profit_ > 0.0) {
        borrowing_ += revenue_ * 0.1 * (1.0 - policy.interest_rate * 10.0);
    } else {
        borrowing_ = std::max(0.0, borrowing_ * kBorrowingDecay);
    }

    adjustCapacity(country, citizens, rng);

    validation::checkCapacity(employees_.size(), max_employees_, "business roster");
    validation::checkNonNegative(borrowing_, "business borrowing");
}

void Business::adjustCapacity(const Country& country, std::vector<Citizen>& citizens, RandomSource& rng) {
    const double roster = static_cast<double>(employees_.size());

    double size_change = 0.0;
    if (profit_ > kExpansionProfitPerSize * size_factor_ && roster >= max_employees_ * kFullRosterShare) {
        size_change = kCapacityStep;
    } else if (profit_ < kContractionLossPerSize * size_factor_) {
        size_change = -kCapacityStep;
    }
    // Cheap credit pushes expansion, expensive credit pushes contraction
    size_change += (kNeutralInterestRate - country.policy().interest_rate) * interest_rate_sensitivity_ * 0.5;

    if (size_change != 0.0) {
        const int resized = static_cast<int>(max_employees_ * (1.0 + size_change));
        max_employees_ = std::clamp(resized, kMinEmployees, kMaxEmployeesCap);
    }
    layOffUntilFits(citizens, rng);
}

void Business::layOffUntilFits(std::vector<Citizen>& citizens, RandomSource& rng) {
    while (static_cast<int>(employees_.size()) > max_employees_) {
        const std::size_t pos = rng.index(employees_.size());
        citizens[employees_[pos]].becomeUnemployed();
        employees_.erase(employees_.begin() + static_cast<std::ptrdiff_t>(pos));
    }
}

bool Business::hireEmployee(Citizen& citizen, RandomSource& rng) {
    if (!hasOpenings()) {
        return false;
    }

    employees_.push_back(citizen.id);
    const CollarTier tier = collarTierFor(citizen.expertise);
    hires_[static_cast<std::size_t>(tier)] += 1;

    IntRange band = SalaryBands::kBlueCollar;
    if (tier == CollarTier::Expert) {
        band = SalaryBands::kExpert;
    } else if (tier == CollarTier::WhiteCollar) {
        band = SalaryBands::kWhiteCollar;
    }
    citizen.salary = rng.uniformInt(band.min, band.max);
    return true;
}
