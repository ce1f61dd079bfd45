#ifndef BUSINESS_H
#define BUSINESS_H

#include <array>
#include <cstdint>
#include <vector>

#include "modules/EconomyTypes.h"
#include "modules/Parameters.h"

struct Citizen;
class Country;
class RandomSource;

// ---------- Business tuning ----------
namespace BusinessConstants {
    constexpr int kMaxEmployeesCap = 100;
    constexpr int kMinEmployees = 1;
    constexpr double kBaseRevenue = 100.0;           // revenue per unit size at factor 1
    constexpr double kBaseOperatingCost = 20.0;      // operating cost per unit size
    constexpr double kNeutralInterestRate = 0.05;    // rate at which interest has no revenue effect
    constexpr double kCheapCreditRate = 0.04;        // borrowing only below this rate
    constexpr double kBorrowingDecay = 0.95;
    constexpr double kExpansionProfitPerSize = 50.0;
    constexpr double kContractionLossPerSize = -20.0;
    constexpr double kFullRosterShare = 0.9;
    constexpr double kCapacityStep = 0.1;
}

// Salary bands assigned on hire, by collar tier
namespace SalaryBands {
    constexpr IntRange kBlueCollar{40, 60};
    constexpr IntRange kWhiteCollar{60, 80};
    constexpr IntRange kExpert{80, 100};
}

class Business {
public:
    static constexpr std::int32_t kNone = -1;

    Business() = default;
    Business(BusinessType type,
             double automation_level,
             double size_factor,
             double investment_rate,
             double interest_rate_sensitivity);

    // Draw a business from one tier's ranges
    static Business generate(const BusinessParams& params, RandomSource& rng);

    // Bind to a country. Called by Country when the business is added.
    void attachTo(std::int32_t country_index, std::uint32_t id) {
        country_index_ = country_index;
        id_ = id;
    }
    bool attached() const { return country_index_ != kNone; }

    // Recompute this step's financials from the country's macro state, then
    // resize capacity and lay off citizens that no longer fit.
    void update(const Country& country, std::vector<Citizen>& citizens, RandomSource& rng);

    bool hasOpenings() const {
        return static_cast<int>(employees_.size()) < max_employees_;
    }

    // Append the citizen to the roster and assign a salary from its collar
    // band. Returns false without side effects when the business is full.
    bool hireEmployee(Citizen& citizen, RandomSource& rng);

    // Identity and traits
    std::uint32_t id() const { return id_; }
    std::int32_t countryIndex() const { return country_index_; }
    BusinessType type() const { return type_; }
    double automationLevel() const { return automation_level_; }
    double sizeFactor() const { return size_factor_; }
    double investmentRate() const { return investment_rate_; }
    double interestRateSensitivity() const { return interest_rate_sensitivity_; }

    // Workforce
    int maxEmployees() const { return max_employees_; }
    void setMaxEmployees(int value) { max_employees_ = value; }
    const std::vector<std::uint32_t>& employees() const { return employees_; }
    // Hires recorded per collar tier since creation (layoffs do not decrement)
    int hires(CollarTier tier) const { return hires_[static_cast<std::size_t>(tier)]; }

    // Financials of the latest update
    double revenue() const { return revenue_; }
    double costs() const { return costs_; }
    double profit() const { return profit_; }
    double taxPayable() const { return tax_payable_; }
    double importDutyPayable() const { return import_duty_payable_; }
    double borrowing() const { return borrowing_; }
    void setBorrowing(double value) { borrowing_ = value; }

private:
    // Identity
    std::uint32_t id_ = 0;
    std::int32_t country_index_ = kNone;

    // Immutable traits
    BusinessType type_ = BusinessType::ManufacturingLocalConsumers;
    double automation_level_ = 0.5;
    double size_factor_ = 1.0;
    double investment_rate_ = 0.2;
    double interest_rate_sensitivity_ = 1.0;

    // Workforce
    int max_employees_ = 10;
    std::vector<std::uint32_t> employees_;  // citizen indices within the country
    std::array<int, 3> hires_ = {0, 0, 0};

    // Financials
    double revenue_ = 0.0;
    double costs_ = 0.0;
    double profit_ = 0.0;
    double tax_payable_ = 0.0;
    double import_duty_payable_ = 0.0;
    double borrowing_ = 0.0;

    double revenueFactor(const Country& country) const;
    void adjustCapacity(const Country& country, std::vector<Citizen>& citizens, RandomSource& rng);
    void layOffUntilFits(std::vector<Citizen>& citizens, RandomSource& rng);
};

#endif
