#include <gtest/gtest.h>
#include "kernel/RandomSource.h"
#include "modules/Country.h"
#include <algorithm>

namespace {
CountryConfig fixedCountry() {
    CountryConfig cfg;
    cfg.country_id = 7;
    cfg.name = "Fixedia";
    cfg.development_level = 0.8;
    cfg.wealth_level = 0.7;
    cfg.homogeneity = 0.4;
    cfg.tax_rate = 0.2;
    cfg.interest_rate = 0.03;
    cfg.social_services_spending = 0.4;
    cfg.immigration_incentives = 0.05;
    cfg.import_duty_rate = 0.1;
    cfg.external_influences = 20;
    return cfg;
}

void stepCountry(Country& country, RandomSource& rng) {
    country.updateBusinesses(rng);
    country.updateCitizens(rng);
    country.updateExternalFactors(rng);
}
}

TEST(CountryTest, ConfiguredFieldsOverrideDraws) {
    RandomSource rng(51);
    Country country(3, fixedCountry(), rng);

    EXPECT_EQ(country.index(), 3u);
    EXPECT_EQ(country.id(), 7);
    EXPECT_EQ(country.name(), "Fixedia");
    EXPECT_EQ(country.traits().development_level, 0.8);
    EXPECT_EQ(country.tier(), DevelopmentTier::High);
    EXPECT_EQ(country.policy().tax_rate, 0.2);
    EXPECT_EQ(country.policy().import_duty_rate, 0.1);
    EXPECT_EQ(country.state().external_influences, 20);
    EXPECT_NEAR(country.state().bond_interest_rate, 0.04, 1e-12);
}

TEST(CountryTest, DefaultsDrawnFromBuiltInRanges) {
    RandomSource rng(52);
    for (std::uint32_t i = 0; i < 30; ++i) {
        Country country(i, CountryConfig{}, rng);
        EXPECT_GE(country.id(), 1);
        EXPECT_LE(country.id(), 1000);
        EXPECT_GE(country.traits().development_level, 0.3);
        EXPECT_LE(country.traits().development_level, 1.0);
        EXPECT_GE(country.policy().tax_rate, 0.1);
        EXPECT_LE(country.policy().tax_rate, 0.4);
        EXPECT_GE(country.policy().import_duty_rate, 0.05);
        EXPECT_LE(country.policy().import_duty_rate, 0.25);
        EXPECT_EQ(country.policy().bonds_issued, 0.0);
        EXPECT_GE(country.state().inflation, 0.01);
        EXPECT_LE(country.state().inflation, 0.05);
    }
}

// The stream advances by the same amount whatever the record sets
TEST(CountryTest, RandomStreamIndependentOfConfig) {
    RandomSource a(53);
    RandomSource b(53);
    Country configured(0, fixedCountry(), a);
    Country drawn(0, CountryConfig{}, b);
    EXPECT_EQ(a.uniform(0.0, 1.0), b.uniform(0.0, 1.0));
}

TEST(CountryTest, AddAssignsIdsAndIndex) {
    RandomSource rng(54);
    Country country(2, fixedCountry(), rng);
    country.addCitizen(Citizen{});
    Citizen& second = country.addCitizen(Citizen{});
    EXPECT_EQ(second.id, 1u);
    EXPECT_EQ(second.country_index, 2);

    Business& biz = country.addBusiness(Business(BusinessType::AI, 0.5, 1.0, 0.2, 1.0));
    EXPECT_EQ(biz.id(), 0u);
    EXPECT_EQ(biz.countryIndex(), 2);
}

TEST(CountryTest, NoCitizensReportsDefaultHappiness) {
    RandomSource rng(55);
    Country country(0, fixedCountry(), rng);
    country.updateExternalFactors(rng);
    EXPECT_EQ(country.state().citizen_happiness, 50.0);
    EXPECT_EQ(country.unemploymentRate(), 0.0);
}

TEST(CountryTest, ManufacturingBoostIsTwiceDuty) {
    RandomSource rng(56);
    Country country(0, fixedCountry(), rng);
    country.policyMut().import_duty_rate = 0.15;
    country.updateExternalFactors(rng);
    EXPECT_NEAR(country.state().local_manufacturing_boost, 0.3, 1e-12);
}

TEST(CountryTest, RevenueFromEmployedCitizens) {
    RandomSource rng(57);
    Country country(0, fixedCountry(), rng);
    for (int i = 0; i < 10; ++i) {
        Citizen c;
        c.employed = i < 6;
        c.salary = 50.0;
        country.addCitizen(c);
    }

    country.updateExternalFactors(rng);

    EXPECT_NEAR(country.state().tax_revenue, 6 * 50.0 * 0.2, 1e-9);
    EXPECT_EQ(country.state().import_duty_revenue, 0.0);
    EXPECT_NEAR(country.state().total_revenue, country.state().tax_revenue, 1e-12);
    EXPECT_NEAR(country.unemploymentRate(), 0.4, 1e-12);
}

// Spending is set from the previous step's revenue, before revenue is recollected
TEST(CountryTest, SpendingLagsRevenueByOneStep) {
    RandomSource rng(58);
    CountryConfig cfg = fixedCountry();
    cfg.bonds_issued = 100.0;
    Country country(0, cfg, rng);
    Citizen c;
    c.employed = true;
    c.salary = 50.0;
    country.addCitizen(c);

    country.updateExternalFactors(rng);
    EXPECT_NEAR(country.state().government_spending, 20.0, 1e-12);
    const double revenue = country.state().total_revenue;

    country.updateExternalFactors(rng);
    EXPECT_NEAR(country.state().government_spending, revenue * 0.9 + 20.0, 1e-9);
    EXPECT_NEAR(country.state().interest_payments, 100.0 * country.state().bond_interest_rate, 1e-9);
}

TEST(CountryTest, MoneySupplyMovesAtMostTenPercent) {
    RandomSource rng(59);
    Country country(0, fixedCountry(), rng);
    for (int i = 0; i < 200; ++i) {
        const double before = country.state().money_supply;
        country.updateExternalFactors(rng);
        EXPECT_GE(country.state().money_supply, before * 0.9 - 1e-9);
        EXPECT_LE(country.state().money_supply, before * 1.1 + 1e-9);
    }
}

TEST(CountryTest, BoundsHoldUnderExtremePolicy) {
    RandomSource rng(60);
    CountryConfig cfg = fixedCountry();
    cfg.tax_rate = 0.9;
    cfg.interest_rate = 0.5;
    cfg.import_duty_rate = 1.0;
    cfg.social_services_spending = 1.0;
    cfg.bonds_issued = 5000.0;
    cfg.external_influences = 500;
    Country country(0, cfg, rng);
    for (int i = 0; i < 30; ++i) {
        country.addCitizen(Citizen::generate(CitizenParams{}, rng));
    }
    for (int i = 0; i < 5; ++i) {
        country.addBusiness(Business::generate(BusinessParams{}, rng));
    }

    EXPECT_EQ(country.state().external_influences, 100);
    for (int step = 0; step < 300; ++step) {
        stepCountry(country, rng);
        const MacroState& s = country.state();
        EXPECT_GE(s.inflation, 0.0);
        EXPECT_LE(s.inflation, 0.2);
        EXPECT_GE(s.economic_growth, -0.05);
        EXPECT_LE(s.economic_growth, 0.1);
        EXPECT_GE(country.policy().interest_rate, 0.005);
        EXPECT_LE(country.policy().interest_rate, 0.12);
        EXPECT_GE(s.central_bank_policy, -0.2);
        EXPECT_LE(s.central_bank_policy, 0.2);
        EXPECT_GE(s.money_velocity, 1.2);
        EXPECT_LE(s.money_velocity, 3.0);
        EXPECT_GE(s.external_influences, -100);
        EXPECT_LE(s.external_influences, 100);
        EXPECT_LE(country.totalRoster(), country.totalCapacity());
    }
}

// One update recomputed stage by stage from the pre-update state, replaying
// the same random draws from a copy of the stream
TEST(CountryTest, ExternalUpdateStagesExact) {
    RandomSource rng(61);
    CountryConfig cfg = fixedCountry();
    cfg.bonds_issued = 250.0;
    Country country(0, cfg, rng);
    const double salaries[] = {50.0, 64.0, 45.0};
    for (int i = 0; i < 3; ++i) {
        Citizen c;
        c.employed = i < 2;
        c.salary = salaries[i];
        c.happiness = 40.0 + 10.0 * i;
        country.addCitizen(c);
    }
    country.addBusiness(Business(BusinessType::ImportCitizensConsumers, 0.4, 1.2, 0.2, 1.1));
    country.addBusiness(Business(BusinessType::AI, 0.6, 2.0, 0.2, 0.9));

    MacroState& state = country.stateMut();
    state.money_supply = 600.0;
    state.money_velocity = 2.0;
    state.inflation = 0.03;
    state.economic_growth = 0.02;
    state.central_bank_policy = 0.05;
    state.total_revenue = 200.0;
    country.updateBusinesses(rng);

    const MacroState s0 = country.state();
    const PolicyLevers p0 = country.policy();
    const double wealth = country.traits().wealth_level;
    RandomSource replay = rng;

    country.updateExternalFactors(rng);
    const MacroState& s = country.state();
    const PolicyLevers& p = country.policy();

    const int external = std::clamp(s0.external_influences + replay.uniformInt(-10, 10), -100, 100);
    EXPECT_EQ(s.external_influences, external);

    const double spending = s0.total_revenue * 0.9 + p0.bonds_issued * 0.2;
    EXPECT_DOUBLE_EQ(s.government_spending, spending);

    const double ms_change = (0.03 - p0.interest_rate) * 100.0 + spending / 1000.0 +
                             s0.central_bank_policy * s0.money_supply * 0.1 +
                             s0.economic_growth * s0.money_supply * 0.5;
    const double money = std::max(s0.money_supply * 0.9, std::min(s0.money_supply * 1.1, s0.money_supply + ms_change));
    EXPECT_DOUBLE_EQ(s.money_supply, money);

    const double cbp = std::clamp(
        s0.central_bank_policy + ((0.02 - s0.inflation) * 0.1 + replay.uniform(-0.03, 0.03)), -0.2, 0.2);
    EXPECT_DOUBLE_EQ(s.central_bank_policy, cbp);

    const double rate = std::clamp(
        p0.interest_rate + (cbp * -0.1 + (s0.inflation - 0.02) * 0.2 + replay.uniform(-0.002, 0.002)),
        0.005, 0.12);
    EXPECT_DOUBLE_EQ(p.interest_rate, rate);

    const double theoretical = (money * s0.money_velocity) / (wealth * 1000.0 * (1.0 + s0.economic_growth)) - 1.0;
    const double inflation = std::clamp(
        s0.inflation + ((theoretical - s0.inflation) * 0.2 + 0.005 * (p0.social_services_spending - 0.3) +
                        0.01 * (rate - 0.03) + 0.002 * (external / 100.0) + 0.003 * p0.import_duty_rate),
        0.0, 0.2);
    EXPECT_DOUBLE_EQ(s.inflation, inflation);

    const double boost = p0.import_duty_rate * 2.0;
    EXPECT_DOUBLE_EQ(s.local_manufacturing_boost, boost);

    const double growth = std::clamp(
        s0.economic_growth + (0.005 * (0.03 - rate) + 0.002 * (external / 100.0) + 0.003 * (0.3 - p0.tax_rate) +
                              0.004 * boost - 0.006 * p0.import_duty_rate + 0.003 * (money / 1000.0 - 1.0) -
                              0.01 * std::max(0.0, inflation - 0.03)),
        -0.05, 0.1);
    EXPECT_DOUBLE_EQ(s.economic_growth, growth);

    const auto& businesses = country.businesses();
    const double tax_revenue = 50.0 * p0.tax_rate + 64.0 * p0.tax_rate +
                               businesses[0].taxPayable() + businesses[1].taxPayable();
    const double duty_revenue = businesses[0].revenue() * p0.import_duty_rate;
    EXPECT_DOUBLE_EQ(s.tax_revenue, tax_revenue);
    EXPECT_DOUBLE_EQ(s.import_duty_revenue, duty_revenue);
    EXPECT_DOUBLE_EQ(s.total_revenue, tax_revenue + duty_revenue);

    const double bond_rate = rate + std::max(0.01, inflation * 0.5);
    EXPECT_DOUBLE_EQ(s.bond_interest_rate, bond_rate);
    EXPECT_DOUBLE_EQ(s.interest_payments, 250.0 * bond_rate);

    EXPECT_DOUBLE_EQ(s.citizen_happiness, (40.0 + 50.0 + 60.0) / 3.0);

    const double velocity = std::clamp(
        s0.money_velocity + (growth * 0.5 + (rate - 0.03) * 0.2 + replay.uniform(-0.05, 0.05)), 1.2, 3.0);
    EXPECT_DOUBLE_EQ(s.money_velocity, velocity);

    // The update consumed exactly the four draws replayed above
    EXPECT_EQ(rng.uniform(0.0, 1.0), replay.uniform(0.0, 1.0));
}
