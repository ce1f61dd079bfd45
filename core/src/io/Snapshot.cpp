#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <ostream>

namespace {
// Names may come from user config files
std::string escapeJson(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out.push_back(ch);
        }
    }
    return out;
}

void writeCountryJson(std::ostream& os, const Country& country, bool includeAgents) {
    const MacroState& s = country.state();
    const PolicyLevers& p = country.policy();
    const CountryTraits& t = country.traits();

    os << "{";
    os << "\"index\":" << country.index() << ",";
    os << "\"id\":" << country.id() << ",";
    os << "\"name\":\"" << escapeJson(country.name()) << "\",";
    os << "\"tier\":\"" << toString(country.tier()) << "\",";
    os << "\"traits\":{";
    os << "\"homogeneity\":" << t.homogeneity << ",";
    os << "\"development_level\":" << t.development_level << ",";
    os << "\"wealth_level\":" << t.wealth_level;
    os << "},";
    os << "\"policy\":{";
    os << "\"tax_rate\":" << p.tax_rate << ",";
    os << "\"interest_rate\":" << p.interest_rate << ",";
    os << "\"social_services_spending\":" << p.social_services_spending << ",";
    os << "\"immigration_incentives\":" << p.immigration_incentives << ",";
    os << "\"import_duty_rate\":" << p.import_duty_rate << ",";
    os << "\"bonds_issued\":" << p.bonds_issued;
    os << "},";
    os << "\"state\":{";
    os << "\"external_influences\":" << s.external_influences << ",";
    os << "\"inflation\":" << s.inflation << ",";
    os << "\"economic_growth\":" << s.economic_growth << ",";
    os << "\"money_supply\":" << s.money_supply << ",";
    os << "\"money_velocity\":" << s.money_velocity << ",";
    os << "\"central_bank_policy\":" << s.central_bank_policy << ",";
    os << "\"government_spending\":" << s.government_spending << ",";
    os << "\"tax_revenue\":" << s.tax_revenue << ",";
    os << "\"import_duty_revenue\":" << s.import_duty_revenue << ",";
    os << "\"total_revenue\":" << s.total_revenue << ",";
    os << "\"bond_interest_rate\":" << s.bond_interest_rate << ",";
    os << "\"citizen_happiness\":" << s.citizen_happiness << ",";
    os << "\"local_manufacturing_boost\":" << s.local_manufacturing_boost << ",";
    os << "\"unemployment_rate\":" << country.unemploymentRate();
    os << "}";

    if (includeAgents) {
        os << ",\"citizens\":[";
        const auto& citizens = country.citizens();
        for (std::size_t i = 0; i < citizens.size(); ++i) {
            const auto& c = citizens[i];
            os << "{";
            os << "\"id\":" << c.id << ",";
            os << "\"expertise\":\"" << toString(c.expertise) << "\",";
            os << "\"salary\":" << c.salary << ",";
            os << "\"happiness\":" << c.happiness << ",";
            os << "\"savings\":" << c.savings << ",";
            os << "\"employed\":" << (c.employed ? "true" : "false") << ",";
            os << "\"employer\":" << c.employer;
            os << "}";
            if (i + 1 < citizens.size()) os << ",";
        }
        os << "],\"businesses\":[";
        const auto& businesses = country.businesses();
        for (std::size_t i = 0; i < businesses.size(); ++i) {
            const auto& b = businesses[i];
            os << "{";
            os << "\"id\":" << b.id() << ",";
            os << "\"type\":\"" << toString(b.type()) << "\",";
            os << "\"max_employees\":" << b.maxEmployees() << ",";
            os << "\"employees\":" << b.employees().size() << ",";
            os << "\"revenue\":" << b.revenue() << ",";
            os << "\"costs\":" << b.costs() << ",";
            os << "\"profit\":" << b.profit() << ",";
            os << "\"borrowing\":" << b.borrowing();
            os << "}";
            if (i + 1 < businesses.size()) os << ",";
        }
        os << "]";
    }
    os << "}";
}
}

std::string modelToJson(const Model& model, bool includeAgents) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    auto m = model.computeMetrics();

    os << "{";
    os << "\"generation\":" << model.generation() << ",";
    os << "\"metrics\":{";
    os << "\"inflation\":" << m.inflation << ",";
    os << "\"economicGrowth\":" << m.economicGrowth << ",";
    os << "\"interestRate\":" << m.interestRate << ",";
    os << "\"moneySupply\":" << m.moneySupply << ",";
    os << "\"totalRevenue\":" << m.totalRevenue << ",";
    os << "\"governmentSpending\":" << m.governmentSpending << ",";
    os << "\"citizenHappiness\":" << m.citizenHappiness << ",";
    os << "\"unemploymentRate\":" << m.unemploymentRate;
    os << "},";

    os << "\"countries\":[";
    const auto& countries = model.countries();
    for (std::size_t i = 0; i < countries.size(); ++i) {
        writeCountryJson(os, countries[i], includeAgents);
        if (i + 1 < countries.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

void writeMetricsCsv(const MetricsStore& store, std::uint32_t country, std::ostream& out) {
    // Validates the index before anything is written
    const auto& first = store.series(country, Metric::Inflation);

    out << "step";
    for (std::size_t k = 0; k < kMetricCount; ++k) {
        out << "," << metricName(static_cast<Metric>(k));
    }
    out << "\n";

    for (std::size_t step = 0; step < first.size(); ++step) {
        out << (step + 1);
        for (std::size_t k = 0; k < kMetricCount; ++k) {
            out << "," << store.series(country, static_cast<Metric>(k))[step];
        }
        out << "\n";
    }
}

void logMetricsHeader(std::ostream& out) {
    out << "gen,country";
    for (std::size_t k = 0; k < kMetricCount; ++k) {
        out << "," << metricName(static_cast<Metric>(k));
    }
    out << "\n";
}

void logMetrics(const Model& model, std::ostream& out) {
    const MetricsStore& store = model.metrics();
    for (std::uint32_t c = 0; c < store.countries(); ++c) {
        out << model.generation() << "," << c;
        for (std::size_t k = 0; k < kMetricCount; ++k) {
            const auto& series = store.series(c, static_cast<Metric>(k));
            out << "," << (series.empty() ? 0.0 : series.back());
        }
        out << "\n";
    }
}

void writeSweepCsv(const std::vector<SweepOutcome>& outcomes, std::ostream& out) {
    out << "tax_rate,interest_rate,social_services_spending,immigration_incentives,import_duty_rate,"
        << "avg_happiness,avg_growth,avg_revenue,avg_spending,avg_inflation,avg_money_supply,avg_interest_rate\n";
    for (const auto& o : outcomes) {
        out << o.policy.tax_rate << ","
            << o.policy.interest_rate << ","
            << o.policy.social_services_spending << ","
            << o.policy.immigration_incentives << ","
            << o.policy.import_duty_rate << ","
            << o.avgHappiness << ","
            << o.avgGrowth << ","
            << o.avgRevenue << ","
            << o.avgSpending << ","
            << o.avgInflation << ","
            << o.avgMoneySupply << ","
            << o.avgInterestRate << "\n";
    }
}
