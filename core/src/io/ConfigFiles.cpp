#include "io/ConfigFiles.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

struct CsvTable {
    std::string path;
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> lines;  // source line of each row
    std::unordered_map<std::string, std::size_t> columns;
};

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// Splits one CSV line; double quotes may wrap a field containing commas
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else if (ch == '"') {
                quoted = false;
            } else {
                field.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field.push_back(ch);
        }
    }
    fields.push_back(trim(field));
    return fields;
}

CsvTable readCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open parameter file '" + path + "'");
    }

    CsvTable table;
    table.path = path;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto fields = splitCsvLine(line);
        if (table.header.empty()) {
            table.header = fields;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                table.columns[fields[i]] = i;
            }
            continue;
        }
        if (fields.size() != table.header.size()) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(table.header.size()) + " fields, got " +
                                     std::to_string(fields.size()));
        }
        table.rows.push_back(std::move(fields));
        table.lines.push_back(line_no);
    }

    if (table.header.empty()) {
        throw std::runtime_error("Parameter file '" + path + "' is empty");
    }
    return table;
}

// Read access to one row of a table
class Row {
public:
    Row(const CsvTable& table, std::size_t row) : table_(table), row_(row) {}

    bool has(const std::string& column) const {
        auto it = table_.columns.find(column);
        return it != table_.columns.end() && !table_.rows[row_][it->second].empty();
    }

    const std::string& text(const std::string& column) const {
        auto it = table_.columns.find(column);
        if (it == table_.columns.end()) {
            throw std::runtime_error(table_.path + ": missing column '" + column + "'");
        }
        return table_.rows[row_][it->second];
    }

    double number(const std::string& column) const {
        const std::string& value = text(column);
        try {
            std::size_t used = 0;
            const double parsed = std::stod(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::exception&) {
            throw std::runtime_error(where() + ": column '" + column + "' is not a number: '" + value + "'");
        }
    }

    int integer(const std::string& column) const {
        return static_cast<int>(number(column));
    }

    Range range(const std::string& name) const {
        return Range{number("min_" + name), number("max_" + name)};
    }

    DevelopmentTier tier() const {
        DevelopmentTier tier = DevelopmentTier::Medium;
        const std::string& name = text("development_level");
        if (!parseDevelopmentTier(name, tier)) {
            throw std::runtime_error(where() + ": unknown development level '" + name + "'");
        }
        return tier;
    }

    std::string where() const {
        return table_.path + ":" + std::to_string(table_.lines[row_]);
    }

private:
    const CsvTable& table_;
    std::size_t row_;
};

template <typename T>
void optionalNumber(const Row& row, const std::string& column, std::optional<T>& out) {
    if (row.has(column)) {
        out = static_cast<T>(row.number(column));
    }
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not write template file '" + path.string() + "'");
    }
    out << contents;
}

const char* kCountryTemplate =
    "country_id,name,development_level,wealth_level,homogeneity,tax_rate,interest_rate,"
    "social_services_spending,immigration_incentives,import_duty_rate,external_influences\n"
    "1,Developed Country,0.9,0.85,0.7,0.35,0.02,0.4,0.05,0.1,50\n"
    "3,Developing Country,0.3,0.2,0.9,0.15,0.08,0.25,0.08,0.25,-30\n";

const char* kCitizenTemplate =
    "development_level,min_salary,max_salary,expertise_low_pct,expertise_medium_pct,"
    "expertise_high_pct,expertise_expert_pct,min_savings,max_savings,"
    "min_values_social_services,max_values_social_services,"
    "min_values_economic_freedom,max_values_economic_freedom,"
    "min_trust_in_government,max_trust_in_government,"
    "min_import_goods_preference,max_import_goods_preference,"
    "min_import_price_sensitivity,max_import_price_sensitivity,"
    "min_inflation_sensitivity,max_inflation_sensitivity,initial_employment_rate\n"
    "high,60,120,0.1,0.3,0.4,0.2,50,200,0.3,0.8,0.4,0.9,0.4,0.8,0.3,0.7,0.2,0.6,0.4,0.8,0.95\n"
    "low,20,60,0.4,0.4,0.15,0.05,5,50,0.5,1.0,0.2,0.6,0.1,0.5,0.5,0.9,0.6,1.0,0.7,1.0,0.6\n";

const char* kBusinessTemplate =
    "development_level,manufacturing_local_consumers_pct,manufacturing_local_businesses_pct,"
    "manufacturing_export_pct,import_citizens_consumers_pct,import_business_customers_pct,ai_pct,"
    "min_automation_level,max_automation_level,min_size_factor,max_size_factor,"
    "min_investment_rate,max_investment_rate,"
    "min_interest_rate_sensitivity,max_interest_rate_sensitivity\n"
    "high,0.2,0.15,0.25,0.15,0.1,0.15,0.4,0.9,0.8,2.5,0.2,0.5,0.7,1.2\n"
    "low,0.3,0.25,0.15,0.2,0.1,0.0,0.1,0.5,0.4,1.5,0.1,0.3,0.9,1.5\n";

}  // namespace

std::vector<CountryConfig> loadCountryConfigs(const std::string& path) {
    const CsvTable table = readCsv(path);
    std::vector<CountryConfig> configs;
    configs.reserve(table.rows.size());

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const Row row(table, r);
        CountryConfig cfg;
        optionalNumber(row, "country_id", cfg.country_id);
        if (row.has("name")) cfg.name = row.text("name");
        optionalNumber(row, "homogeneity", cfg.homogeneity);
        optionalNumber(row, "development_level", cfg.development_level);
        optionalNumber(row, "wealth_level", cfg.wealth_level);
        optionalNumber(row, "tax_rate", cfg.tax_rate);
        optionalNumber(row, "interest_rate", cfg.interest_rate);
        optionalNumber(row, "social_services_spending", cfg.social_services_spending);
        optionalNumber(row, "immigration_incentives", cfg.immigration_incentives);
        optionalNumber(row, "import_duty_rate", cfg.import_duty_rate);
        optionalNumber(row, "bonds_issued", cfg.bonds_issued);
        optionalNumber(row, "external_influences", cfg.external_influences);
        configs.push_back(std::move(cfg));
    }
    return configs;
}

CitizenParamsTable loadCitizenParams(const std::string& path) {
    const CsvTable table = readCsv(path);
    CitizenParamsTable result;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const Row row(table, r);
        CitizenParams p;
        p.salary = IntRange{row.integer("min_salary"), row.integer("max_salary")};
        p.expertise_weights = {
            row.number("expertise_low_pct"),
            row.number("expertise_medium_pct"),
            row.number("expertise_high_pct"),
            row.number("expertise_expert_pct")
        };
        p.savings = row.range("savings");
        p.values_social_services = row.range("values_social_services");
        p.values_economic_freedom = row.range("values_economic_freedom");
        p.trust_in_government = row.range("trust_in_government");
        p.import_goods_preference = row.range("import_goods_preference");
        p.import_price_sensitivity = row.range("import_price_sensitivity");
        p.inflation_sensitivity = row.range("inflation_sensitivity");
        p.initial_employment_rate = row.number("initial_employment_rate");
        result.slot(row.tier()) = p;
    }
    return result;
}

BusinessParamsTable loadBusinessParams(const std::string& path) {
    const CsvTable table = readCsv(path);
    BusinessParamsTable result;

    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        const Row row(table, r);
        BusinessParams p;
        for (int t = 0; t < kBusinessTypes; ++t) {
            const auto type = static_cast<BusinessType>(t);
            p.type_weights[static_cast<std::size_t>(t)] = row.number(std::string(toString(type)) + "_pct");
        }
        p.automation_level = row.range("automation_level");
        p.size_factor = row.range("size_factor");
        p.investment_rate = row.range("investment_rate");
        p.interest_rate_sensitivity = row.range("interest_rate_sensitivity");
        result.slot(row.tier()) = p;
    }
    return result;
}

LoadedConfig loadConfigDirectory(const std::string& dir) {
    const fs::path base(dir);
    const fs::path country = base / kCountryParamsFile;
    const fs::path citizen = base / kCitizenParamsFile;
    const fs::path business = base / kBusinessParamsFile;

    if (!fs::exists(country) || !fs::exists(citizen) || !fs::exists(business)) {
        std::cerr << "[Config] Parameter files missing in '" << dir
                  << "'. Generating templates...\n";
        generateTemplateFiles(dir);
    }

    LoadedConfig loaded;
    loaded.countries = loadCountryConfigs(country.string());
    loaded.citizenParams = loadCitizenParams(citizen.string());
    loaded.businessParams = loadBusinessParams(business.string());
    std::cerr << "[Config] Loaded " << loaded.countries.size() << " countries from '" << dir << "'\n";
    return loaded;
}

void generateTemplateFiles(const std::string& dir) {
    const fs::path base(dir);
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        throw std::runtime_error("Could not create config directory '" + dir + "': " + ec.message());
    }
    writeFile(base / kCountryParamsFile, kCountryTemplate);
    writeFile(base / kCitizenParamsFile, kCitizenTemplate);
    writeFile(base / kBusinessParamsFile, kBusinessTemplate);
    std::cerr << "[Config] Template files written to '" << dir << "'\n";
}
