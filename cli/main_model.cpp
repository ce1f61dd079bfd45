#include "kernel/Model.h"
#include "io/ConfigFiles.h"
#include "io/Snapshot.h"
#include "modules/PolicySweep.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <string>

static void printHelp() {
    std::cerr << "Model Commands:\n"
              << "  step N             # advance N steps\n"
              << "  state [agents]     # print JSON snapshot (optional: include citizens and businesses)\n"
              << "  metrics            # print current metrics (averaged over countries)\n"
              << "  stats              # print detailed statistics\n"
              << "  country I          # show country I\n"
              << "  run T FILE         # run T steps, write per-country metrics rows to FILE\n"
              << "  reset [seed]       # rebuild the model (optionally with a new seed)\n"
              << "  sweep duty|rates|sensitivity|policy [FILE]\n"
              << "                     # run a policy sweep, optionally writing results as CSV\n"
              << "  templates DIR      # write parameter file templates to DIR\n"
              << "  quit               # exit\n"
              << "\nOptions: --config=DIR --seed=N --countries=N --citizens=N --businesses=N\n";
}

static bool parseUnsigned(const std::string& arg, const std::string& prefix, std::uint64_t& out) {
    if (arg.rfind(prefix, 0) != 0) return false;
    const std::string value = arg.substr(prefix.size());
    std::size_t used = 0;
    out = std::stoull(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument("Bad value for " + prefix + " '" + value + "'");
    }
    return true;
}

static void printCountry(const Country& country) {
    const MacroState& s = country.state();
    const PolicyLevers& p = country.policy();
    std::cout << "\n=== Country " << country.index() << " (" << country.name() << ", id "
              << country.id() << ") ===\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Development: " << country.traits().development_level
              << " (" << toString(country.tier()) << ")"
              << " | Wealth: " << country.traits().wealth_level
              << " | Homogeneity: " << country.traits().homogeneity << "\n";
    std::cout << "Citizens: " << country.citizens().size()
              << " | Employed: " << country.employedCount()
              << " | Unemployment: " << country.unemploymentRate() * 100.0 << "%\n";
    std::cout << "Businesses: " << country.businesses().size()
              << " | Capacity: " << country.totalCapacity()
              << " | Roster: " << country.totalRoster() << "\n\n";

    std::cout << "Policy: tax=" << p.tax_rate << ", interest=" << p.interest_rate
              << ", social=" << p.social_services_spending << ", immigration=" << p.immigration_incentives
              << ", duty=" << p.import_duty_rate << ", bonds=" << p.bonds_issued << "\n";
    std::cout << "Inflation: " << s.inflation << " | Growth: " << s.economic_growth
              << " | CB policy: " << s.central_bank_policy << "\n";
    std::cout << "Money supply: " << s.money_supply << " | Velocity: " << s.money_velocity << "\n";
    std::cout << "Revenue: tax=" << s.tax_revenue << ", duty=" << s.import_duty_revenue
              << ", total=" << s.total_revenue << " | Spending: " << s.government_spending << "\n";
    std::cout << "Happiness: " << s.citizen_happiness
              << " | Manufacturing boost: " << s.local_manufacturing_boost
              << " | External: " << s.external_influences << "\n\n";
}

static void printSweep(const std::vector<SweepOutcome>& outcomes) {
    std::cout << std::fixed << std::setprecision(3);
    for (const auto& o : outcomes) {
        std::cout << "tax=" << o.policy.tax_rate << " rate=" << o.policy.interest_rate
                  << " social=" << o.policy.social_services_spending
                  << " duty=" << o.policy.import_duty_rate
                  << " | happiness=" << o.avgHappiness << " growth=" << o.avgGrowth
                  << " revenue=" << o.avgRevenue << " spending=" << o.avgSpending
                  << " inflation=" << o.avgInflation << "\n";
    }
}

int main(int argc, char** argv) {
    ModelConfig cfg;
    std::string configDir;
    const char* scriptArg = nullptr;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::uint64_t value = 0;
            if (arg.rfind("--config=", 0) == 0) {
                configDir = arg.substr(9);
            } else if (parseUnsigned(arg, "--seed=", value)) {
                cfg.seed = value;
            } else if (parseUnsigned(arg, "--countries=", value)) {
                cfg.sizes.countries = static_cast<std::uint32_t>(value);
            } else if (parseUnsigned(arg, "--citizens=", value)) {
                cfg.sizes.citizens_per_country = static_cast<std::uint32_t>(value);
            } else if (parseUnsigned(arg, "--businesses=", value)) {
                cfg.sizes.businesses_per_country = static_cast<std::uint32_t>(value);
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                return 0;
            } else if (arg.size() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            } else {
                scriptArg = argv[i];
                break;
            }
        }

        if (!configDir.empty()) {
            LoadedConfig loaded = loadConfigDirectory(configDir);
            cfg.countries = std::move(loaded.countries);
            cfg.citizenParams = loaded.citizenParams;
            cfg.businessParams = loaded.businessParams;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    Model model(cfg);
    std::cerr << "[Model] " << model.countries().size() << " countries, seed " << cfg.seed << "\n";

    std::istream* input = &std::cin;
    std::ifstream scriptFile;

    if (scriptArg) {
        scriptFile.open(scriptArg);
        if (!scriptFile.is_open()) {
            std::cerr << "Error: Could not open script file '" << scriptArg << "'\n";
            return 1;
        }
        input = &scriptFile;
        std::cerr << "Running commands from script file: " << scriptArg << "\n";
    } else {
        std::ios::sync_with_stdio(false);
        std::cin.tie(nullptr);
        printHelp();
    }

    std::string line;
    while (std::getline(*input, line)) {
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }

        try {
            if (cmd == "step") {
                int n = 1;
                iss >> n;
                if (n < 1) n = 1;
                model.stepN(n);
                std::cout << modelToJson(model) << "\n";
                std::cout.flush();

            } else if (cmd == "state") {
                std::string opt;
                iss >> opt;
                std::cout << modelToJson(model, opt == "agents") << "\n";
                std::cout.flush();

            } else if (cmd == "metrics") {
                auto m = model.computeMetrics();
                std::cout << std::fixed << std::setprecision(4)
                          << "Generation: " << model.generation() << "\n"
                          << "Inflation: " << m.inflation << "\n"
                          << "Economic Growth: " << m.economicGrowth << "\n"
                          << "Interest Rate: " << m.interestRate << "\n"
                          << "Money Supply: " << m.moneySupply << "\n"
                          << "Total Revenue: " << m.totalRevenue << "\n"
                          << "Government Spending: " << m.governmentSpending << "\n"
                          << "Citizen Happiness: " << m.citizenHappiness << "\n"
                          << "Unemployment: " << m.unemploymentRate << "\n";
                std::cout.flush();

            } else if (cmd == "stats") {
                auto stats = model.getStatistics();
                std::cout << "\n=== SIMULATION STATISTICS (Generation " << model.generation() << ") ===\n\n";

                std::cout << "--- POPULATION ---\n";
                std::cout << "Countries: " << stats.countries << "\n";
                std::cout << "Citizens: " << stats.citizens << "\n";
                if (stats.citizens > 0) {
                    std::cout << std::fixed << std::setprecision(1);
                    std::cout << "Employed: " << stats.employed
                              << " (" << (100.0 * stats.employed / stats.citizens) << "%), "
                              << stats.employedByBusinesses << " by simulated businesses\n";
                    std::cout << "Unemployed: " << stats.unemployed << "\n";
                    std::cout << "Expertise:";
                    for (int e = 0; e < kExpertiseLevels; ++e) {
                        std::cout << " " << toString(static_cast<Expertise>(e)) << "=" << stats.expertiseCounts[e];
                    }
                    std::cout << "\n\n";

                    std::cout << "--- CITIZENS ---\n";
                    std::cout << std::setprecision(2);
                    std::cout << "Happiness: " << stats.minHappiness << " / " << stats.avgHappiness
                              << " / " << stats.maxHappiness << " (min/avg/max)\n";
                    std::cout << "Average salary: " << stats.avgSalary << "\n";
                    std::cout << "Average savings: " << stats.avgSavings << "\n\n";
                }

                std::cout << "--- BUSINESSES ---\n";
                std::cout << "Businesses: " << stats.businesses << " (" << stats.profitableBusinesses
                          << " profitable)\n";
                std::cout << "Types:";
                for (int t = 0; t < kBusinessTypes; ++t) {
                    std::cout << " " << toString(static_cast<BusinessType>(t)) << "=" << stats.typeCounts[t];
                }
                std::cout << "\n";
                std::cout << "Capacity: " << stats.totalCapacity << " | Roster: " << stats.totalRoster << "\n";
                std::cout << std::fixed << std::setprecision(2);
                std::cout << "Revenue: " << stats.totalRevenue << " | Profit: " << stats.totalProfit
                          << " | Borrowing: " << stats.totalBorrowing << "\n\n";
                std::cout.flush();

            } else if (cmd == "country") {
                std::uint32_t index = 0;
                if (!(iss >> index)) {
                    std::cerr << "Usage: country I\n";
                    continue;
                }
                printCountry(model.country(index));
                std::cout.flush();

            } else if (cmd == "run") {
                int ticks = 0;
                std::string path;
                if (!(iss >> ticks >> path) || ticks < 1) {
                    std::cerr << "Usage: run T FILE\n";
                    continue;
                }
                std::ofstream metricsFile(path);
                if (!metricsFile.is_open()) {
                    std::cerr << "Error: Could not open '" << path << "' for writing\n";
                    continue;
                }
                logMetricsHeader(metricsFile);
                for (int t = 0; t < ticks; ++t) {
                    model.step();
                    logMetrics(model, metricsFile);
                    if ((t + 1) % 100 == 0 || t == ticks - 1) {
                        std::cerr << "Tick " << (t + 1) << "/" << ticks << "\r";
                        std::cerr.flush();
                    }
                }
                std::cerr << "\n";
                std::cout << "Completed " << ticks << " steps. Metrics written to " << path << "\n";
                std::cout.flush();

            } else if (cmd == "reset") {
                std::uint64_t seed = cfg.seed;
                if (iss >> seed) {
                    cfg.seed = seed;
                }
                model.reset(cfg);
                std::cout << "Reset: " << model.countries().size() << " countries (seed " << cfg.seed << ")\n";
                std::cout.flush();

            } else if (cmd == "sweep") {
                std::string kind;
                std::string path;
                iss >> kind >> path;

                SweepSettings settings;
                settings.base = cfg;
                settings.base.countries.clear();
                settings.country = cfg.countries.empty() ? richCountryConfig() : cfg.countries.front();

                std::vector<SweepOutcome> outcomes;
                if (kind == "duty") {
                    outcomes = runDutyRateSweep(settings);
                } else if (kind == "rates") {
                    outcomes = runMonetaryPolicyAnalysis(settings);
                } else if (kind == "sensitivity") {
                    outcomes = runSensitivityAnalysis(settings);
                } else if (kind == "policy") {
                    outcomes = runPolicyCombinations(settings);
                } else {
                    std::cerr << "Usage: sweep duty|rates|sensitivity|policy [FILE]\n";
                    continue;
                }

                if (path.empty()) {
                    printSweep(outcomes);
                } else {
                    std::ofstream out(path);
                    if (!out.is_open()) {
                        std::cerr << "Error: Could not open '" << path << "' for writing\n";
                        continue;
                    }
                    writeSweepCsv(outcomes, out);
                    std::cout << outcomes.size() << " sweep results written to " << path << "\n";
                }
                std::cout.flush();

            } else if (cmd == "templates") {
                std::string dir;
                if (!(iss >> dir)) {
                    std::cerr << "Usage: templates DIR\n";
                    continue;
                }
                generateTemplateFiles(dir);

            } else if (cmd == "quit") {
                break;

            } else if (cmd == "help") {
                printHelp();

            } else {
                std::cerr << "Unknown command: " << cmd << "\n";
                printHelp();
            }
        } catch (const std::exception& e) {
            std::cerr << "Error in " << cmd << " command: " << e.what() << "\n";
        }
    }

    return 0;
}
