#ifndef CONFIG_FILES_H
#define CONFIG_FILES_H

#include <string>
#include <vector>

#include "modules/Parameters.h"

// CSV parameter files kept together in one directory
constexpr const char* kCountryParamsFile = "country_parameters.csv";
constexpr const char* kCitizenParamsFile = "citizen_parameters.csv";
constexpr const char* kBusinessParamsFile = "business_parameters.csv";

struct LoadedConfig {
    std::vector<CountryConfig> countries;
    CitizenParamsTable citizenParams;
    BusinessParamsTable businessParams;
};

// Each loader throws std::runtime_error naming the file (and line) when the
// file cannot be read, a required column is missing, a value is not numeric
// or a development tier is unknown. Empty cells in the country file mean the
// field is unset.
std::vector<CountryConfig> loadCountryConfigs(const std::string& path);
CitizenParamsTable loadCitizenParams(const std::string& path);
BusinessParamsTable loadBusinessParams(const std::string& path);

// Loads all three files from `dir`; writes the templates first when any of
// them is missing.
LoadedConfig loadConfigDirectory(const std::string& dir);

// Writes the three template files (two countries, high and low tiers)
void generateTemplateFiles(const std::string& dir);

#endif
