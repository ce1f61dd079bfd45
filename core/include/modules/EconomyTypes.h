#ifndef ECONOMY_TYPES_H
#define ECONOMY_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// Shared economic type definitions
constexpr int kExpertiseLevels = 4;
constexpr int kBusinessTypes = 6;

enum class Expertise : std::uint8_t {
    Low = 0,
    Medium = 1,
    High = 2,
    Expert = 3
};

enum class BusinessType : std::uint8_t {
    ManufacturingLocalConsumers = 0,
    ManufacturingLocalBusinesses = 1,
    ManufacturingExport = 2,
    ImportCitizensConsumers = 3,
    ImportBusinessCustomers = 4,
    AI = 5
};

// Employee classification used for salary bands on hire
enum class CollarTier : std::uint8_t {
    BlueCollar = 0,   // low / medium expertise
    WhiteCollar = 1,  // high expertise
    Expert = 2
};

// Bucket of a country's development_level selecting generation parameters
enum class DevelopmentTier : std::uint8_t {
    Low = 0,     // <= 0.4
    Medium = 1,  // (0.4, 0.7]
    High = 2     // > 0.7
};

inline bool isManufacturing(BusinessType t) {
    return t == BusinessType::ManufacturingLocalConsumers ||
           t == BusinessType::ManufacturingLocalBusinesses ||
           t == BusinessType::ManufacturingExport;
}

inline bool isImport(BusinessType t) {
    return t == BusinessType::ImportCitizensConsumers ||
           t == BusinessType::ImportBusinessCustomers;
}

inline CollarTier collarTierFor(Expertise e) {
    switch (e) {
        case Expertise::Expert: return CollarTier::Expert;
        case Expertise::High:   return CollarTier::WhiteCollar;
        default:                return CollarTier::BlueCollar;
    }
}

inline DevelopmentTier developmentTierFor(double development_level) {
    if (development_level > 0.7) return DevelopmentTier::High;
    if (development_level > 0.4) return DevelopmentTier::Medium;
    return DevelopmentTier::Low;
}

const char* toString(Expertise e);
const char* toString(BusinessType t);
const char* toString(DevelopmentTier d);

// Name lookups for configuration files; return false on unknown names
bool parseDevelopmentTier(const std::string& name, DevelopmentTier& out);

#endif
