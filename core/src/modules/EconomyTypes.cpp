#include "modules/EconomyTypes.h"

#include <algorithm>
#include <cctype>

namespace {
constexpr std::array<const char*, kExpertiseLevels> kExpertiseNames = {
    "low", "medium", "high", "expert"
};

constexpr std::array<const char*, kBusinessTypes> kBusinessTypeNames = {
    "manufacturing_local_consumers",
    "manufacturing_local_businesses",
    "manufacturing_export",
    "import_citizens_consumers",
    "import_business_customers",
    "ai"
};

constexpr std::array<const char*, 3> kTierNames = {"low", "medium", "high"};

std::string normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

template <std::size_t N>
bool lookup(const std::array<const char*, N>& names, const std::string& name, std::size_t& idx) {
    const std::string key = normalize(name);
    auto it = std::find_if(names.begin(), names.end(),
                           [&key](const char* candidate) { return key == candidate; });
    if (it == names.end()) return false;
    idx = static_cast<std::size_t>(it - names.begin());
    return true;
}
}

const char* toString(Expertise e) {
    return kExpertiseNames[static_cast<std::size_t>(e)];
}

const char* toString(BusinessType t) {
    return kBusinessTypeNames[static_cast<std::size_t>(t)];
}

const char* toString(DevelopmentTier d) {
    return kTierNames[static_cast<std::size_t>(d)];
}

bool parseDevelopmentTier(const std::string& name, DevelopmentTier& out) {
    std::size_t idx = 0;
    if (!lookup(kTierNames, name, idx)) return false;
    out = static_cast<DevelopmentTier>(idx);
    return true;
}
