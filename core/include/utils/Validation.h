#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

// Invariant checks for the update passes. Active in debug builds only;
// release builds compile them away.
namespace validation {

#ifndef NDEBUG
inline void checkFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw std::logic_error(std::string("non-finite value for ") + what);
    }
}

inline void checkRange(double value, double lo, double hi, const char* what) {
    checkFinite(value, what);
    if (value < lo || value > hi) {
        throw std::logic_error(std::string(what) + " out of range: " + std::to_string(value) +
                               " not in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

inline void checkNonNegative(double value, const char* what) {
    checkFinite(value, what);
    if (value < 0.0) {
        throw std::logic_error(std::string(what) + " is negative: " + std::to_string(value));
    }
}

inline void checkCapacity(std::size_t roster, int capacity, const char* what) {
    if (static_cast<long long>(roster) > static_cast<long long>(capacity)) {
        throw std::logic_error(std::string(what) + ": roster " + std::to_string(roster) +
                               " exceeds capacity " + std::to_string(capacity));
    }
}
#else
inline void checkFinite(double, const char*) {}
inline void checkRange(double, double, double, const char*) {}
inline void checkNonNegative(double, const char*) {}
inline void checkCapacity(std::size_t, int, const char*) {}
#endif

}  // namespace validation

#endif
