#include "kernel/RandomSource.h"

#include <utility>

double RandomSource::uniform(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    if (lo == hi) return lo;
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(engine_);
}

int RandomSource::uniformInt(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

bool RandomSource::bernoulli(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_) < p;
}

std::size_t RandomSource::index(std::size_t n) {
    if (n <= 1) return 0;
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(engine_);
}

std::size_t RandomSource::weightedIndex(const double* weights, std::size_t count) {
    if (count == 0) return 0;

    double total = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        if (weights[i] > 0.0) total += weights[i];
    }
    if (total <= 0.0) {
        return index(count);
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double target = dist(engine_);
    for (std::size_t i = 0; i < count; ++i) {
        if (weights[i] <= 0.0) continue;
        if (target < weights[i]) return i;
        target -= weights[i];
    }

    // Rounding can leave target marginally above the last positive weight
    for (std::size_t i = count; i-- > 0;) {
        if (weights[i] > 0.0) return i;
    }
    return count - 1;
}

std::uint64_t RandomSource::deriveSeed(std::uint64_t base, std::uint64_t stream) {
    std::uint64_t x = base + 0x9E3779B97F4A7C15ULL * (stream + 1);
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}
