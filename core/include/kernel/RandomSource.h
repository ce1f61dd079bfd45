#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

// Seeded random stream owned by one model instance. Every agent operation
// that needs randomness takes it by reference; there is no global generator.
class RandomSource {
public:
    explicit RandomSource(std::uint64_t seed = 42) : engine_(seed), seed_(seed) {}

    void seed(std::uint64_t seed) {
        seed_ = seed;
        engine_.seed(seed);
    }
    std::uint64_t seedValue() const { return seed_; }

    // Uniform real in [lo, hi]
    double uniform(double lo, double hi);

    // Uniform integer in [lo, hi] (inclusive); reversed bounds are swapped
    int uniformInt(int lo, int hi);

    // true with probability p
    bool bernoulli(double p);

    // Uniform index in [0, n); n must be > 0
    std::size_t index(std::size_t n);

    // Categorical draw proportional to weights. Non-positive total weight
    // degrades to a uniform pick over all categories.
    std::size_t weightedIndex(const double* weights, std::size_t count);

    template <std::size_t N>
    std::size_t weightedIndex(const std::array<double, N>& weights) {
        return weightedIndex(weights.data(), N);
    }
    std::size_t weightedIndex(const std::vector<double>& weights) {
        return weightedIndex(weights.data(), weights.size());
    }

    // SplitMix64 mix of a base seed with a stream number. Used to give
    // independent model instances in a batch their own reproducible stream.
    static std::uint64_t deriveSeed(std::uint64_t base, std::uint64_t stream);

private:
    std::mt19937_64 engine_;
    std::uint64_t seed_;
};

#endif
