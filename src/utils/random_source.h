#pragma once

#include <random>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace fin {

// Seedable random source handed to every generator stage by reference.
// One instance drives one dataset; runs in parallel each own their own.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 42) : rng_(seed), seed_(seed) {}

    // Uniform real in [lo, hi)
    double uniform_real(double lo, double hi) {
        std::uniform_real_distribution<double> dist(lo, hi);
        return dist(rng_);
    }

    // Uniform integer in [lo, hi]
    int64_t uniform_int(int64_t lo, int64_t hi) {
        std::uniform_int_distribution<int64_t> dist(lo, hi);
        return dist(rng_);
    }

    bool bernoulli(double p) {
        std::bernoulli_distribution dist(p);
        return dist(rng_);
    }

    size_t index(size_t n) {
        if (n == 0) throw std::invalid_argument("RandomSource::index on empty range");
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(rng_);
    }

    template <typename T>
    const T& choice(const std::vector<T>& items) {
        return items[index(items.size())];
    }

    void reseed(uint64_t seed) {
        rng_.seed(seed);
        seed_ = seed;
    }

    uint64_t seed() const { return seed_; }
    std::mt19937_64& engine() { return rng_; }

private:
    std::mt19937_64 rng_;
    uint64_t seed_;
};

} // namespace fin
