#pragma once

#include "utils/random_source.h"
#include <vector>
#include <random>
#include <stdexcept>
#include <string>

namespace fin {

// Categorical draw over a fixed outcome table. Weights are relative and
// need not sum to one.
template <typename T>
class WeightedSampler {
public:
    WeightedSampler(std::vector<T> outcomes, std::vector<double> weights)
        : outcomes_(std::move(outcomes)), weights_(std::move(weights)) {
        if (outcomes_.empty()) {
            throw std::invalid_argument("WeightedSampler: no outcomes");
        }
        if (outcomes_.size() != weights_.size()) {
            throw std::invalid_argument("WeightedSampler: " + std::to_string(outcomes_.size()) +
                                        " outcomes but " + std::to_string(weights_.size()) +
                                        " weights");
        }
        double total = 0.0;
        for (double w : weights_) {
            if (!(w >= 0.0)) throw std::invalid_argument("WeightedSampler: negative weight");
            total += w;
        }
        if (total <= 0.0) throw std::invalid_argument("WeightedSampler: weights sum to zero");

        dist_ = std::discrete_distribution<size_t>(weights_.begin(), weights_.end());
    }

    const T& sample(RandomSource& rng) {
        return outcomes_[dist_(rng.engine())];
    }

    // Normalized probability of the outcome at position i
    double probability(size_t i) const {
        return dist_.probabilities().at(i);
    }

    const std::vector<T>& outcomes() const { return outcomes_; }
    size_t size() const { return outcomes_.size(); }

private:
    std::vector<T> outcomes_;
    std::vector<double> weights_;
    std::discrete_distribution<size_t> dist_;
};

} // namespace fin
