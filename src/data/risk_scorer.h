#pragma once

#include "model/types.h"
#include <algorithm>

namespace fin {

// Additive payment risk model. Each penalty is applied to the running score
// and the result is clamped to kMaxScore after every step.
class RiskScorer {
public:
    static constexpr double kMaxScore = 100.0;
    static constexpr double kLargeAmountThreshold = 5000.0;
    static constexpr double kLargeAmountPenalty = 30.0;
    static constexpr double kHighRiskPenalty = 20.0;
    static constexpr double kSuspiciousScore = 75.0;
    static constexpr double kSuspiciousAmount = 10000.0;

    // base is the uniform draw in [0, 100]; result is rounded to cents
    static double score(double base, double amount, RiskCategory category) {
        double s = std::min(kMaxScore, std::max(0.0, base));
        if (amount > kLargeAmountThreshold) {
            s = std::min(kMaxScore, s + kLargeAmountPenalty);
        }
        if (category == RiskCategory::HIGH) {
            s = std::min(kMaxScore, s + kHighRiskPenalty);
        }
        return round_cents(s);
    }

    // Either condition alone flags the payment
    static bool is_suspicious(double risk_score, double amount) {
        return risk_score > kSuspiciousScore || amount > kSuspiciousAmount;
    }
};

} // namespace fin
