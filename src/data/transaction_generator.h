#pragma once

#include "model/types.h"
#include "utils/random_source.h"
#include "utils/weighted_sampler.h"
#include <string>
#include <vector>

namespace fin {

struct TransactionParams {
    EpochSeconds reference_time = 0;   // end of the transaction window
    int window_days = 90;
    double outlier_probability = 0.05;
};

class TransactionGenerator {
public:
    TransactionGenerator(RandomSource& rng, const TransactionParams& params);

    // Samples customer and merchant independently, with replacement.
    // Throws ConfigurationError when count > 0 and either population is empty.
    std::vector<Payment> generate(const std::vector<Customer>& customers,
                                  const std::vector<Merchant>& merchants,
                                  int count);

    // Status table for a customer's risk tier
    WeightedSampler<PaymentStatus>& status_sampler(RiskCategory category);

    static constexpr double kRegularMin = 10.0;
    static constexpr double kRegularMax = 2000.0;
    static constexpr double kOutlierMin = 5000.0;
    static constexpr double kOutlierMax = 50000.0;
    static constexpr int kMinProcessingSeconds = 1;
    static constexpr int kMaxProcessingSeconds = 30;

    static const std::vector<std::string>& failure_reasons();
    static const std::vector<std::string>& payment_methods();

private:
    double sample_amount();
    EpochSeconds sample_timestamp();

    RandomSource& rng_;
    TransactionParams params_;
    WeightedSampler<PaymentStatus> high_risk_status_;
    WeightedSampler<PaymentStatus> medium_risk_status_;
    WeightedSampler<PaymentStatus> low_risk_status_;
};

} // namespace fin
