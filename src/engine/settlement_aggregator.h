#pragma once

#include "model/types.h"
#include "utils/random_source.h"
#include "utils/weighted_sampler.h"
#include <vector>

namespace fin {

struct SettlementParams {
    int sla_days = 2;
    int delay_min_days = 1;
    int delay_max_days = 5;
};

class SettlementAggregator {
public:
    SettlementAggregator(RandomSource& rng, const SettlementParams& params = {});

    // One settlement per (merchant, calendar day) with at least one SUCCESS
    // payment, in ascending (merchant_id, day) order. Throws IntegrityError
    // if a SUCCESS payment names an unknown merchant.
    std::vector<Settlement> aggregate(const std::vector<Payment>& payments,
                                      const std::vector<Merchant>& merchants);

    // round(total * rate / 100, 2)
    static double commission_for(double total_amount, double commission_rate);

private:
    RandomSource& rng_;
    SettlementParams params_;
    WeightedSampler<SettlementStatus> status_;
};

} // namespace fin
