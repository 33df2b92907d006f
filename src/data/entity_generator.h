#pragma once

#include "model/types.h"
#include "utils/random_source.h"
#include "utils/weighted_sampler.h"
#include <string>
#include <vector>

namespace fin {

class EntityGenerator {
public:
    EntityGenerator(RandomSource& rng, EpochSeconds reference_time,
                    int registration_window_days = 730);

    // Customers CUST00001..CUSTn with credit score and derived risk tier
    std::vector<Customer> generate_customers(int count);

    // Merchants MERCH0001..MERCHm with fixed commission rate and status
    std::vector<Merchant> generate_merchants(int count);

    // score >= 720 -> LOW, 600..719 -> MEDIUM, below 600 -> HIGH
    static RiskCategory risk_category_for(int credit_score);

    static constexpr int kMinCreditScore = 300;
    static constexpr int kMaxCreditScore = 850;
    static constexpr double kMinCommissionRate = 1.5;
    static constexpr double kMaxCommissionRate = 5.0;

    static const std::vector<std::string>& countries();
    static const std::vector<std::string>& business_types();

private:
    std::string person_name();
    std::string company_name();
    std::string email_for(const std::string& name, size_t sequence);
    std::string phone_number();

    RandomSource& rng_;
    EpochSeconds reference_time_;
    int registration_window_days_;
    WeightedSampler<MerchantStatus> merchant_status_;
};

} // namespace fin
