#include "data/transaction_generator.h"
#include "data/risk_scorer.h"
#include "model/errors.h"
#include "utils/calendar.h"

namespace fin {

namespace {

const std::vector<PaymentStatus> kPaymentStatuses = {
    PaymentStatus::SUCCESS, PaymentStatus::FAILED, PaymentStatus::PENDING, PaymentStatus::REFUNDED
};

const std::vector<std::string> kPaymentMethods = {
    "CREDIT_CARD", "DEBIT_CARD", "BANK_TRANSFER", "PAYPAL", "CRYPTO", "WALLET"
};

const std::vector<std::string> kFailureReasons = {
    "Insufficient funds",
    "Card declined",
    "Authentication failed",
    "Network timeout",
    "Invalid card details",
    "Fraud detection triggered",
    "Daily limit exceeded"
};

const char* kCurrency = "USD";

} // namespace

TransactionGenerator::TransactionGenerator(RandomSource& rng, const TransactionParams& params)
    : rng_(rng),
      params_(params),
      high_risk_status_(kPaymentStatuses, {0.65, 0.25, 0.08, 0.02}),
      medium_risk_status_(kPaymentStatuses, {0.85, 0.10, 0.04, 0.01}),
      low_risk_status_(kPaymentStatuses, {0.95, 0.03, 0.015, 0.005}) {
    if (params_.window_days < 1) {
        throw ConfigurationError("payments", "window_days must be >= 1");
    }
    if (params_.outlier_probability < 0.0 || params_.outlier_probability > 1.0) {
        throw ConfigurationError("payments", "outlier_probability must be within [0, 1]");
    }
}

const std::vector<std::string>& TransactionGenerator::failure_reasons() { return kFailureReasons; }
const std::vector<std::string>& TransactionGenerator::payment_methods() { return kPaymentMethods; }

WeightedSampler<PaymentStatus>& TransactionGenerator::status_sampler(RiskCategory category) {
    switch (category) {
        case RiskCategory::HIGH: return high_risk_status_;
        case RiskCategory::MEDIUM: return medium_risk_status_;
        case RiskCategory::LOW: break;
    }
    return low_risk_status_;
}

std::vector<Payment> TransactionGenerator::generate(const std::vector<Customer>& customers,
                                                    const std::vector<Merchant>& merchants,
                                                    int count) {
    if (count < 0) {
        throw ConfigurationError("payments", "transaction count must be >= 0, got " +
                                 std::to_string(count));
    }
    if (count > 0 && customers.empty()) {
        throw ConfigurationError("payments", "cannot sample payments from an empty customer population");
    }
    if (count > 0 && merchants.empty()) {
        throw ConfigurationError("payments", "cannot sample payments from an empty merchant population");
    }

    std::vector<Payment> payments;
    payments.reserve(count);

    for (int i = 0; i < count; ++i) {
        const Customer& customer = rng_.choice(customers);
        const Merchant& merchant = rng_.choice(merchants);

        Payment p;
        p.id = make_id("PAY", i + 1, 6);
        p.customer_id = customer.id;
        p.merchant_id = merchant.id;
        p.status = status_sampler(customer.risk_category).sample(rng_);
        p.amount = sample_amount();

        double base = rng_.uniform_real(0.0, RiskScorer::kMaxScore);
        p.risk_score = RiskScorer::score(base, p.amount, customer.risk_category);
        p.is_suspicious = RiskScorer::is_suspicious(p.risk_score, p.amount);

        p.transaction_time = sample_timestamp();
        p.currency = kCurrency;
        p.payment_method = rng_.choice(kPaymentMethods);
        p.processing_time_seconds = static_cast<int>(
            rng_.uniform_int(kMinProcessingSeconds, kMaxProcessingSeconds));
        if (p.status == PaymentStatus::FAILED) {
            p.failure_reason = rng_.choice(kFailureReasons);
        }

        payments.push_back(std::move(p));
    }

    return payments;
}

// Mixture: rare large transactions on top of a regular retail range
double TransactionGenerator::sample_amount() {
    if (rng_.bernoulli(params_.outlier_probability)) {
        return round_cents(rng_.uniform_real(kOutlierMin, kOutlierMax));
    }
    return round_cents(rng_.uniform_real(kRegularMin, kRegularMax));
}

// Day, hour and minute drawn independently inside [reference - window, reference)
EpochSeconds TransactionGenerator::sample_timestamp() {
    const EpochSeconds window_start =
        params_.reference_time - static_cast<int64_t>(params_.window_days) * kSecondsPerDay;
    int64_t day = rng_.uniform_int(0, params_.window_days - 1);
    int64_t hour = rng_.uniform_int(0, 23);
    int64_t minute = rng_.uniform_int(0, 59);
    return window_start + day * kSecondsPerDay + hour * 3600 + minute * 60;
}

} // namespace fin
