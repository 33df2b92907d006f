#include "model/types.h"
#include "model/errors.h"
#include <cmath>

namespace fin {

void PipelineConfig::validate() const {
    const std::string stage = "config";
    if (customer_count < 0) throw ConfigurationError(stage, "customer_count must be >= 0");
    if (merchant_count < 0) throw ConfigurationError(stage, "merchant_count must be >= 0");
    if (transaction_count < 0) throw ConfigurationError(stage, "transaction_count must be >= 0");
    if (window_days < 1) throw ConfigurationError(stage, "window_days must be >= 1");
    if (registration_window_days < 1) {
        throw ConfigurationError(stage, "registration_window_days must be >= 1");
    }
    if (outlier_probability < 0.0 || outlier_probability > 1.0) {
        throw ConfigurationError(stage, "outlier_probability must be within [0, 1]");
    }
    if (sla_days < 0) throw ConfigurationError(stage, "sla_days must be >= 0");
    if (settlement_delay_min < 0 || settlement_delay_max < settlement_delay_min) {
        throw ConfigurationError(stage, "settlement delay range is empty or negative");
    }
}

const char* to_string(RiskCategory c) {
    switch (c) {
        case RiskCategory::LOW: return "LOW";
        case RiskCategory::MEDIUM: return "MEDIUM";
        case RiskCategory::HIGH: return "HIGH";
    }
    return "UNKNOWN";
}

const char* to_string(MerchantStatus s) {
    switch (s) {
        case MerchantStatus::ACTIVE: return "ACTIVE";
        case MerchantStatus::INACTIVE: return "INACTIVE";
        case MerchantStatus::SUSPENDED: return "SUSPENDED";
    }
    return "UNKNOWN";
}

const char* to_string(PaymentStatus s) {
    switch (s) {
        case PaymentStatus::SUCCESS: return "SUCCESS";
        case PaymentStatus::FAILED: return "FAILED";
        case PaymentStatus::PENDING: return "PENDING";
        case PaymentStatus::REFUNDED: return "REFUNDED";
    }
    return "UNKNOWN";
}

const char* to_string(SettlementStatus s) {
    switch (s) {
        case SettlementStatus::PENDING: return "PENDING";
        case SettlementStatus::COMPLETED: return "COMPLETED";
        case SettlementStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(EntityKind k) {
    switch (k) {
        case EntityKind::CUSTOMER: return "customers";
        case EntityKind::MERCHANT: return "merchants";
        case EntityKind::PAYMENT: return "payments";
        case EntityKind::SETTLEMENT: return "settlements";
    }
    return "unknown";
}

std::string make_id(const char* prefix, size_t sequence, int width) {
    std::string digits = std::to_string(sequence);
    if (static_cast<int>(digits.size()) < width) {
        digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
    }
    return prefix + digits;
}

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

int64_t to_cents(double value) {
    return static_cast<int64_t>(std::llround(value * 100.0));
}

double from_cents(int64_t cents) {
    return static_cast<double>(cents) / 100.0;
}

} // namespace fin
