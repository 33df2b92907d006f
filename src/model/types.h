#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace fin {

using EpochSeconds = int64_t;  // Unix epoch seconds, UTC
using EpochDay = int64_t;      // Days since 1970-01-01, UTC

enum class RiskCategory { LOW, MEDIUM, HIGH };
enum class MerchantStatus { ACTIVE, INACTIVE, SUSPENDED };
enum class PaymentStatus { SUCCESS, FAILED, PENDING, REFUNDED };
enum class SettlementStatus { PENDING, COMPLETED, FAILED };
enum class EntityKind { CUSTOMER, MERCHANT, PAYMENT, SETTLEMENT };

struct Customer {
    std::string id;
    std::string name;
    std::string email;
    std::string phone;
    std::string country;
    EpochSeconds registration_time = 0;
    int credit_score = 0;          // 300 to 850
    RiskCategory risk_category = RiskCategory::MEDIUM;
};

struct Merchant {
    std::string id;
    std::string name;
    std::string business_type;
    std::string country;
    double commission_rate = 0.0;  // percent, 1.5 to 5.0
    MerchantStatus status = MerchantStatus::ACTIVE;
};

struct Payment {
    std::string id;
    std::string customer_id;
    std::string merchant_id;
    double amount = 0.0;
    std::string currency;
    std::string payment_method;
    PaymentStatus status = PaymentStatus::SUCCESS;
    EpochSeconds transaction_time = 0;
    int processing_time_seconds = 0;
    std::optional<std::string> failure_reason;  // set iff FAILED
    double risk_score = 0.0;                    // 0 to 100
    bool is_suspicious = false;
};

struct Settlement {
    std::string id;
    std::string merchant_id;
    EpochDay business_date = 0;       // calendar day the payments were taken
    EpochDay settlement_date = 0;     // simulated payout day
    EpochDay expected_settlement_date = 0;
    double total_amount = 0.0;
    double commission_amount = 0.0;
    double net_amount = 0.0;
    int payment_count = 0;
    SettlementStatus status = SettlementStatus::PENDING;
    bool sla_breach = false;
};

struct Dataset {
    std::vector<Customer> customers;
    std::vector<Merchant> merchants;
    std::vector<Payment> payments;
    std::vector<Settlement> settlements;
};

struct PipelineConfig {
    int customer_count = 500;
    int merchant_count = 50;
    int transaction_count = 5000;
    uint64_t seed = 42;
    EpochSeconds reference_time = 0;      // 0 = wall clock at run time
    int window_days = 90;                 // trailing transaction window
    int registration_window_days = 730;   // customers registered in last 2 years
    double outlier_probability = 0.05;    // share of large-amount payments
    int sla_days = 2;                     // contractual settlement delay
    int settlement_delay_min = 1;
    int settlement_delay_max = 5;
    bool verbose = true;

    // Throws ConfigurationError on out-of-range values
    void validate() const;
};

// Row counts per entity type: rows inserted by Pipeline::load, batch sizes
// from Pipeline::run_and_load
struct BatchCounts {
    size_t customers = 0;
    size_t merchants = 0;
    size_t payments = 0;
    size_t settlements = 0;
};

const char* to_string(RiskCategory c);
const char* to_string(MerchantStatus s);
const char* to_string(PaymentStatus s);
const char* to_string(SettlementStatus s);
const char* to_string(EntityKind k);

// Zero-padded sequence id, e.g. make_id("CUST", 7, 5) == "CUST00007"
std::string make_id(const char* prefix, size_t sequence, int width);

// Round half away from zero to whole cents
double round_cents(double value);
int64_t to_cents(double value);
double from_cents(int64_t cents);

} // namespace fin
