#pragma once

#include "model/types.h"
#include "data/transaction_generator.h"
#include <vector>
#include <cstdint>

namespace fin {

struct DatasetStats {
    int customers = 0;
    int merchants = 0;
    int payments = 0;
    int settlements = 0;

    // Payment side
    int successful = 0;
    int failed = 0;
    int pending = 0;
    int refunded = 0;
    int suspicious = 0;
    int outliers = 0;              // amount >= outlier floor
    int high_risk_customers = 0;
    double success_rate = 0.0;
    double suspicious_rate = 0.0;
    double outlier_rate = 0.0;
    double gross_volume = 0.0;     // all payments
    double settled_volume = 0.0;   // SUCCESS payments only
    double avg_amount = 0.0;
    double avg_risk_score = 0.0;
    double avg_processing_seconds = 0.0;

    // Settlement side
    int settlements_completed = 0;
    int settlements_pending = 0;
    int settlements_failed = 0;
    int sla_breaches = 0;
    double sla_breach_rate = 0.0;
    double commission_total = 0.0;
    double net_total = 0.0;
};

class StatsCalculator {
public:
    static DatasetStats compute(const Dataset& d) {
        DatasetStats s{};
        s.customers = static_cast<int>(d.customers.size());
        s.merchants = static_cast<int>(d.merchants.size());
        s.payments = static_cast<int>(d.payments.size());
        s.settlements = static_cast<int>(d.settlements.size());

        for (const auto& c : d.customers) {
            if (c.risk_category == RiskCategory::HIGH) s.high_risk_customers++;
        }

        // Sums in cents so totals match settlement arithmetic exactly
        int64_t gross_cents = 0;
        int64_t settled_cents = 0;
        double risk_sum = 0.0;
        int64_t processing_sum = 0;

        for (const auto& p : d.payments) {
            switch (p.status) {
                case PaymentStatus::SUCCESS:
                    s.successful++;
                    settled_cents += to_cents(p.amount);
                    break;
                case PaymentStatus::FAILED: s.failed++; break;
                case PaymentStatus::PENDING: s.pending++; break;
                case PaymentStatus::REFUNDED: s.refunded++; break;
            }
            if (p.is_suspicious) s.suspicious++;
            if (p.amount >= TransactionGenerator::kOutlierMin) s.outliers++;
            gross_cents += to_cents(p.amount);
            risk_sum += p.risk_score;
            processing_sum += p.processing_time_seconds;
        }

        s.gross_volume = from_cents(gross_cents);
        s.settled_volume = from_cents(settled_cents);
        if (s.payments > 0) {
            s.success_rate = static_cast<double>(s.successful) / s.payments;
            s.suspicious_rate = static_cast<double>(s.suspicious) / s.payments;
            s.outlier_rate = static_cast<double>(s.outliers) / s.payments;
            s.avg_amount = s.gross_volume / s.payments;
            s.avg_risk_score = risk_sum / s.payments;
            s.avg_processing_seconds = static_cast<double>(processing_sum) / s.payments;
        }

        int64_t commission_cents = 0;
        int64_t net_cents = 0;
        for (const auto& st : d.settlements) {
            switch (st.status) {
                case SettlementStatus::COMPLETED: s.settlements_completed++; break;
                case SettlementStatus::PENDING: s.settlements_pending++; break;
                case SettlementStatus::FAILED: s.settlements_failed++; break;
            }
            if (st.sla_breach) s.sla_breaches++;
            commission_cents += to_cents(st.commission_amount);
            net_cents += to_cents(st.net_amount);
        }

        s.commission_total = from_cents(commission_cents);
        s.net_total = from_cents(net_cents);
        if (s.settlements > 0) {
            s.sla_breach_rate = static_cast<double>(s.sla_breaches) / s.settlements;
        }

        return s;
    }
};

} // namespace fin
