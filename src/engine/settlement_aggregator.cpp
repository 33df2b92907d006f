#include "engine/settlement_aggregator.h"
#include "model/errors.h"
#include "utils/calendar.h"
#include <map>
#include <string>
#include <unordered_map>
#include <utility>

namespace fin {

namespace {

struct GroupTotals {
    int64_t total_cents = 0;
    int payment_count = 0;
};

} // namespace

SettlementAggregator::SettlementAggregator(RandomSource& rng, const SettlementParams& params)
    : rng_(rng),
      params_(params),
      status_({SettlementStatus::COMPLETED, SettlementStatus::PENDING, SettlementStatus::FAILED},
              {0.90, 0.08, 0.02}) {
    if (params_.sla_days < 0) {
        throw ConfigurationError("settlements", "sla_days must be >= 0");
    }
    if (params_.delay_min_days < 0 || params_.delay_max_days < params_.delay_min_days) {
        throw ConfigurationError("settlements", "settlement delay range is empty or negative");
    }
}

double SettlementAggregator::commission_for(double total_amount, double commission_rate) {
    return round_cents(total_amount * commission_rate / 100.0);
}

std::vector<Settlement> SettlementAggregator::aggregate(const std::vector<Payment>& payments,
                                                        const std::vector<Merchant>& merchants) {
    std::unordered_map<std::string, const Merchant*> merchant_index;
    merchant_index.reserve(merchants.size());
    for (const auto& m : merchants) {
        merchant_index[m.id] = &m;
    }

    // Ordered so that ids follow (merchant_id, day) order for a given seed
    std::map<std::pair<std::string, EpochDay>, GroupTotals> groups;

    for (const auto& p : payments) {
        if (p.status != PaymentStatus::SUCCESS) continue;

        if (merchant_index.find(p.merchant_id) == merchant_index.end()) {
            throw IntegrityError("settlements",
                                 "payment " + p.id + " references unknown merchant",
                                 p.merchant_id);
        }

        auto& g = groups[{p.merchant_id, Calendar::day_of(p.transaction_time)}];
        g.total_cents += to_cents(p.amount);
        g.payment_count++;
    }

    std::vector<Settlement> settlements;
    settlements.reserve(groups.size());
    size_t sequence = 0;

    for (const auto& [key, totals] : groups) {
        const Merchant& merchant = *merchant_index.at(key.first);

        Settlement s;
        s.id = make_id("SETTLE", ++sequence, 5);
        s.merchant_id = key.first;
        s.business_date = key.second;
        s.payment_count = totals.payment_count;
        s.total_amount = from_cents(totals.total_cents);
        s.commission_amount = commission_for(s.total_amount, merchant.commission_rate);
        s.net_amount = from_cents(totals.total_cents - to_cents(s.commission_amount));

        // Contractual date vs simulated processing delay
        s.expected_settlement_date = s.business_date + params_.sla_days;
        s.settlement_date = s.business_date +
            rng_.uniform_int(params_.delay_min_days, params_.delay_max_days);
        s.sla_breach = s.settlement_date > s.expected_settlement_date;

        s.status = status_.sample(rng_);
        settlements.push_back(std::move(s));
    }

    return settlements;
}

} // namespace fin
