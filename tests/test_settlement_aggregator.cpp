#include "test_framework.h"
#include "engine/settlement_aggregator.h"
#include "model/errors.h"
#include "utils/calendar.h"

using namespace fin;

namespace {

const EpochDay kDay = Calendar::days_from_civil(2024, 3, 10);

Payment payment(const std::string& id, const std::string& merchant, double amount,
                EpochSeconds ts, PaymentStatus status = PaymentStatus::SUCCESS) {
    Payment p;
    p.id = id;
    p.customer_id = "CUST00001";
    p.merchant_id = merchant;
    p.amount = amount;
    p.transaction_time = ts;
    p.status = status;
    return p;
}

Merchant merchant(const std::string& id, double rate) {
    Merchant m;
    m.id = id;
    m.commission_rate = rate;
    return m;
}

EpochSeconds at(EpochDay day, int hour, int minute) {
    return Calendar::start_of_day(day) + hour * 3600 + minute * 60;
}

} // namespace

TEST(settlement_totals_commission_and_net) {
    RandomSource rng(1);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0001", 2.5), merchant("MERCH0002", 1.75)};
    std::vector<Payment> payments = {
        payment("PAY000001", "MERCH0001", 400.00, at(kDay, 9, 0)),
        payment("PAY000002", "MERCH0001", 600.00, at(kDay, 17, 30)),
        payment("PAY000003", "MERCH0002", 333.33, at(kDay, 12, 0)),
    };

    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 2u);

    const Settlement& a = settlements[0];
    ASSERT_TRUE(a.merchant_id == "MERCH0001");
    ASSERT_TRUE(a.id == "SETTLE00001");
    ASSERT_EQ(a.business_date, kDay);
    ASSERT_EQ(a.payment_count, 2);
    ASSERT_NEAR(a.total_amount, 1000.00, 1e-9);
    ASSERT_NEAR(a.commission_amount, 25.00, 1e-9);
    ASSERT_NEAR(a.net_amount, 975.00, 1e-9);

    const Settlement& b = settlements[1];
    ASSERT_TRUE(b.merchant_id == "MERCH0002");
    ASSERT_TRUE(b.id == "SETTLE00002");
    ASSERT_NEAR(b.total_amount, 333.33, 1e-9);
    ASSERT_NEAR(b.commission_amount, 5.83, 1e-9);   // 5.833275 rounded
    ASSERT_NEAR(b.net_amount, 327.50, 1e-9);
}

TEST(settlement_sums_are_exact_to_the_cent) {
    RandomSource rng(2);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0001", 3.0)};
    std::vector<Payment> payments;
    for (int i = 0; i < 1000; ++i) {
        payments.push_back(payment("PAY" + std::to_string(i), "MERCH0001", 0.10, at(kDay, i % 24, 0)));
    }
    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 1u);
    ASSERT_TRUE(settlements[0].total_amount == 100.00);
    ASSERT_TRUE(settlements[0].commission_amount == 3.00);
    ASSERT_TRUE(settlements[0].net_amount == 97.00);
}

TEST(commission_rounding) {
    ASSERT_NEAR(SettlementAggregator::commission_for(1000.0, 2.5), 25.0, 1e-9);
    ASSERT_NEAR(SettlementAggregator::commission_for(123.45, 4.99), 6.16, 1e-9);
    ASSERT_NEAR(SettlementAggregator::commission_for(0.0, 5.0), 0.0, 1e-9);
}

TEST(only_success_payments_settle) {
    RandomSource rng(3);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0001", 2.0), merchant("MERCH0002", 2.0)};
    std::vector<Payment> payments = {
        payment("PAY000001", "MERCH0001", 100.00, at(kDay, 10, 0)),
        payment("PAY000002", "MERCH0001", 900.00, at(kDay, 11, 0), PaymentStatus::FAILED),
        payment("PAY000003", "MERCH0001", 800.00, at(kDay, 12, 0), PaymentStatus::REFUNDED),
        // Merchant with only non-success payments gets no settlement
        payment("PAY000004", "MERCH0002", 50.00, at(kDay, 12, 0), PaymentStatus::PENDING),
        payment("PAY000005", "MERCH0002", 70.00, at(kDay + 1, 8, 0), PaymentStatus::FAILED),
    };

    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 1u);
    ASSERT_EQ(settlements[0].payment_count, 1);
    ASSERT_NEAR(settlements[0].total_amount, 100.00, 1e-9);
}

TEST(grouping_discards_time_of_day) {
    RandomSource rng(4);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0001", 2.0)};
    std::vector<Payment> payments = {
        payment("PAY000001", "MERCH0001", 10.00, at(kDay, 0, 0)),
        payment("PAY000002", "MERCH0001", 20.00, at(kDay, 23, 59)),
        payment("PAY000003", "MERCH0001", 30.00, at(kDay + 1, 0, 1)),
    };

    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 2u);
    ASSERT_EQ(settlements[0].business_date, kDay);
    ASSERT_NEAR(settlements[0].total_amount, 30.00, 1e-9);
    ASSERT_EQ(settlements[1].business_date, kDay + 1);
    ASSERT_NEAR(settlements[1].total_amount, 30.00, 1e-9);
}

TEST(sla_breach_iff_delay_exceeds_two_days) {
    RandomSource rng(5);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants;
    std::vector<Payment> payments;
    // 20 merchants x 100 days = 2000 distinct settlement keys
    for (int m = 0; m < 20; ++m) {
        merchants.push_back(merchant(make_id("MERCH", m + 1, 4), 2.0));
        for (int d = 0; d < 100; ++d) {
            payments.push_back(payment("P" + std::to_string(m) + "_" + std::to_string(d),
                                       merchants.back().id, 25.00, at(kDay + d, 12, 0)));
        }
    }

    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 2000u);

    int breaches = 0;
    int violations = 0;
    int delay_counts[6] = {0, 0, 0, 0, 0, 0};
    int completed = 0;
    for (const auto& s : settlements) {
        int64_t delay = s.settlement_date - s.business_date;
        if (delay < 1 || delay > 5) { violations++; continue; }
        delay_counts[delay]++;
        if (s.expected_settlement_date != s.business_date + 2) violations++;
        if (s.sla_breach != (s.settlement_date > s.expected_settlement_date)) violations++;
        if (s.sla_breach != (delay > 2)) violations++;
        if (s.sla_breach) breaches++;
        if (s.status == SettlementStatus::COMPLETED) completed++;
    }
    ASSERT_EQ(violations, 0);
    for (int d = 1; d <= 5; ++d) ASSERT_GT(delay_counts[d], 0);

    // Binomial sd = sqrt(0.6 * 0.4 / 2000) ~ 0.011
    ASSERT_NEAR(breaches / 2000.0, 0.60, 0.05);
    ASSERT_NEAR(completed / 2000.0, 0.90, 0.03);
}

TEST(settlement_ids_are_sequential) {
    RandomSource rng(6);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0002", 2.0), merchant("MERCH0001", 2.0)};
    std::vector<Payment> payments = {
        payment("PAY000001", "MERCH0002", 10.00, at(kDay, 1, 0)),
        payment("PAY000002", "MERCH0001", 10.00, at(kDay + 3, 1, 0)),
        payment("PAY000003", "MERCH0001", 10.00, at(kDay, 1, 0)),
    };
    auto settlements = agg.aggregate(payments, merchants);
    ASSERT_EQ(settlements.size(), 3u);
    // Ascending (merchant, day) regardless of input order
    ASSERT_TRUE(settlements[0].id == "SETTLE00001" && settlements[0].merchant_id == "MERCH0001");
    ASSERT_EQ(settlements[0].business_date, kDay);
    ASSERT_TRUE(settlements[1].id == "SETTLE00002" && settlements[1].merchant_id == "MERCH0001");
    ASSERT_EQ(settlements[1].business_date, kDay + 3);
    ASSERT_TRUE(settlements[2].id == "SETTLE00003" && settlements[2].merchant_id == "MERCH0002");
}

TEST(unknown_merchant_is_integrity_error) {
    RandomSource rng(7);
    SettlementAggregator agg(rng);
    std::vector<Merchant> merchants = {merchant("MERCH0001", 2.0)};
    std::vector<Payment> payments = {payment("PAY000009", "MERCH9999", 10.00, at(kDay, 1, 0))};

    ASSERT_THROWS(agg.aggregate(payments, merchants), IntegrityError);
    try {
        agg.aggregate(payments, merchants);
    } catch (const IntegrityError& e) {
        ASSERT_TRUE(e.stage() == "settlements");
        ASSERT_TRUE(e.entity_id() == "MERCH9999");
    }
}

TEST(empty_payment_batch_yields_no_settlements) {
    RandomSource rng(8);
    SettlementAggregator agg(rng);
    ASSERT_TRUE(agg.aggregate({}, {}).empty());
}

TEST(invalid_delay_range_rejected) {
    RandomSource rng(9);
    SettlementParams bad;
    bad.delay_min_days = 4;
    bad.delay_max_days = 2;
    ASSERT_THROWS(SettlementAggregator agg(rng, bad), ConfigurationError);
}
