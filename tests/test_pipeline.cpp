#include "test_framework.h"
#include "engine/pipeline.h"
#include "model/errors.h"
#include "storage/in_memory_sink.h"
#include "utils/calendar.h"
#include "utils/dataset_stats.h"
#include <map>
#include <set>
#include <utility>

using namespace fin;

namespace {

PipelineConfig quiet_config(uint64_t seed = 42) {
    PipelineConfig c;
    c.seed = seed;
    c.reference_time = 1'700'000'000;
    c.verbose = false;
    return c;
}

} // namespace

TEST(end_to_end_small_dataset) {
    auto config = quiet_config();
    RandomSource rng(config.seed);
    Pipeline pipeline(config, rng);
    Dataset data = pipeline.run(10, 3, 200);

    ASSERT_EQ(data.customers.size(), 10u);
    ASSERT_EQ(data.merchants.size(), 3u);
    ASSERT_EQ(data.payments.size(), 200u);

    std::set<std::string> customer_ids, merchant_ids;
    for (const auto& c : data.customers) customer_ids.insert(c.id);
    for (const auto& m : data.merchants) merchant_ids.insert(m.id);

    int dangling = 0;
    std::set<std::pair<std::string, EpochDay>> success_keys;
    int64_t success_cents = 0;
    for (const auto& p : data.payments) {
        if (!customer_ids.count(p.customer_id) || !merchant_ids.count(p.merchant_id)) dangling++;
        if (p.status == PaymentStatus::SUCCESS) {
            success_keys.insert({p.merchant_id, Calendar::day_of(p.transaction_time)});
            success_cents += to_cents(p.amount);
        }
    }
    ASSERT_EQ(dangling, 0);
    ASSERT_EQ(data.settlements.size(), success_keys.size());

    int64_t settled_cents = 0;
    for (const auto& s : data.settlements) settled_cents += to_cents(s.total_amount);
    ASSERT_EQ(settled_cents, success_cents);
}

TEST(settlement_totals_match_their_payments) {
    auto config = quiet_config(8);
    RandomSource rng(config.seed);
    Pipeline pipeline(config, rng);
    Dataset data = pipeline.run(100, 10, 3000);

    std::map<std::pair<std::string, EpochDay>, std::pair<int64_t, int>> expected;
    for (const auto& p : data.payments) {
        if (p.status != PaymentStatus::SUCCESS) continue;
        auto& e = expected[{p.merchant_id, Calendar::day_of(p.transaction_time)}];
        e.first += to_cents(p.amount);
        e.second++;
    }

    std::map<std::string, double> rates;
    for (const auto& m : data.merchants) rates[m.id] = m.commission_rate;

    int mismatches = 0;
    for (const auto& s : data.settlements) {
        auto it = expected.find({s.merchant_id, s.business_date});
        if (it == expected.end()) { mismatches++; continue; }
        if (to_cents(s.total_amount) != it->second.first) mismatches++;
        if (s.payment_count != it->second.second) mismatches++;
        double commission = round_cents(s.total_amount * rates[s.merchant_id] / 100.0);
        if (to_cents(s.commission_amount) != to_cents(commission)) mismatches++;
        if (to_cents(s.net_amount) != to_cents(s.total_amount) - to_cents(s.commission_amount)) mismatches++;
    }
    ASSERT_EQ(mismatches, 0);
    ASSERT_EQ(data.settlements.size(), expected.size());
}

TEST(same_seed_same_dataset) {
    auto config = quiet_config(77);
    RandomSource a(config.seed);
    RandomSource b(config.seed);
    Dataset da = Pipeline(config, a).run(20, 4, 500);
    Dataset db = Pipeline(config, b).run(20, 4, 500);

    bool same = da.payments.size() == db.payments.size() &&
                da.settlements.size() == db.settlements.size();
    for (size_t i = 0; same && i < da.payments.size(); ++i) {
        same = da.payments[i].customer_id == db.payments[i].customer_id &&
               da.payments[i].amount == db.payments[i].amount &&
               da.payments[i].status == db.payments[i].status &&
               da.payments[i].transaction_time == db.payments[i].transaction_time;
    }
    for (size_t i = 0; same && i < da.settlements.size(); ++i) {
        same = da.settlements[i].settlement_date == db.settlements[i].settlement_date &&
               da.settlements[i].status == db.settlements[i].status;
    }
    ASSERT_TRUE(same);
}

TEST(empty_population_aborts_before_any_data) {
    auto config = quiet_config();
    RandomSource rng(config.seed);
    Pipeline pipeline(config, rng);

    ASSERT_THROWS(pipeline.run(0, 3, 10), ConfigurationError);
    ASSERT_THROWS(pipeline.run(10, 0, 10), ConfigurationError);
    ASSERT_THROWS(pipeline.run(-1, 3, 10), ConfigurationError);

    // Nothing consumed from the random source by the rejected runs
    RandomSource fresh(config.seed);
    ASSERT_TRUE(rng.engine()() == fresh.engine()());
}

TEST(empty_populations_without_payments_are_fine) {
    auto config = quiet_config();
    RandomSource rng(config.seed);
    Pipeline pipeline(config, rng);
    Dataset data = pipeline.run(0, 0, 0);
    ASSERT_TRUE(data.customers.empty());
    ASSERT_TRUE(data.payments.empty());
    ASSERT_TRUE(data.settlements.empty());

    Dataset merchants_only = pipeline.run(5, 2, 0);
    ASSERT_EQ(merchants_only.merchants.size(), 2u);
    ASSERT_TRUE(merchants_only.settlements.empty());
}

TEST(invalid_config_rejected) {
    auto config = quiet_config();
    config.window_days = 0;
    RandomSource rng(1);
    ASSERT_THROWS(Pipeline p(config, rng), ConfigurationError);

    config = quiet_config();
    config.outlier_probability = 1.5;
    ASSERT_THROWS(Pipeline p(config, rng), ConfigurationError);
}

TEST(dangling_reference_is_integrity_error) {
    Dataset data;
    Customer c;
    c.id = "CUST00001";
    data.customers.push_back(c);
    Merchant m;
    m.id = "MERCH0001";
    data.merchants.push_back(m);
    Payment p;
    p.id = "PAY000001";
    p.customer_id = "CUST00404";
    p.merchant_id = "MERCH0001";
    data.payments.push_back(p);

    ASSERT_THROWS(Pipeline::check_references(data), IntegrityError);
    try {
        Pipeline::check_references(data);
    } catch (const IntegrityError& e) {
        ASSERT_TRUE(e.entity_id() == "CUST00404");
        ASSERT_TRUE(e.stage() == "payments");
    }

    data.payments[0].customer_id = "CUST00001";
    data.payments[0].merchant_id = "MERCH0404";
    ASSERT_THROWS(Pipeline::check_references(data), IntegrityError);
}

TEST(run_and_load_is_idempotent) {
    auto config = quiet_config();
    config.customer_count = 30;
    config.merchant_count = 5;
    config.transaction_count = 400;

    InMemorySink sink;
    RandomSource rng(config.seed);
    Pipeline pipeline(config, rng);
    BatchCounts summary = pipeline.run_and_load(sink);

    ASSERT_EQ(summary.customers, 30u);
    ASSERT_EQ(summary.payments, 400u);
    ASSERT_EQ(sink.row_count(EntityKind::PAYMENT), 400u);
    ASSERT_EQ(sink.row_count(EntityKind::SETTLEMENT), summary.settlements);

    // Reloading the same seed's dataset changes nothing
    RandomSource again(config.seed);
    Pipeline replay(config, again);
    Dataset data = replay.run();
    BatchCounts second = replay.load(data, sink);
    ASSERT_EQ(second.customers, 0u);
    ASSERT_EQ(second.merchants, 0u);
    ASSERT_EQ(second.payments, 0u);
    ASSERT_EQ(second.settlements, 0u);
    ASSERT_EQ(sink.row_count(EntityKind::CUSTOMER), 30u);
    ASSERT_EQ(sink.row_count(EntityKind::PAYMENT), 400u);
}

TEST(dataset_stats_consistent_with_dataset) {
    auto config = quiet_config(5);
    RandomSource rng(config.seed);
    Dataset data = Pipeline(config, rng).run(200, 20, 5000);
    DatasetStats s = StatsCalculator::compute(data);

    ASSERT_EQ(s.payments, 5000);
    ASSERT_EQ(s.successful + s.failed + s.pending + s.refunded, 5000);
    ASSERT_EQ(s.settlements_completed + s.settlements_pending + s.settlements_failed, s.settlements);

    double settled_total = 0.0;
    for (const auto& st : data.settlements) settled_total += st.total_amount;
    ASSERT_NEAR(s.settled_volume, settled_total, 0.01);
    ASSERT_NEAR(s.commission_total + s.net_total, s.settled_volume, 0.01);
    ASSERT_NEAR(s.outlier_rate, 0.05, 0.015);
    ASSERT_GT(s.success_rate, 0.70);
    ASSERT_LT(s.success_rate, 0.95);
}
