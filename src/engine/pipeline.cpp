#include "engine/pipeline.h"
#include "data/entity_generator.h"
#include "data/transaction_generator.h"
#include "engine/settlement_aggregator.h"
#include "model/errors.h"
#include "utils/calendar.h"
#include "utils/timer.h"
#include <iostream>
#include <iomanip>
#include <unordered_set>

namespace fin {

Pipeline::Pipeline(const PipelineConfig& config, RandomSource& rng)
    : config_(config),
      rng_(rng),
      reference_time_(config.reference_time != 0 ? config.reference_time : Calendar::now()) {
    config_.validate();
}

Dataset Pipeline::run() {
    return run(config_.customer_count, config_.merchant_count, config_.transaction_count);
}

Dataset Pipeline::run(int customer_count, int merchant_count, int transaction_count) {
    PipelineConfig request = config_;
    request.customer_count = customer_count;
    request.merchant_count = merchant_count;
    request.transaction_count = transaction_count;
    request.validate();

    if (transaction_count > 0 && (customer_count == 0 || merchant_count == 0)) {
        throw ConfigurationError("pipeline",
            "transactions requested from an empty population (customers=" +
            std::to_string(customer_count) + ", merchants=" +
            std::to_string(merchant_count) + ")");
    }

    Dataset data;
    Timer timer;

    EntityGenerator entities(rng_, reference_time_, config_.registration_window_days);
    data.customers = entities.generate_customers(customer_count);
    log_stage("customers", data.customers.size(), timer.elapsed_ms());

    timer.reset();
    data.merchants = entities.generate_merchants(merchant_count);
    log_stage("merchants", data.merchants.size(), timer.elapsed_ms());

    timer.reset();
    TransactionParams tx;
    tx.reference_time = reference_time_;
    tx.window_days = config_.window_days;
    tx.outlier_probability = config_.outlier_probability;
    TransactionGenerator transactions(rng_, tx);
    data.payments = transactions.generate(data.customers, data.merchants, transaction_count);
    log_stage("payments", data.payments.size(), timer.elapsed_ms());

    check_references(data);

    timer.reset();
    SettlementParams sp;
    sp.sla_days = config_.sla_days;
    sp.delay_min_days = config_.settlement_delay_min;
    sp.delay_max_days = config_.settlement_delay_max;
    SettlementAggregator aggregator(rng_, sp);
    data.settlements = aggregator.aggregate(data.payments, data.merchants);
    log_stage("settlements", data.settlements.size(), timer.elapsed_ms());

    return data;
}

void Pipeline::check_references(const Dataset& data) {
    std::unordered_set<std::string> customer_ids;
    std::unordered_set<std::string> merchant_ids;
    customer_ids.reserve(data.customers.size());
    merchant_ids.reserve(data.merchants.size());
    for (const auto& c : data.customers) customer_ids.insert(c.id);
    for (const auto& m : data.merchants) merchant_ids.insert(m.id);

    for (const auto& p : data.payments) {
        if (customer_ids.count(p.customer_id) == 0) {
            throw IntegrityError("payments", "payment " + p.id + " references unknown customer",
                                 p.customer_id);
        }
        if (merchant_ids.count(p.merchant_id) == 0) {
            throw IntegrityError("payments", "payment " + p.id + " references unknown merchant",
                                 p.merchant_id);
        }
    }
}

BatchCounts Pipeline::load(const Dataset& data, PersistenceSink& sink) const {
    Timer timer;
    BatchCounts s;
    s.customers = sink.upsert_ignore(data.customers);
    s.merchants = sink.upsert_ignore(data.merchants);
    s.payments = sink.upsert_ignore(data.payments);
    s.settlements = sink.upsert_ignore(data.settlements);

    if (config_.verbose) {
        std::cout << "[load] inserted " << s.customers << " customers, "
                  << s.merchants << " merchants, " << s.payments << " payments, "
                  << s.settlements << " settlements in "
                  << std::fixed << std::setprecision(1) << timer.elapsed_ms() << " ms\n";
    }
    return s;
}

BatchCounts Pipeline::run_and_load(PersistenceSink& sink) {
    Dataset data = run();
    load(data, sink);

    BatchCounts summary;
    summary.customers = data.customers.size();
    summary.merchants = data.merchants.size();
    summary.payments = data.payments.size();
    summary.settlements = data.settlements.size();
    return summary;
}

void Pipeline::log_stage(const std::string& stage, size_t count, double elapsed_ms) const {
    if (!config_.verbose) return;
    std::cout << "[" << stage << "] " << count << " generated in "
              << std::fixed << std::setprecision(1) << elapsed_ms << " ms\n";
}

} // namespace fin
