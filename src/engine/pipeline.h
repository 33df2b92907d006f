#pragma once

#include "model/types.h"
#include "storage/persistence_sink.h"
#include "utils/random_source.h"
#include <string>

namespace fin {

// Runs entity generation, payment generation and settlement aggregation in
// order on one random source, then optionally hands the batches to a sink.
class Pipeline {
public:
    Pipeline(const PipelineConfig& config, RandomSource& rng);

    // Counts taken from the config
    Dataset run();

    // Validates the request before any stage runs, so a bad request never
    // yields a partial dataset.
    Dataset run(int customer_count, int merchant_count, int transaction_count);

    // One upsert_ignore call per entity type, in foreign-key order
    BatchCounts load(const Dataset& data, PersistenceSink& sink) const;

    // Generate with the configured counts and load; returns batch sizes
    BatchCounts run_and_load(PersistenceSink& sink);

    // Every payment must name an existing customer and merchant
    static void check_references(const Dataset& data);

    const PipelineConfig& config() const { return config_; }
    EpochSeconds reference_time() const { return reference_time_; }

private:
    void log_stage(const std::string& stage, size_t count, double elapsed_ms) const;

    PipelineConfig config_;
    RandomSource& rng_;
    EpochSeconds reference_time_;
};

} // namespace fin
