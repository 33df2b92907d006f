#pragma once

#include "model/types.h"
#include "engine/pipeline.h"
#include "utils/dataset_stats.h"
#include "utils/random_source.h"
#include "utils/calendar.h"
#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fin {

struct SweepResult {
    uint64_t seed;
    DatasetStats stats;
};

// Repeats the pipeline for many seeds to check how stable the generated
// distributions are. Each run owns its random source, so runs are
// independent and can go in parallel.
class SeedSweep {
public:
    static std::vector<uint64_t> make_seeds(uint64_t first_seed, int count) {
        std::vector<uint64_t> seeds;
        for (int i = 0; i < count; ++i) seeds.push_back(first_seed + static_cast<uint64_t>(i));
        return seeds;
    }

    static std::vector<SweepResult> run(const PipelineConfig& base,
                                        const std::vector<uint64_t>& seeds) {
        PipelineConfig config = base;
        config.verbose = false;
        if (config.reference_time == 0) config.reference_time = Calendar::now();
        config.validate();

        std::vector<SweepResult> results(seeds.size());
        std::vector<std::string> errors(seeds.size());

        // Exceptions must not cross the parallel region; collect and rethrow
        #pragma omp parallel for schedule(dynamic)
        for (long i = 0; i < static_cast<long>(seeds.size()); ++i) {
            try {
                PipelineConfig c = config;
                c.seed = seeds[i];
                RandomSource rng(c.seed);
                Pipeline pipeline(c, rng);
                Dataset data = pipeline.run();
                results[i] = SweepResult{c.seed, StatsCalculator::compute(data)};
            } catch (const std::exception& e) {
                errors[i] = e.what();
            }
        }

        for (size_t i = 0; i < errors.size(); ++i) {
            if (!errors[i].empty()) {
                throw std::runtime_error("seed " + std::to_string(seeds[i]) + ": " + errors[i]);
            }
        }
        return results;
    }

    static DatasetStats average(const std::vector<SweepResult>& results) {
        DatasetStats avg{};
        if (results.empty()) return avg;
        double n = static_cast<double>(results.size());
        for (const auto& r : results) {
            avg.success_rate += r.stats.success_rate / n;
            avg.suspicious_rate += r.stats.suspicious_rate / n;
            avg.outlier_rate += r.stats.outlier_rate / n;
            avg.sla_breach_rate += r.stats.sla_breach_rate / n;
            avg.avg_amount += r.stats.avg_amount / n;
            avg.avg_risk_score += r.stats.avg_risk_score / n;
            avg.gross_volume += r.stats.gross_volume / n;
            avg.commission_total += r.stats.commission_total / n;
        }
        return avg;
    }

    static void print_summary(const std::vector<SweepResult>& results) {
        std::cout << "\n" << std::string(80, '=') << "\n";
        std::cout << "SEED SWEEP RESULTS\n";
        std::cout << std::string(80, '=') << "\n\n";

        std::cout << std::setw(10) << "Seed"
                  << std::setw(12) << "Success"
                  << std::setw(12) << "Suspicious"
                  << std::setw(12) << "Outliers"
                  << std::setw(12) << "SLA Breach"
                  << std::setw(14) << "Settlements"
                  << "\n";
        std::cout << std::string(72, '-') << "\n";

        for (const auto& r : results) {
            std::cout << std::setw(10) << r.seed
                      << std::setw(11) << std::fixed << std::setprecision(1)
                      << r.stats.success_rate * 100 << "%"
                      << std::setw(11) << r.stats.suspicious_rate * 100 << "%"
                      << std::setw(11) << r.stats.outlier_rate * 100 << "%"
                      << std::setw(11) << r.stats.sla_breach_rate * 100 << "%"
                      << std::setw(14) << r.stats.settlements
                      << "\n";
        }

        DatasetStats avg = average(results);
        std::cout << std::string(72, '-') << "\n";
        std::cout << std::setw(10) << "AVG"
                  << std::setw(11) << avg.success_rate * 100 << "%"
                  << std::setw(11) << avg.suspicious_rate * 100 << "%"
                  << std::setw(11) << avg.outlier_rate * 100 << "%"
                  << std::setw(11) << avg.sla_breach_rate * 100 << "%"
                  << "\n\n";
        std::cout << std::string(80, '=') << "\n\n";
    }

    static void write_csv(const std::string& filepath, const std::vector<SweepResult>& results) {
        std::ofstream f(filepath);
        if (!f.is_open()) throw std::runtime_error("Cannot open: " + filepath);

        f << "seed,payments,settlements,success_rate,suspicious_rate,outlier_rate,"
             "sla_breach_rate,gross_volume,commission_total\n";
        for (const auto& r : results) {
            f << r.seed << "," << r.stats.payments << "," << r.stats.settlements << ","
              << std::fixed << std::setprecision(4) << r.stats.success_rate << ","
              << r.stats.suspicious_rate << "," << r.stats.outlier_rate << ","
              << r.stats.sla_breach_rate << ","
              << std::setprecision(2) << r.stats.gross_volume << ","
              << r.stats.commission_total << "\n";
        }
    }
};

} // namespace fin
