/**
 * Benchmark: pipeline throughput, single-threaded and across independent
 * runs with OpenMP.
 */

#include "engine/pipeline.h"
#include "utils/calendar.h"
#include "utils/random_source.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

int main() {
    std::cout << std::string(60, '=') << "\n";
    std::cout << "PERFORMANCE BENCHMARK\n";
    std::cout << std::string(60, '=') << "\n\n";

    #ifdef _OPENMP
    std::cout << "OpenMP: ENABLED (" << omp_get_max_threads() << " threads)\n";
    #else
    std::cout << "OpenMP: DISABLED (single-threaded)\n";
    #endif

    fin::PipelineConfig config;
    config.customer_count = 500;
    config.merchant_count = 50;
    config.transaction_count = 5000;
    config.reference_time = fin::Calendar::now();
    config.verbose = false;
    int num_runs = 200;

    std::cout << "\nConfig: " << config.customer_count << " customers x "
              << config.merchant_count << " merchants x "
              << config.transaction_count << " payments x " << num_runs << " runs\n\n";

    // --- Single-threaded benchmark ---
    {
        auto t0 = std::chrono::high_resolution_clock::now();

        long total_settlements = 0;
        for (int i = 0; i < num_runs; ++i) {
            fin::RandomSource rng(config.seed + i);
            fin::Pipeline pipeline(config, rng);
            total_settlements += static_cast<long>(pipeline.run().settlements.size());
        }

        auto t1 = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();

        std::cout << "Single-threaded: " << std::fixed << std::setprecision(2) << elapsed << "s"
                  << " (" << std::setprecision(0) << num_runs * config.transaction_count / elapsed
                  << " payments/sec)"
                  << " avg settlements: " << std::setprecision(1)
                  << static_cast<double>(total_settlements) / num_runs << "\n";
    }

    // --- Multi-threaded benchmark (OpenMP) ---
    {
        auto t0 = std::chrono::high_resolution_clock::now();

        long total_settlements = 0;
        #pragma omp parallel for reduction(+:total_settlements) schedule(dynamic, 10)
        for (int i = 0; i < num_runs; ++i) {
            fin::RandomSource rng(config.seed + i);
            fin::Pipeline pipeline(config, rng);
            total_settlements += static_cast<long>(pipeline.run().settlements.size());
        }

        auto t1 = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(t1 - t0).count();

        std::cout << "Multi-threaded:  " << std::fixed << std::setprecision(2) << elapsed << "s"
                  << " (" << std::setprecision(0) << num_runs * config.transaction_count / elapsed
                  << " payments/sec)"
                  << " avg settlements: " << std::setprecision(1)
                  << static_cast<double>(total_settlements) / num_runs << "\n";
    }

    std::cout << "\n" << std::string(60, '=') << "\n";
    return 0;
}
