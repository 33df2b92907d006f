/**
 * Seed Sweep Runner
 * Generates the dataset under many seeds in parallel and reports how the
 * success, suspicious, outlier and SLA-breach rates vary between runs.
 */

#include "utils/cli_args.h"
#include "utils/seed_sweep.h"
#include "utils/timer.h"

#include <iostream>
#include <iomanip>
#include <filesystem>
#include <string>

int main(int argc, char* argv[]) {
    fin::SweepArgs args;
    try {
        args = fin::parse_sweep_args(argc, argv);
    } catch (const fin::ArgumentError& e) {
        std::cerr << "Invalid arguments: " << e.what() << " (see --help)\n";
        return 2;
    }
    if (args.help) {
        std::cout << fin::sweep_usage();
        return 0;
    }
    const auto& config = args.config;

    std::cout << std::string(60, '=') << "\n";
    std::cout << "SEED SWEEP\n";
    std::cout << std::string(60, '=') << "\n\n";
    std::cout << "Seeds: " << args.num_seeds << " starting at " << args.first_seed << "\n";
    std::cout << "Per run: " << config.customer_count << " customers, "
              << config.merchant_count << " merchants, "
              << config.transaction_count << " payments\n";

    fin::Timer timer;
    std::vector<fin::SweepResult> results;
    try {
        results = fin::SeedSweep::run(config, fin::SeedSweep::make_seeds(args.first_seed, args.num_seeds));
    } catch (const std::exception& e) {
        std::cerr << "Sweep failed: " << e.what() << "\n";
        return 1;
    }
    double elapsed = timer.elapsed_s();

    fin::SeedSweep::print_summary(results);

    std::cout << "Total runtime: " << std::fixed << std::setprecision(2) << elapsed << "s\n";

    #ifdef _OPENMP
    std::cout << "OpenMP threads: " << omp_get_max_threads() << "\n";
    #endif

    const std::string csv_path = args.output_dir + "/seed_sweep.csv";
    try {
        std::filesystem::create_directories(args.output_dir);
        fin::SeedSweep::write_csv(csv_path, results);
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Results written to: " << csv_path << "\n";

    return 0;
}
