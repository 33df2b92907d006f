/**
 * Synthetic payments & settlement dataset generator
 * Builds customers, merchants, payments and daily merchant settlements,
 * loads them into CSV tables and prints a summary report.
 *
 * Usage:
 *   ./finsynth                          # 500 customers, 50 merchants, 5000 payments
 *   ./finsynth --transactions 20000     # larger payment batch
 *   ./finsynth --seed 7 --output ./data # reproducible run into ./data
 */

#include "engine/pipeline.h"
#include "model/errors.h"
#include "storage/csv_sink.h"
#include "utils/calendar.h"
#include "utils/cli_args.h"
#include "utils/csv_writer.h"
#include "utils/dataset_stats.h"
#include "utils/random_source.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    fin::RunArgs args;
    try {
        args = fin::parse_run_args(argc, argv);
    } catch (const fin::ArgumentError& e) {
        std::cerr << "Invalid arguments: " << e.what() << " (see --help)\n";
        return 2;
    }
    if (args.help) {
        std::cout << fin::run_usage();
        return 0;
    }
    auto& config = args.config;

    std::cout << std::string(60, '=') << "\n";
    std::cout << "SYNTHETIC PAYMENTS & SETTLEMENT GENERATOR\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "Customers:    " << config.customer_count << "\n";
    std::cout << "Merchants:    " << config.merchant_count << "\n";
    std::cout << "Transactions: " << config.transaction_count
              << " over " << config.window_days << " days\n";
    std::cout << "Seed:         " << config.seed << "\n";
    std::cout << std::string(60, '-') << "\n\n";

    try {
        fin::RandomSource rng(config.seed);
        fin::Pipeline pipeline(config, rng);
        fin::Dataset data = pipeline.run();

        fin::CsvSink sink(args.output_dir);
        fin::BatchCounts loaded = pipeline.load(data, sink);

        auto stats = fin::StatsCalculator::compute(data);
        fin::CsvWriter::print_report(stats, "seed " + std::to_string(config.seed) +
                                     ", window ending " +
                                     fin::Calendar::format_timestamp(pipeline.reference_time()));
        fin::CsvWriter::write_stats(args.output_dir + "/stats.csv", stats, config.seed);

        size_t skipped = data.payments.size() - loaded.payments;
        if (skipped > 0) {
            std::cout << skipped << " payments already present in " << args.output_dir
                      << " were left untouched\n";
        }
        std::cout << "Results exported to: " << args.output_dir << "/\n";
    } catch (const fin::PipelineError& e) {
        std::cerr << "Pipeline failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
