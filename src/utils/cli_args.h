#pragma once

#include "model/types.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fin {

// Unknown option, missing value or malformed number on the command line.
// Front ends report it on stderr and exit with status 2.
class ArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct RunArgs {
    PipelineConfig config;
    std::string output_dir = "./output";
    bool help = false;
};

struct SweepArgs {
    PipelineConfig config;
    int num_seeds = 16;
    uint64_t first_seed = 1;
    std::string output_dir = "./output/seed_sweep";
    bool help = false;
};

namespace cli {

// The whole value must convert; "12abc" and "" are rejected
template <typename Convert>
auto parse_value(const std::string& option, const std::string& value, Convert convert) {
    size_t pos = 0;
    decltype(convert(value, &pos)) result{};
    try {
        result = convert(value, &pos);
    } catch (const std::exception&) {
        pos = std::string::npos;
    }
    if (value.empty() || pos != value.size()) {
        throw ArgumentError("invalid value for " + option + ": '" + value + "'");
    }
    return result;
}

inline int to_int(const std::string& option, const std::string& value) {
    return parse_value(option, value, [](const std::string& s, size_t* p) { return std::stoi(s, p); });
}

inline int64_t to_int64(const std::string& option, const std::string& value) {
    return parse_value(option, value, [](const std::string& s, size_t* p) { return std::stoll(s, p); });
}

inline uint64_t to_uint64(const std::string& option, const std::string& value) {
    if (!value.empty() && value[0] == '-') {
        throw ArgumentError("invalid value for " + option + ": '" + value + "'");
    }
    return parse_value(option, value, [](const std::string& s, size_t* p) {
        return static_cast<uint64_t>(std::stoull(s, p));
    });
}

inline double to_double(const std::string& option, const std::string& value) {
    return parse_value(option, value, [](const std::string& s, size_t* p) { return std::stod(s, p); });
}

inline std::string next_value(int argc, const char* const argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) throw ArgumentError("missing value for " + option);
    return argv[++i];
}

} // namespace cli

inline RunArgs parse_run_args(int argc, const char* const argv[]) {
    RunArgs args;
    auto& c = args.config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--customers") c.customer_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--merchants") c.merchant_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--transactions") c.transaction_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--seed") c.seed = cli::to_uint64(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--window-days") c.window_days = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--reference-time") c.reference_time = cli::to_int64(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--outlier-prob") c.outlier_probability = cli::to_double(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--sla-days") c.sla_days = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--output") args.output_dir = cli::next_value(argc, argv, i, arg);
        else if (arg == "--quiet") c.verbose = false;
        else if (arg == "--help") args.help = true;
        else throw ArgumentError("unknown option: " + arg);
    }
    return args;
}

inline SweepArgs parse_sweep_args(int argc, const char* const argv[]) {
    SweepArgs args;
    auto& c = args.config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seeds") args.num_seeds = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--first-seed") args.first_seed = cli::to_uint64(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--customers") c.customer_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--merchants") c.merchant_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--transactions") c.transaction_count = cli::to_int(arg, cli::next_value(argc, argv, i, arg));
        else if (arg == "--output") args.output_dir = cli::next_value(argc, argv, i, arg);
        else if (arg == "--help") args.help = true;
        else throw ArgumentError("unknown option: " + arg);
    }
    if (args.num_seeds < 1) throw ArgumentError("--seeds must be >= 1");
    return args;
}

inline const char* run_usage() {
    return "Usage: finsynth [options]\n"
           "  --customers N       Customers to generate (default: 500)\n"
           "  --merchants N       Merchants to generate (default: 50)\n"
           "  --transactions N    Payments to generate (default: 5000)\n"
           "  --seed N            Random seed (default: 42)\n"
           "  --window-days N     Trailing payment window (default: 90)\n"
           "  --reference-time T  Window end, epoch seconds (default: now)\n"
           "  --outlier-prob P    Share of large payments (default: 0.05)\n"
           "  --sla-days N        Contractual settlement delay (default: 2)\n"
           "  --output DIR        CSV output directory (default: ./output)\n"
           "  --quiet             Only print the final report\n"
           "  --help              Show this help\n";
}

inline const char* sweep_usage() {
    return "Usage: finsynth_sweep [options]\n"
           "  --seeds N           Number of seeds (default: 16)\n"
           "  --first-seed N      First seed (default: 1)\n"
           "  --customers N       Customers per run (default: 500)\n"
           "  --merchants N       Merchants per run (default: 50)\n"
           "  --transactions N    Payments per run (default: 5000)\n"
           "  --output DIR        Output directory (default: ./output/seed_sweep)\n"
           "  --help              Show this help\n";
}

} // namespace fin
