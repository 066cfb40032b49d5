#include "config.h"
#include "predictability/predictability_table.h"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

void printUsage(char const* program) {
    std::cout << "Predictability Table Generator\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>         TOML config ([table] section)\n"
              << "  --output <path>         Output JSON (default: table.path from config)\n"
              << "  --seed <N>              Base seed (default: table.seed)\n"
              << "  --threads <N>           Worker threads, 0 = auto (default: table.thread_count)\n"
              << "  --ensemble-size <N>     Trials per cell\n"
              << "  --iterations <N>        Iterations per trial\n"
              << "  -h, --help              Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string output_path;
    std::optional<uint64_t> seed;
    std::optional<int> threads;
    std::optional<int> ensemble_size;
    std::optional<int> iterations;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && has_value) {
                config_path = argv[++i];
            } else if (arg == "--output" && has_value) {
                output_path = argv[++i];
            } else if (arg == "--seed" && has_value) {
                seed = std::stoull(argv[++i]);
            } else if (arg == "--threads" && has_value) {
                threads = std::stoi(argv[++i]);
            } else if (arg == "--ensemble-size" && has_value) {
                ensemble_size = std::stoi(argv[++i]);
            } else if (arg == "--iterations" && has_value) {
                iterations = std::stoi(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (std::exception const& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    Config config = config_path.empty() ? Config::defaults() : Config::load(config_path);
    TableConfig const& tc = config.table;

    predictability::TableSpec spec;
    spec.axes = {tc.r_values, tc.model_bias_values, tc.ic_bias_values};
    spec.ensemble_size = ensemble_size.value_or(tc.ensemble_size);
    spec.iterations = iterations.value_or(tc.iterations);
    spec.threshold = tc.threshold;
    uint64_t base_seed = seed.value_or(tc.seed);
    int thread_count = threads.value_or(tc.thread_count);
    if (output_path.empty()) output_path = tc.path;

    if (spec.ensemble_size <= 0 || spec.iterations <= 0) {
        std::cerr << "Error: ensemble size and iterations must be positive\n";
        return 1;
    }

    std::cout << "=== Predictability Table ===\n\n"
              << "Axes:       " << spec.axes.r_values.size() << " r x "
              << spec.axes.model_bias_values.size() << " model bias x "
              << spec.axes.ic_bias_values.size() << " ic bias\n"
              << "Trials:     " << spec.ensemble_size << " x " << spec.iterations
              << " iterations, threshold " << spec.threshold << "\n"
              << "Seed:       " << base_seed << "\n"
              << "Output:     " << output_path << "\n\n";

    auto start_time = std::chrono::steady_clock::now();
    auto table = predictability::generateTable(spec, base_seed, thread_count,
                                               [&](int done, int total) {
        double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
        std::cout << "\rComputing: " << done << "/" << total << " cells (" << std::fixed
                  << std::setprecision(1) << (100.0 * done / total) << "%) | " << elapsed
                  << "s     " << std::flush;
    });
    std::cout << "\n";

    auto parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << parent << ": " << ec.message() << "\n";
            return 1;
        }
    }

    if (!table.save(output_path)) {
        return 1;
    }
    std::cout << "Saved " << output_path << "\n";
    return 0;
}
