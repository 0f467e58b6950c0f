/**
 * @file main.cpp
 * @brief TreeScheduler command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Parses flags, sets up the log and report sinks, then hands the inputs
 * to run_batch().
 */

#include "app/pipeline.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/report_writer.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

using namespace tree_scheduler;

namespace {

void print_usage() {
    std::cout << "Usage: tree_scheduler [OPTIONS] <tree-file>...\n"
              << "  --config <path>       TOML configuration file\n"
              << "  --procs <n>           Override the processor count of every input\n"
              << "  --mode <mode>         compare | ascending | descending (default: compare)\n"
              << "  --log-dir <path>      Write NDJSON logs here instead of stderr\n"
              << "  --log-level <level>   debug | info | warn | error\n"
              << "  --report-dir <path>   Append reports to <path>/reports.ndjson\n"
              << "  --help, -h            Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needs_value = [&]() -> bool { return i + 1 < argc; };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg == "--config" && needs_value()) {
            args.config_path = argv[++i];
        } else if (arg == "--procs" && needs_value()) {
            std::string_view text = argv[++i];
            uint32_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size() || value < 1) {
                return Error{ErrorKind::InvalidConfiguration,
                             "--procs expects an integer >= 1, got '" + std::string{text} + "'"};
            }
            args.processors = value;
        } else if (arg == "--mode" && needs_value()) {
            args.mode = argv[++i];
        } else if (arg == "--log-dir" && needs_value()) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && needs_value()) {
            args.log_level = argv[++i];
        } else if (arg == "--report-dir" && needs_value()) {
            args.report_dir = argv[++i];
        } else if (arg.starts_with("--")) {
            return Error{ErrorKind::InvalidConfiguration,
                         "unknown or incomplete option '" + arg + "'"};
        } else {
            args.inputs.emplace_back(arg);
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << args.error().describe() << std::endl;
        print_usage();
        return 2;
    }
    if (args->inputs.empty()) {
        print_usage();
        return 2;
    }

    auto config = resolve_config(*args);
    if (!config) {
        std::cerr << "Failed to load config: " << config.error().describe() << std::endl;
        return 2;
    }

    auto level = parse_log_level(config->telemetry.log_level);
    if (!level) {
        std::cerr << level.error().describe() << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config->telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config->telemetry.log_dir, "tree_scheduler",
                                                  config->telemetry.max_file_size_mb,
                                                  config->telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StderrSink>();
    }
    Logger logger(std::move(log_sink), *level);

    // ── Initialize Report Output ─────────────
    std::unique_ptr<ILogSink> report_sink;
    if (!config->telemetry.report_dir.empty()) {
        // Size limit 0 disables rotation; reports are never split.
        report_sink = std::make_unique<JsonFileSink>(config->telemetry.report_dir,
                                                     "reports", 0, 0);
    } else {
        report_sink = std::make_unique<StdoutSink>();
    }
    ReportWriter reports(std::move(report_sink));

    logger.info("TreeScheduler starting: " + std::to_string(args->inputs.size())
                + " input(s), mode "
                + (config->scheduler.mode == RunMode::Compare
                       ? std::string{"compare"}
                       : std::string{to_string(config->scheduler.policy)}));

    // ── Batch ────────────────────────────────
    auto failures = run_batch(args->inputs, *config, reports, logger);

    reports.flush();
    logger.info("Processed " + std::to_string(args->inputs.size()) + " input(s), "
                + std::to_string(failures) + " failed");
    logger.flush();
    return failures == 0 ? 0 : 1;
}
