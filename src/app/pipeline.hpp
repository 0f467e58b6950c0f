/**
 * @file pipeline.hpp
 * @brief Per-file batch pipeline driven by the CLI.
 * @author Dimitris Kafetzis
 *
 * Config → TreeLoader → ListScheduler / PolicyComparator → ReportWriter
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/report_writer.hpp"
#include "workload/tree_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tree_scheduler {

/**
 * @brief Parsed command line. Unset options leave the config untouched.
 */
struct CLIArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<uint32_t> processors;
    std::optional<std::string> mode;
    std::optional<std::string> log_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> report_dir;
    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Merge the config file (if any) with command-line overrides.
 */
[[nodiscard]] Result<Config> resolve_config(const CLIArgs& args);

/// A non-zero configured count overrides the file's directive.
[[nodiscard]] uint32_t effective_processor_count(const SchedulerConfig& config,
                                                 const LoadedTree& loaded) noexcept;

/**
 * @brief Load, schedule and report one input file.
 *
 * Single mode emits a run report, compare mode a comparison report.
 * Nothing is recorded on failure; the caller decides.
 */
Result<void> process_file(const std::filesystem::path& input,
                          const Config& config,
                          ReportWriter& reports,
                          Logger& logger);

/**
 * @brief Run process_file() over every input, recording failures.
 * @return Number of inputs that failed.
 */
std::size_t run_batch(const std::vector<std::filesystem::path>& inputs,
                      const Config& config,
                      ReportWriter& reports,
                      Logger& logger);

}  // namespace tree_scheduler
