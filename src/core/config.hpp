/**
 * @file config.hpp
 * @brief Runtime configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/result.hpp"
#include "core/types.hpp"

namespace tree_scheduler {

/**
 * @brief What the CLI does with each loaded tree.
 */
enum class RunMode : uint8_t {
    Compare,      ///< Run both policies and report the verdict
    Single        ///< Run one explicitly chosen policy
};

struct SchedulerConfig {
    uint32_t processors = 0;            ///< 0 = use the input file's directive
    RunMode mode = RunMode::Compare;
    SchedulingPolicy policy = SchedulingPolicy::Descending;  ///< Only used when mode == Single
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = log to stderr
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::filesystem::path report_dir;  ///< Empty = reports to stdout
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    TelemetryConfig telemetry;
};

/**
 * @brief Parse a `mode` value: "compare", or a policy name for a single run.
 *
 * Writes the policy into @p config when the mode names one.
 */
Result<void> apply_mode(SchedulerConfig& config, std::string_view mode);

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace tree_scheduler
