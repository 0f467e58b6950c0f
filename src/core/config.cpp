/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace tree_scheduler {

namespace {

/// Narrow a TOML integer to uint32_t, rejecting values that would wrap.
Result<uint32_t> to_u32(std::string_view field, int64_t value) {
    if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorKind::InvalidConfiguration,
                     std::string{field} + " must be in [0, "
                     + std::to_string(std::numeric_limits<uint32_t>::max()) + "], got "
                     + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<void> apply_mode(SchedulerConfig& config, std::string_view mode) {
    if (mode == "compare") {
        config.mode = RunMode::Compare;
        return {};
    }
    if (auto policy = parse_policy(mode)) {
        config.mode = RunMode::Single;
        config.policy = *policy;
        return {};
    }
    return make_error<void>(ErrorKind::InvalidConfiguration,
                            "unknown scheduler mode '" + std::string{mode} + "'");
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto processors = to_u32("scheduler.processors",
                                     scheduler["processors"].value_or(int64_t{0}));
            if (!processors) return processors.error();
            config.scheduler.processors = *processors;

            auto mode = scheduler["mode"].value_or(std::string{"compare"});
            if (auto applied = apply_mode(config.scheduler, mode); !applied) {
                return applied.error();
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            auto max_size = to_u32("telemetry.max_file_size_mb",
                                   telemetry["max_file_size_mb"].value_or(int64_t{50}));
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = to_u32("telemetry.rotate_count",
                                 telemetry["rotate_count"].value_or(int64_t{5}));
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;
            config.telemetry.report_dir = telemetry["report_dir"].value_or(std::string{});

            if (auto level = parse_log_level(config.telemetry.log_level); !level) {
                return level.error();
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace tree_scheduler
