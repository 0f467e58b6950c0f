/**
 * @file pipeline.cpp
 * @brief Config resolution and the per-file pipeline.
 * @author Dimitris Kafetzis
 */

#include "app/pipeline.hpp"

#include "scheduler/list_scheduler.hpp"
#include "scheduler/policy_comparator.hpp"
#include "telemetry/report.hpp"

namespace tree_scheduler {

Result<Config> resolve_config(const CLIArgs& args) {
    Config config = default_config();
    if (args.config_path) {
        auto loaded = load_config(*args.config_path);
        if (!loaded) return loaded.error();
        config = *loaded;
    }

    if (args.processors) config.scheduler.processors = *args.processors;
    if (args.mode) {
        if (auto applied = apply_mode(config.scheduler, *args.mode); !applied) {
            return applied.error();
        }
    }
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;
    if (args.log_level) config.telemetry.log_level = *args.log_level;
    if (args.report_dir) config.telemetry.report_dir = *args.report_dir;
    return config;
}

uint32_t effective_processor_count(const SchedulerConfig& config,
                                   const LoadedTree& loaded) noexcept {
    return config.processors != 0 ? config.processors : loaded.processor_count;
}

Result<void> process_file(const std::filesystem::path& input,
                          const Config& config,
                          ReportWriter& reports,
                          Logger& logger) {
    auto loaded = load_tree(input);
    if (!loaded) return loaded.error();

    auto processors = effective_processor_count(config.scheduler, *loaded);

    auto stats = loaded->tree.stats();
    logger.info("Loaded " + input.string() + ": " + std::to_string(stats.task_count)
                + " tasks, root " + loaded->tree.node(loaded->root).key()
                + ", " + std::to_string(processors) + " processors");

    if (config.scheduler.mode == RunMode::Single) {
        ListScheduler scheduler(config.scheduler.policy);
        auto result = scheduler.schedule(loaded->tree, processors);
        if (!result) return result.error();

        logger.debug("Policy " + std::string{scheduler.name()} + ": makespan "
                     + std::to_string(result->total_time) + " after "
                     + std::to_string(result->iterations) + " time jumps");
        reports.record_run(make_run_report(input.string(), loaded->tree, processors, *result));
        return {};
    }

    auto comparison = compare_policies(loaded->tree, processors);
    if (!comparison) return comparison.error();

    logger.info("Compared " + input.string() + ": ascending "
                + std::to_string(comparison->ascending.total_time) + ", descending "
                + std::to_string(comparison->descending.total_time) + ", best "
                + std::string{to_string(comparison->best_policy)});
    reports.record_comparison(make_comparison_report(input.string(), *comparison));
    return {};
}

std::size_t run_batch(const std::vector<std::filesystem::path>& inputs,
                      const Config& config,
                      ReportWriter& reports,
                      Logger& logger) {
    std::size_t failures = 0;
    for (const auto& input : inputs) {
        auto outcome = process_file(input, config, reports, logger);
        if (!outcome) {
            ++failures;
            logger.error(input.string() + ": " + outcome.error().describe());
            reports.record_failure(input.string(), outcome.error());
        }
    }
    return failures;
}

}  // namespace tree_scheduler
