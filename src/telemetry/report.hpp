/**
 * @file report.hpp
 * @brief Plain report records for single runs and policy comparisons.
 * @author Dimitris Kafetzis
 *
 * Ratios and means are rounded to two decimals when the record is built,
 * so every consumer sees the same figures.
 */

#pragma once

#include "scheduler/policy_comparator.hpp"
#include "scheduler/scheduler.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tree_scheduler {

struct RunReport {
    std::string source;
    uint32_t processor_count = 1;
    SchedulingPolicy policy = SchedulingPolicy::Ascending;
    std::size_t task_count = 0;
    SimTime duration_sum = 0;
    SimTime scheduled_time = 0;
    double tasks_per_processor = 0.0;
    double mean_task_duration = 0.0;
    std::vector<TaskName> order;
};

struct ComparisonReport {
    std::string source;
    uint32_t processor_count = 1;
    std::size_t task_count = 0;
    PolicyVerdict best_policy = PolicyVerdict::Tie;
    SimTime ascending_time = 0;
    SimTime descending_time = 0;
    SimTime duration_sum = 0;
    double tasks_per_processor = 0.0;
    double mean_task_duration = 0.0;
};

[[nodiscard]] RunReport make_run_report(std::string source,
                                        const TaskTree& tree,
                                        uint32_t processor_count,
                                        const ScheduleResult& result);

[[nodiscard]] ComparisonReport make_comparison_report(std::string source,
                                                      const PolicyComparison& comparison);

[[nodiscard]] std::string to_json(const RunReport& report);
[[nodiscard]] std::string to_json(const ComparisonReport& report);

}  // namespace tree_scheduler
