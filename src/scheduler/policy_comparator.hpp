/**
 * @file policy_comparator.hpp
 * @brief Runs both ready-queue policies on one tree and picks the winner.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

#include <cstdint>

namespace tree_scheduler {

struct PolicyComparison {
    TreeStats stats;
    uint32_t processor_count = 1;
    double tasks_per_processor = 0.0;
    ScheduleResult ascending;
    ScheduleResult descending;
    PolicyVerdict best_policy = PolicyVerdict::Tie;
};

/**
 * @brief Decide which makespan is better; equal makespans are a tie.
 */
[[nodiscard]] constexpr PolicyVerdict pick_best_policy(SimTime ascending_time,
                                                       SimTime descending_time) noexcept {
    if (ascending_time == descending_time) return PolicyVerdict::Tie;
    return ascending_time > descending_time ? PolicyVerdict::Descending
                                            : PolicyVerdict::Ascending;
}

/**
 * @brief Schedule @p tree once per policy and summarize the outcome.
 */
[[nodiscard]] Result<PolicyComparison> compare_policies(const TaskTree& tree,
                                                        uint32_t processor_count);

}  // namespace tree_scheduler
