/**
 * @file policy_comparator.cpp
 * @brief compare_policies() implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/policy_comparator.hpp"
#include "scheduler/list_scheduler.hpp"

namespace tree_scheduler {

Result<PolicyComparison> compare_policies(const TaskTree& tree, uint32_t processor_count) {
    auto ascending = ListScheduler{SchedulingPolicy::Ascending}.schedule(tree, processor_count);
    if (!ascending) return ascending.error();

    auto descending = ListScheduler{SchedulingPolicy::Descending}.schedule(tree, processor_count);
    if (!descending) return descending.error();

    PolicyComparison comparison;
    comparison.stats = tree.stats();
    comparison.processor_count = processor_count;
    comparison.tasks_per_processor = static_cast<double>(comparison.stats.task_count)
                                     / static_cast<double>(processor_count);
    comparison.best_policy = pick_best_policy(ascending->total_time, descending->total_time);
    comparison.ascending = std::move(*ascending);
    comparison.descending = std::move(*descending);
    return comparison;
}

}  // namespace tree_scheduler
