/**
 * @file list_scheduler.hpp
 * @brief Non-preemptive greedy list scheduler over identical processors.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

#include <cstdint>
#include <string_view>

namespace tree_scheduler {

/**
 * @brief Event-driven simulation of a task tree on N processor slots.
 *
 * The ready queue is ordered by duration according to the policy given at
 * construction; ties keep the order in which tasks became ready. The tree
 * is only read, so one tree may be scheduled from several threads.
 */
class ListScheduler {
public:
    explicit ListScheduler(SchedulingPolicy policy) noexcept : policy_(policy) {}

    [[nodiscard]] Result<ScheduleResult> schedule(const TaskTree& tree,
                                                  uint32_t processor_count) const;

    [[nodiscard]] SchedulingPolicy policy() const noexcept { return policy_; }
    [[nodiscard]] std::string_view name() const noexcept { return to_string(policy_); }

private:
    SchedulingPolicy policy_;
};

}  // namespace tree_scheduler
