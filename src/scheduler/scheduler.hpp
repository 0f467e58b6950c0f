/**
 * @file scheduler.hpp
 * @brief Scheduling result types shared by the engine, comparator and reports.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "workload/task_tree.hpp"

#include <compare>
#include <cstddef>
#include <vector>

namespace tree_scheduler {

// ─────────────────────────────────────────────
// Timeline
// ─────────────────────────────────────────────

/**
 * @brief When one task occupied a processor slot.
 */
struct TaskSpan {
    TaskIndex task = 0;
    SimTime start = 0;
    SimTime finish = 0;

    auto operator<=>(const TaskSpan&) const = default;
};

// ─────────────────────────────────────────────
// Schedule Result
// ─────────────────────────────────────────────

struct ScheduleResult {
    SchedulingPolicy policy = SchedulingPolicy::Ascending;
    SimTime total_time = 0;                 ///< Makespan
    std::vector<TaskName> order;            ///< Completion order
    std::vector<TaskSpan> timeline;         ///< Same order as `order`
    std::size_t peak_running = 0;           ///< Most slots ever occupied at once
    std::size_t iterations = 0;             ///< Time jumps taken
};

}  // namespace tree_scheduler
