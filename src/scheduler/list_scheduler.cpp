/**
 * @file list_scheduler.cpp
 * @brief ListScheduler: greedy list scheduling with time-jump simulation.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   ready   ← tasks without a parent
 *   while ready or running:
 *     stable-sort ready by duration (policy order)
 *     move ready heads into free slots
 *     delta ← min remaining over running; time += delta
 *     completed tasks (slot order) append to the output and release children
 *
 * Every time jump completes at least one task, so a valid tree of N tasks
 * takes at most N iterations.
 */

#include "scheduler/list_scheduler.hpp"

#include "core/concepts.hpp"

#include <algorithm>
#include <limits>

namespace tree_scheduler {

static_assert(SchedulerLike<ListScheduler>);

namespace {

struct RunningTask {
    TaskIndex task;
    SimTime remaining;
    SimTime start;
};

}  // anonymous namespace

Result<ScheduleResult> ListScheduler::schedule(const TaskTree& tree,
                                               uint32_t processor_count) const {
    if (processor_count < 1) {
        return make_error<ScheduleResult>(ErrorKind::InvalidConfiguration,
                                          "processor count must be >= 1");
    }

    auto root = tree.validate();
    if (!root) return root.error();

    auto all_tasks = tree.preorder(*root);

    // Unmet-dependency count per arena index: 1 with a parent, 0 for the root.
    std::vector<uint8_t> unmet(tree.task_count(), 0);
    std::vector<TaskIndex> ready;
    for (auto index : all_tasks) {
        unmet[index] = tree.node(index).parent ? 1 : 0;
        if (unmet[index] == 0) {
            ready.push_back(index);
        }
    }

    auto by_duration = [&](TaskIndex a, TaskIndex b) {
        return policy_ == SchedulingPolicy::Ascending
            ? tree.node(a).duration < tree.node(b).duration
            : tree.node(a).duration > tree.node(b).duration;
    };

    const std::size_t slots = processor_count;
    std::vector<RunningTask> running;
    running.reserve(std::min(slots, all_tasks.size()));

    ScheduleResult result;
    result.policy = policy_;
    result.order.reserve(all_tasks.size());
    result.timeline.reserve(all_tasks.size());

    while (!ready.empty() || !running.empty()) {
        if (result.iterations >= all_tasks.size()) {
            return make_error<ScheduleResult>(ErrorKind::Deadlock,
                                              "simulation exceeded "
                                              + std::to_string(all_tasks.size())
                                              + " time jumps without finishing");
        }

        std::stable_sort(ready.begin(), ready.end(), by_duration);

        std::size_t admitted = 0;
        while (running.size() < slots && admitted < ready.size()) {
            auto index = ready[admitted++];
            running.push_back({index, tree.node(index).duration, result.total_time});
        }
        ready.erase(ready.begin(), ready.begin() + static_cast<std::ptrdiff_t>(admitted));

        if (running.empty()) break;
        result.peak_running = std::max(result.peak_running, running.size());

        SimTime delta = std::numeric_limits<SimTime>::max();
        for (const auto& slot : running) {
            delta = std::min(delta, slot.remaining);
        }
        result.total_time += delta;
        ++result.iterations;

        std::vector<RunningTask> completed;
        std::vector<RunningTask> still_running;
        still_running.reserve(running.size());
        for (auto& slot : running) {
            slot.remaining -= delta;
            if (slot.remaining == 0) {
                completed.push_back(slot);
            } else {
                still_running.push_back(slot);
            }
        }
        running.swap(still_running);

        for (const auto& done : completed) {
            const auto& node = tree.node(done.task);
            result.order.push_back(node.name);
            result.timeline.push_back({done.task, done.start, result.total_time});
            for (auto child : node.children) {
                if (--unmet[child] == 0) {
                    ready.push_back(child);
                }
            }
        }
    }

    if (result.order.size() != all_tasks.size()) {
        return make_error<ScheduleResult>(ErrorKind::Deadlock,
                                          "simulation stopped after "
                                          + std::to_string(result.order.size()) + " of "
                                          + std::to_string(all_tasks.size()) + " tasks");
    }

    return result;
}

}  // namespace tree_scheduler
