/**
 * @file generator.hpp
 * @brief Synthetic task trees for testing and benchmarking.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "workload/task_tree.hpp"

#include <random>

namespace tree_scheduler {

/**
 * @brief Factory for synthetic trees with various shapes.
 *
 * Every generated tree is rooted at arena index 0 and uses unique names.
 */
class TreeGenerator {
public:
    /// Chain: T0 → T1 → ... → Tn-1 (no parallelism)
    static TaskTree chain(std::size_t num_tasks, SimTime duration);

    /// Fan-out: one root with `width` independent leaves
    static TaskTree fan_out(std::size_t width, SimTime root_duration, SimTime leaf_duration);

    /// Complete tree with `branching` children per inner node
    static TaskTree balanced(std::size_t depth, std::size_t branching, SimTime duration);

    /// Random recursive tree: each new task picks a uniformly random parent
    static TaskTree random_tree(std::size_t num_tasks,
                                SimTime min_duration,
                                SimTime max_duration,
                                std::mt19937& rng);
};

}  // namespace tree_scheduler
