/**
 * @file generator.cpp
 * @brief Synthetic tree generator, all shape implementations.
 * @author Dimitris Kafetzis
 */

#include "workload/generator.hpp"

#include <format>
#include <vector>

namespace tree_scheduler {

// ─────────────────────────────────────────────
// Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

TaskTree TreeGenerator::chain(std::size_t num_tasks, SimTime duration) {
    TaskTree tree;

    TaskIndex prev = 0;
    for (std::size_t i = 0; i < num_tasks; ++i) {
        auto index = tree.find_or_add(std::format("T{}", i), duration);
        if (i > 0) {
            // Fresh child, cannot already have a parent.
            (void)tree.add_edge(prev, index);
        }
        prev = index;
    }

    return tree;
}

// ─────────────────────────────────────────────
// Fan-out: root → {L0, L1, ..., L{width-1}}
// ─────────────────────────────────────────────

TaskTree TreeGenerator::fan_out(std::size_t width, SimTime root_duration, SimTime leaf_duration) {
    TaskTree tree;

    auto root = tree.find_or_add("root", root_duration);
    for (std::size_t i = 0; i < width; ++i) {
        auto leaf = tree.find_or_add(std::format("L{}", i), leaf_duration);
        // Fresh leaf with a unique name: no parent yet, never a self-edge.
        (void)tree.add_edge(root, leaf);
    }

    return tree;
}

// ─────────────────────────────────────────────
// Balanced: level-by-level, `branching` children per node
// ─────────────────────────────────────────────

TaskTree TreeGenerator::balanced(std::size_t depth, std::size_t branching, SimTime duration) {
    TaskTree tree;
    if (depth == 0) return tree;

    std::size_t counter = 0;
    std::vector<TaskIndex> level{tree.find_or_add(std::format("N{}", counter++), duration)};

    for (std::size_t d = 1; d < depth; ++d) {
        std::vector<TaskIndex> next;
        next.reserve(level.size() * branching);
        for (auto parent : level) {
            for (std::size_t b = 0; b < branching; ++b) {
                auto child = tree.find_or_add(std::format("N{}", counter++), duration);
                // Fresh child with a unique name: no parent yet, never a self-edge.
                (void)tree.add_edge(parent, child);
                next.push_back(child);
            }
        }
        level = std::move(next);
    }

    return tree;
}

// ─────────────────────────────────────────────
// Random recursive tree
// ─────────────────────────────────────────────

TaskTree TreeGenerator::random_tree(std::size_t num_tasks,
                                    SimTime min_duration,
                                    SimTime max_duration,
                                    std::mt19937& rng) {
    TaskTree tree;
    std::uniform_int_distribution<SimTime> duration_dist(min_duration, max_duration);

    for (std::size_t i = 0; i < num_tasks; ++i) {
        auto index = tree.find_or_add(std::format("R{}", i), duration_dist(rng));
        if (i > 0) {
            std::uniform_int_distribution<std::size_t> parent_dist(0, i - 1);
            // Fresh task, parent drawn from earlier indices: cannot fail.
            (void)tree.add_edge(parent_dist(rng), index);
        }
    }

    return tree;
}

}  // namespace tree_scheduler
