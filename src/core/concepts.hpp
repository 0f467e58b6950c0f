/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for TreeScheduler interfaces.
 * @author Dimitris Kafetzis
 *
 * Defines compile-time interface constraints for components that plug into
 * the core without virtual dispatch.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tree_scheduler {

// Forward declarations
struct TaskNode;
class TaskTree;
struct ScheduleResult;

// ─────────────────────────────────────────────
// TaskVisitor
// ─────────────────────────────────────────────

/**
 * @concept TaskVisitor
 * @brief Callable invoked once per node during a read-only pre-order walk.
 *
 * This is the only view of the tree handed to printers and renderers:
 * the node plus its depth below the root.
 */
template <typename V>
concept TaskVisitor = std::invocable<V&, const TaskNode&, std::size_t>;

// ─────────────────────────────────────────────
// SchedulerLike
// ─────────────────────────────────────────────

/**
 * @concept SchedulerLike
 * @brief Constrains engines that can simulate a tree on N processors.
 *
 * The benchmark harness is written against this.
 */
template <typename T>
concept SchedulerLike = requires(const T scheduler, const TaskTree& tree, uint32_t processors) {
    { scheduler.schedule(tree, processors) } -> std::same_as<Result<ScheduleResult>>;
    { scheduler.name() } -> std::convertible_to<std::string_view>;
};

}  // namespace tree_scheduler
