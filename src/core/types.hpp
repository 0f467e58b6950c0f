/**
 * @file types.hpp
 * @brief Fundamental types used throughout TreeScheduler.
 * @author Dimitris Kafetzis
 *
 * Defines task identity, simulated time, and the policy vocabulary shared
 * by the scheduler, the comparator, and the report layer.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tree_scheduler {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskName = std::string;
using TaskKey = std::string;          ///< "Name_Duration" token, the identity of a node
using TaskIndex = std::size_t;        ///< Stable position in the TaskTree arena
using SimTime = int64_t;              ///< Simulated time units

// ─────────────────────────────────────────────
// Scheduling Policy
// ─────────────────────────────────────────────

/**
 * @brief Ready-queue ordering used by the list scheduler.
 */
enum class SchedulingPolicy : uint8_t {
    Ascending,     ///< Shortest duration first
    Descending     ///< Longest duration first
};

[[nodiscard]] constexpr std::string_view to_string(SchedulingPolicy policy) noexcept {
    switch (policy) {
        case SchedulingPolicy::Ascending:  return "ascending";
        case SchedulingPolicy::Descending: return "descending";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<SchedulingPolicy>
parse_policy(std::string_view text) noexcept {
    if (text == "ascending" || text == "asc" || text == "min") return SchedulingPolicy::Ascending;
    if (text == "descending" || text == "desc" || text == "max") return SchedulingPolicy::Descending;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Comparison Verdict
// ─────────────────────────────────────────────

enum class PolicyVerdict : uint8_t {
    Ascending,
    Descending,
    Tie
};

[[nodiscard]] constexpr std::string_view to_string(PolicyVerdict verdict) noexcept {
    switch (verdict) {
        case PolicyVerdict::Ascending:  return "ascending";
        case PolicyVerdict::Descending: return "descending";
        case PolicyVerdict::Tie:        return "tie";
    }
    return "unknown";
}

}  // namespace tree_scheduler
