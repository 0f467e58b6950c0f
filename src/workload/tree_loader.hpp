/**
 * @file tree_loader.hpp
 * @brief Edge-list parser producing a validated TaskTree.
 * @author Dimitris Kafetzis
 *
 * Input is line oriented:
 *   # procs=4           processor directive (last one wins)
 *   A_5 -> B_3          edge, each token "Name_Duration"
 * Any other line is ignored.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task_tree.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tree_scheduler {

inline constexpr uint32_t DEFAULT_PROCESSOR_COUNT = 1;

/**
 * @brief A parsed tree together with its root and processor directive.
 */
struct LoadedTree {
    TaskTree tree;
    TaskIndex root = 0;
    uint32_t processor_count = DEFAULT_PROCESSOR_COUNT;
};

/**
 * @brief A "Name_Duration" token split at the first underscore.
 */
struct TaskToken {
    TaskName name;
    SimTime duration = 0;
};

/// Parse one "Name_Duration" token (already trimmed).
[[nodiscard]] Result<TaskToken> parse_task_token(std::string_view token,
                                                 std::size_t line_no = 0);

/// Parse the processor count out of a directive line containing '#'.
[[nodiscard]] Result<uint32_t> parse_processor_directive(std::string_view line,
                                                         std::size_t line_no = 0);

/// Build and validate a tree from edge-list text.
[[nodiscard]] Result<LoadedTree> parse_tree(std::string_view text);

/// Read @p path and delegate to parse_tree().
[[nodiscard]] Result<LoadedTree> load_tree(const std::filesystem::path& path);

/// Render a tree back into the edge-list format (pre-order edges).
[[nodiscard]] std::string format_edge_list(const TaskTree& tree, TaskIndex root,
                                           uint32_t processor_count);

}  // namespace tree_scheduler
