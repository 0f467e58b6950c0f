/**
 * @file tree_loader.cpp
 * @brief Edge-list parsing, root resolution, and edge-list export.
 * @author Dimitris Kafetzis
 *
 * Loading fails fast: the first bad line aborts construction and no partial
 * tree is returned. Errors carry the 1-based line number.
 */

#include "workload/tree_loader.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace tree_scheduler {

namespace {

constexpr std::string_view EDGE_MARKER = "->";
constexpr char DIRECTIVE_MARKER = '#';
constexpr std::string_view PROCS_KEY = "procs";

std::string_view trim(std::string_view text) {
    constexpr std::string_view WS = " \t\r\n\v\f";
    auto first = text.find_first_not_of(WS);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(WS);
    return text.substr(first, last - first + 1);
}

std::optional<int64_t> parse_int(std::string_view text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::size_t> line_or_none(std::size_t line_no) {
    if (line_no == 0) return std::nullopt;
    return line_no;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Tokens and Directives
// ─────────────────────────────────────────────

Result<TaskToken> parse_task_token(std::string_view token, std::size_t line_no) {
    auto separator = token.find('_');
    if (separator == std::string_view::npos) {
        return make_error<TaskToken>(ErrorKind::Parse,
                                     "token '" + std::string{token} + "' is not Name_Duration",
                                     line_or_none(line_no));
    }

    auto name = token.substr(0, separator);
    auto duration_text = token.substr(separator + 1);
    if (name.empty()) {
        return make_error<TaskToken>(ErrorKind::Parse,
                                     "token '" + std::string{token} + "' has an empty name",
                                     line_or_none(line_no));
    }

    auto duration = parse_int(duration_text);
    if (!duration) {
        return make_error<TaskToken>(ErrorKind::Parse,
                                     "token '" + std::string{token} + "' has invalid duration '"
                                     + std::string{duration_text} + "'",
                                     line_or_none(line_no));
    }
    if (*duration < 0) {
        return make_error<TaskToken>(ErrorKind::Parse,
                                     "token '" + std::string{token} + "' has negative duration",
                                     line_or_none(line_no));
    }

    return TaskToken{.name = std::string{name}, .duration = *duration};
}

Result<uint32_t> parse_processor_directive(std::string_view line, std::size_t line_no) {
    auto marker = line.find(DIRECTIVE_MARKER);
    auto body = trim(marker == std::string_view::npos ? line : line.substr(marker + 1));

    std::string_view value_text;
    if (auto eq = body.find('='); eq != std::string_view::npos) {
        // Canonical form: "procs=<n>"
        auto key = trim(body.substr(0, eq));
        if (key != PROCS_KEY) {
            return make_error<uint32_t>(ErrorKind::Parse,
                                        "unknown directive '" + std::string{key} + "'",
                                        line_or_none(line_no));
        }
        value_text = trim(body.substr(eq + 1));
    } else {
        // Legacy form: "<word> <n>", the count is the last token.
        auto last_space = body.find_last_of(" \t");
        value_text = last_space == std::string_view::npos ? body : body.substr(last_space + 1);
    }

    auto value = parse_int(value_text);
    if (!value) {
        return make_error<uint32_t>(ErrorKind::Parse,
                                    "processor directive '" + std::string{trim(line)}
                                    + "' has no integer count",
                                    line_or_none(line_no));
    }
    if (*value < 1 || *value > std::numeric_limits<uint32_t>::max()) {
        return make_error<uint32_t>(ErrorKind::InvalidConfiguration,
                                    "processor count must be >= 1, got "
                                    + std::to_string(*value),
                                    line_or_none(line_no));
    }
    return static_cast<uint32_t>(*value);
}

// ─────────────────────────────────────────────
// Tree Construction
// ─────────────────────────────────────────────

Result<LoadedTree> parse_tree(std::string_view text) {
    LoadedTree loaded;

    std::size_t line_no = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        auto line = trim(text.substr(pos, end - pos));
        pos = end + 1;
        ++line_no;

        if (line.find(DIRECTIVE_MARKER) != std::string_view::npos) {
            auto procs = parse_processor_directive(line, line_no);
            if (!procs) return procs.error();
            loaded.processor_count = *procs;
            continue;
        }

        auto arrow = line.find(EDGE_MARKER);
        if (arrow == std::string_view::npos) continue;

        auto parent_raw = trim(line.substr(0, arrow));
        auto child_raw = trim(line.substr(arrow + EDGE_MARKER.size()));
        if (parent_raw.empty() || child_raw.empty()
            || child_raw.find(EDGE_MARKER) != std::string_view::npos) {
            return make_error<LoadedTree>(ErrorKind::Parse,
                                          "edge '" + std::string{line}
                                          + "' must have exactly two tokens",
                                          line_no);
        }

        auto parent_token = parse_task_token(parent_raw, line_no);
        if (!parent_token) return parent_token.error();
        auto child_token = parse_task_token(child_raw, line_no);
        if (!child_token) return child_token.error();

        auto parent = loaded.tree.find_or_add(parent_token->name, parent_token->duration);
        auto child = loaded.tree.find_or_add(child_token->name, child_token->duration);

        if (auto linked = loaded.tree.add_edge(parent, child); !linked) {
            Error err = linked.error();
            err.line = line_no;
            return err;
        }
    }

    if (loaded.tree.empty()) {
        return make_error<LoadedTree>(ErrorKind::MalformedTree, "input contains no edges");
    }

    auto root = loaded.tree.validate();
    if (!root) return root.error();
    loaded.root = *root;

    return loaded;
}

Result<LoadedTree> load_tree(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<LoadedTree>(ErrorKind::Io, "cannot open " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return make_error<LoadedTree>(ErrorKind::Io, "failed reading " + path.string());
    }

    return parse_tree(contents.str());
}

// ─────────────────────────────────────────────
// Export
// ─────────────────────────────────────────────

std::string format_edge_list(const TaskTree& tree, TaskIndex root, uint32_t processor_count) {
    std::ostringstream oss;
    oss << "# " << PROCS_KEY << '=' << processor_count << '\n';
    for (auto index : tree.preorder(root)) {
        const auto& parent = tree.node(index);
        for (auto child : parent.children) {
            oss << parent.key() << ' ' << EDGE_MARKER << ' ' << tree.node(child).key() << '\n';
        }
    }
    return oss.str();
}

}  // namespace tree_scheduler
