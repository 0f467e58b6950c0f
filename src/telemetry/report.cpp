/**
 * @file report.cpp
 * @brief Report assembly and single-line JSON rendering.
 * @author Dimitris Kafetzis
 */

#include "telemetry/report.hpp"

#include "core/json.hpp"

#include <iomanip>
#include <sstream>

namespace tree_scheduler {

namespace {

double ratio(std::size_t numerator, uint32_t denominator) {
    if (denominator == 0) return 0.0;
    return round2(static_cast<double>(numerator) / static_cast<double>(denominator));
}

void write_fixed2(std::ostringstream& oss, double value) {
    oss << std::fixed << std::setprecision(2) << value;
}

}  // anonymous namespace

RunReport make_run_report(std::string source,
                          const TaskTree& tree,
                          uint32_t processor_count,
                          const ScheduleResult& result) {
    auto stats = tree.stats();
    return RunReport{
        .source = std::move(source),
        .processor_count = processor_count,
        .policy = result.policy,
        .task_count = stats.task_count,
        .duration_sum = stats.duration_sum,
        .scheduled_time = result.total_time,
        .tasks_per_processor = ratio(stats.task_count, processor_count),
        .mean_task_duration = round2(stats.mean_duration),
        .order = result.order
    };
}

ComparisonReport make_comparison_report(std::string source,
                                        const PolicyComparison& comparison) {
    return ComparisonReport{
        .source = std::move(source),
        .processor_count = comparison.processor_count,
        .task_count = comparison.stats.task_count,
        .best_policy = comparison.best_policy,
        .ascending_time = comparison.ascending.total_time,
        .descending_time = comparison.descending.total_time,
        .duration_sum = comparison.stats.duration_sum,
        .tasks_per_processor = round2(comparison.tasks_per_processor),
        .mean_task_duration = round2(comparison.stats.mean_duration)
    };
}

std::string to_json(const RunReport& report) {
    std::ostringstream oss;
    oss << R"({"file":")" << json_escape(report.source) << "\""
        << R"(,"processors":)" << report.processor_count
        << R"(,"policy":")" << to_string(report.policy) << "\""
        << R"(,"task_count":)" << report.task_count
        << R"(,"duration_sum":)" << report.duration_sum
        << R"(,"scheduled_time":)" << report.scheduled_time
        << R"(,"tasks_per_processor":)";
    write_fixed2(oss, report.tasks_per_processor);
    oss << R"(,"mean_task_duration":)";
    write_fixed2(oss, report.mean_task_duration);
    oss << R"(,"order":[)";
    for (std::size_t i = 0; i < report.order.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(report.order[i]) << '"';
    }
    oss << "]}";
    return oss.str();
}

std::string to_json(const ComparisonReport& report) {
    std::ostringstream oss;
    oss << R"({"file":")" << json_escape(report.source) << "\""
        << R"(,"processors":)" << report.processor_count
        << R"(,"task_count":)" << report.task_count
        << R"(,"best_policy":")" << to_string(report.best_policy) << "\""
        << R"(,"ascending_time":)" << report.ascending_time
        << R"(,"descending_time":)" << report.descending_time
        << R"(,"duration_sum":)" << report.duration_sum
        << R"(,"tasks_per_processor":)";
    write_fixed2(oss, report.tasks_per_processor);
    oss << R"(,"mean_task_duration":)";
    write_fixed2(oss, report.mean_task_duration);
    oss << "}";
    return oss.str();
}

}  // namespace tree_scheduler
