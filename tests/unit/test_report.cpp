/**
 * @file test_report.cpp
 * @brief Unit tests for report assembly, JSON rendering and ReportWriter.
 */

#include "scheduler/list_scheduler.hpp"
#include "scheduler/policy_comparator.hpp"
#include "telemetry/report.hpp"
#include "telemetry/report_writer.hpp"
#include "workload/tree_loader.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace tree_scheduler;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

LoadedTree sample_tree() {
    auto loaded = parse_tree("# procs=2\nA_5 -> B_3\nA_5 -> C_2\n");
    EXPECT_TRUE(loaded.has_value());
    return std::move(loaded).value();
}

}  // namespace

TEST(ReportTest, RunReportFields) {
    auto loaded = sample_tree();
    auto result = ListScheduler{SchedulingPolicy::Ascending}.schedule(loaded.tree, 2);
    ASSERT_TRUE(result.has_value());

    auto report = make_run_report("case.txt", loaded.tree, 2, *result);
    EXPECT_EQ(report.source, "case.txt");
    EXPECT_EQ(report.processor_count, 2u);
    EXPECT_EQ(report.policy, SchedulingPolicy::Ascending);
    EXPECT_EQ(report.task_count, 3u);
    EXPECT_EQ(report.duration_sum, 10);
    EXPECT_EQ(report.scheduled_time, 8);
    EXPECT_DOUBLE_EQ(report.tasks_per_processor, 1.5);
    EXPECT_DOUBLE_EQ(report.mean_task_duration, 3.33);
    EXPECT_EQ(report.order, (std::vector<std::string>{"A", "C", "B"}));
}

TEST(ReportTest, RunReportJson) {
    auto loaded = sample_tree();
    auto result = ListScheduler{SchedulingPolicy::Ascending}.schedule(loaded.tree, 2);
    ASSERT_TRUE(result.has_value());

    auto json = to_json(make_run_report("case.txt", loaded.tree, 2, *result));
    EXPECT_EQ(json,
              R"({"file":"case.txt","processors":2,"policy":"ascending","task_count":3,)"
              R"("duration_sum":10,"scheduled_time":8,"tasks_per_processor":1.50,)"
              R"("mean_task_duration":3.33,"order":["A","C","B"]})");
}

TEST(ReportTest, ComparisonReportJson) {
    auto loaded = sample_tree();
    auto comparison = compare_policies(loaded.tree, 2);
    ASSERT_TRUE(comparison.has_value());

    auto report = make_comparison_report("case.txt", *comparison);
    EXPECT_EQ(report.best_policy, PolicyVerdict::Tie);
    EXPECT_EQ(report.ascending_time, 8);
    EXPECT_EQ(report.descending_time, 8);

    EXPECT_EQ(to_json(report),
              R"({"file":"case.txt","processors":2,"task_count":3,"best_policy":"tie",)"
              R"("ascending_time":8,"descending_time":8,"duration_sum":10,)"
              R"("tasks_per_processor":1.50,"mean_task_duration":3.33})");
}

TEST(ReportTest, RatiosRoundToTwoDecimals) {
    auto loaded = parse_tree("A_1 -> B_1\nA_1 -> C_2\n");
    ASSERT_TRUE(loaded.has_value());
    auto comparison = compare_policies(loaded->tree, 3);
    ASSERT_TRUE(comparison.has_value());

    auto report = make_comparison_report("x", *comparison);
    EXPECT_DOUBLE_EQ(report.tasks_per_processor, 1.0);
    EXPECT_DOUBLE_EQ(report.mean_task_duration, 1.33);
}

TEST(ReportTest, SourceIsEscaped) {
    auto loaded = sample_tree();
    auto result = ListScheduler{SchedulingPolicy::Descending}.schedule(loaded.tree, 1);
    ASSERT_TRUE(result.has_value());

    auto json = to_json(make_run_report(R"(dir\"odd".txt)", loaded.tree, 1, *result));
    EXPECT_NE(json.find(R"("file":"dir\\\"odd\".txt")"), std::string::npos) << json;
}

TEST(ReportWriterTest, EmitsOneLinePerRecord) {
    std::vector<std::string> lines;
    ReportWriter writer(std::make_unique<CaptureSink>(lines));

    auto loaded = sample_tree();
    auto comparison = compare_policies(loaded.tree, 2);
    ASSERT_TRUE(comparison.has_value());

    writer.record_comparison(make_comparison_report("a.txt", *comparison));
    writer.record_run(make_run_report("a.txt", loaded.tree, 2, comparison->descending));
    writer.record_failure("b.txt", Error{ErrorKind::MalformedTree, "ambiguous root", 4});
    writer.flush();

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(writer.records_written(), 3u);
    EXPECT_NE(lines[0].find(R"("best_policy":"tie")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("policy":"descending")"), std::string::npos);
    EXPECT_EQ(lines[2],
              R"({"file":"b.txt","error":"malformed_tree","line":4,"message":"ambiguous root"})");
}
