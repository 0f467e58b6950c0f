/**
 * @file report_writer.hpp
 * @brief Emits report records as NDJSON to a sink.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "telemetry/report.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace tree_scheduler {

/**
 * @brief Serializes run, comparison and failure records, one per line.
 */
class ReportWriter {
public:
    explicit ReportWriter(std::unique_ptr<ILogSink> sink);

    void record_run(const RunReport& report);
    void record_comparison(const ComparisonReport& report);
    void record_failure(std::string_view source, const Error& error);

    void flush();

    [[nodiscard]] std::size_t records_written() const;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    std::size_t records_written_{0};

    void emit(std::string_view json_line);
};

}  // namespace tree_scheduler
