/**
 * @file report_writer.cpp
 * @brief ReportWriter implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/report_writer.hpp"

#include "core/json.hpp"

#include <sstream>

namespace tree_scheduler {

ReportWriter::ReportWriter(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void ReportWriter::record_run(const RunReport& report) {
    emit(to_json(report));
}

void ReportWriter::record_comparison(const ComparisonReport& report) {
    emit(to_json(report));
}

void ReportWriter::record_failure(std::string_view source, const Error& error) {
    std::ostringstream oss;
    oss << R"({"file":")" << json_escape(source) << "\""
        << R"(,"error":")" << to_string(error.kind) << "\"";
    if (error.line) {
        oss << R"(,"line":)" << *error.line;
    }
    oss << R"(,"message":")" << json_escape(error.message) << "\""
        << "}";
    emit(oss.str());
}

void ReportWriter::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++records_written_;
}

void ReportWriter::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

std::size_t ReportWriter::records_written() const {
    std::lock_guard lock(write_mutex_);
    return records_written_;
}

}  // namespace tree_scheduler
