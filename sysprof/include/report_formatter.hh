#pragma once

#include <string>

#include "include/aggregator.hh"
#include "include/utils.hh"

#include "generated/proto/sample_metrics.pb.h"

namespace SysProf {

// per sample process rows in the detailed section of the report
constexpr size_t report_sample_top_n = 10;
// process rows in the live console view
constexpr size_t progress_top_n = 3;

/**
 * Host facts stamped into the report header, captured when the report is generated.
 */
struct RunMetadata {
    cr::system_clock::time_point generated_at;
    std::string platform;
    unsigned processor_count = 0;
    /** zone all timestamps are rendered in, the host's current zone when nullptr */
    const date::time_zone *zone = nullptr;
};

/**
 * @brief Metadata describing this host at the current time.
 */
RunMetadata currentRunMetadata();

/**
 * Render the plain-text run report: header, summary statistics, top process rollups, then every
 * sample in sequence order. A run without samples renders the header and a single
 * "No samples collected." line.
 */
std::string formatReport(const SampleTimeSeries &series, const RunMetadata &metadata);

/**
 * Render the console view of one tick: progress, CPU and memory bars, and the largest processes.
 *
 * @param progress elapsed fraction of the run in [0, 1]
 */
std::string formatProgress(
    const Sample &sample, double progress, const date::time_zone *zone = nullptr);

/**
 * @brief Render the end of run console summary.
 */
std::string formatSummary(const RunStatistics &stats);

/**
 * Write report text to path, replacing any existing file.
 *
 * @return error status carrying the OS error if the file cannot be created or written
 */
absl::Status writeReport(const fs::path &path, const std::string &text);

}  // namespace SysProf
