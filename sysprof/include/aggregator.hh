#pragma once

#include <optional>
#include <string>
#include <vector>

#include "include/utils.hh"

#include "generated/proto/sample_metrics.pb.h"

namespace SysProf {

// rollup rows shown on the console after a run and in the written report
constexpr size_t interactive_top_n = 10;
constexpr size_t report_top_n = 15;

/**
 * One process name across every sample of a run. Processes sharing a name (e.g. worker pools)
 * are folded into one entry.
 */
struct ProcessRollup {
    std::string name;
    double avg_working_set_mb = 0;
    double max_working_set_mb = 0;
    double avg_thread_count = 0;
};

struct RunStatistics {
    double min_cpu_percent = 0;
    double avg_cpu_percent = 0;
    double max_cpu_percent = 0;
    double min_memory_percent = 0;
    double avg_memory_percent = 0;
    double max_memory_percent = 0;
    /** descending by avg_working_set_mb, at most top_n entries */
    std::vector<ProcessRollup> top_processes;
};

/**
 * Reduce a run to summary statistics and per-name process rollups.
 *
 * @param series samples of one run
 * @param top_n number of rollups to keep
 * @return std::nullopt when the series holds no sample
 */
std::optional<RunStatistics> summarize(const SampleTimeSeries &series, size_t top_n);

/**
 * Group every process entry of the run by name, ordered descending by average working set.
 * Names with equal averages keep the order in which they first appeared in the run.
 */
std::vector<ProcessRollup> rollupProcesses(const SampleTimeSeries &series);

}  // namespace SysProf
