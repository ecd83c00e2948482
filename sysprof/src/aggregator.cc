#include <algorithm>
#include <limits>
#include <unordered_map>

#include "include/aggregator.hh"

namespace SysProf {

namespace Detail {

struct RollupAccumulator {
    std::string name;
    double working_set_sum = 0;
    double working_set_max = std::numeric_limits<double>::lowest();
    double thread_sum = 0;
    size_t count = 0;
};

}  // namespace Detail

std::vector<ProcessRollup> rollupProcesses(const SampleTimeSeries &series) {
    // vector keeps first appearance order, the map only indexes into it
    std::vector<Detail::RollupAccumulator> groups;
    std::unordered_map<std::string, size_t> index;

    for (const Sample &sample : series.samples()) {
        for (const ProcessMetric &process : sample.processes()) {
            auto [it, inserted] = index.try_emplace(process.name(), groups.size());
            if (inserted) {
                groups.emplace_back();
                groups.back().name = process.name();
            }
            Detail::RollupAccumulator &acc = groups[it->second];
            acc.working_set_sum += process.working_set_mb();
            acc.working_set_max = std::max(acc.working_set_max, process.working_set_mb());
            acc.thread_sum += process.thread_count();
            acc.count++;
        }
    }

    std::vector<ProcessRollup> rollups;
    rollups.reserve(groups.size());
    for (const Detail::RollupAccumulator &acc : groups) {
        ProcessRollup rollup;
        rollup.name = acc.name;
        rollup.avg_working_set_mb = acc.working_set_sum / acc.count;
        rollup.max_working_set_mb = acc.working_set_max;
        rollup.avg_thread_count = acc.thread_sum / acc.count;
        rollups.push_back(std::move(rollup));
    }

    std::stable_sort(
        rollups.begin(), rollups.end(), [](const ProcessRollup &a, const ProcessRollup &b) {
            return a.avg_working_set_mb > b.avg_working_set_mb;
        });
    return rollups;
}

std::optional<RunStatistics> summarize(const SampleTimeSeries &series, size_t top_n) {
    if (series.samples_size() == 0) return std::nullopt;

    RunStatistics stats;
    stats.min_cpu_percent = stats.min_memory_percent = std::numeric_limits<double>::max();
    stats.max_cpu_percent = stats.max_memory_percent = std::numeric_limits<double>::lowest();

    double cpu_sum = 0, memory_sum = 0;
    for (const Sample &sample : series.samples()) {
        stats.min_cpu_percent = std::min(stats.min_cpu_percent, sample.cpu_percent());
        stats.max_cpu_percent = std::max(stats.max_cpu_percent, sample.cpu_percent());
        cpu_sum += sample.cpu_percent();

        stats.min_memory_percent = std::min(stats.min_memory_percent, sample.memory_percent());
        stats.max_memory_percent = std::max(stats.max_memory_percent, sample.memory_percent());
        memory_sum += sample.memory_percent();
    }
    stats.avg_cpu_percent = cpu_sum / series.samples_size();
    stats.avg_memory_percent = memory_sum / series.samples_size();

    stats.top_processes = rollupProcesses(series);
    if (stats.top_processes.size() > top_n) stats.top_processes.resize(top_n);
    return stats;
}

}  // namespace SysProf
