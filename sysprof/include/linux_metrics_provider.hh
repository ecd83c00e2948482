#pragma once

#include "include/metrics_provider.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * Reads /proc/stat and /proc/meminfo. CPU usage is the busy share of the jiffies elapsed between
 * two consecutive calls, so the first call only records a baseline and reports 0.
 */
class LinuxMetricsProvider final : public MetricsProvider {
  public:
    LinuxMetricsProvider(
        const fs::path &proc_stat_path = PROCSTATFILE,
        const fs::path &meminfo_path = PROCMEMINFOFILE);

    double getCpuPercent() noexcept override final;
    MemoryInfo getMemoryInfo() noexcept override final;

  private:
    struct CPUJiffiesBaseline {
        uint64_t total = 0;
        uint64_t idle = 0;
        bool primed = false;
    };

    const fs::path proc_stat_path;
    const fs::path meminfo_path;
    CPUJiffiesBaseline baseline;
};

}  // namespace SysProf
