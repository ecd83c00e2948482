#pragma once

#include <sys/types.h>
#include <optional>
#include <vector>

#include "include/process_snapshotter.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * Enumerates the numeric entries of a procfs root and reads <pid>/stat and <pid>/statm for each.
 */
class ProcfsProcessSnapshotter final : public ProcessSnapshotter {
  public:
    /**
     * @param proc_dir procfs mount point
     * @param page_size bytes per page used to scale statm, the system page size when 0
     * @param clock_ticks jiffies per second used to scale stat times, the system value when 0
     */
    explicit ProcfsProcessSnapshotter(
        const fs::path &proc_dir = PROCDIR, unsigned long page_size = 0, unsigned clock_ticks = 0);

  protected:
    std::vector<ProcessMetric> enumerate() const override final;

  private:
    std::vector<pid_t> listPids() const;
    std::optional<ProcessMetric> readProcess(pid_t pid) const;

    const fs::path proc_dir;
    const unsigned long page_size;
    const unsigned clock_ticks;
};

}  // namespace SysProf
