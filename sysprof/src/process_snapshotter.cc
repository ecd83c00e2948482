#include <algorithm>

#include "include/process_snapshotter.hh"

#if defined(_WIN32)
#include "include/toolhelp_process_snapshotter.hh"
#elif defined(__linux__)
#include "include/procfs_process_snapshotter.hh"
#else
#include "include/bsd_process_snapshotter.hh"
#endif

namespace SysProf {

std::vector<ProcessMetric> ProcessSnapshotter::snapshot() const {
    std::vector<ProcessMetric> processes = enumerate();
    sortByWorkingSet(processes);
    return processes;
}

void sortByWorkingSet(std::vector<ProcessMetric> &processes) {
    std::stable_sort(
        processes.begin(), processes.end(), [](const ProcessMetric &a, const ProcessMetric &b) {
            return a.working_set_mb() > b.working_set_mb();
        });
}

EmptyProcessSnapshotter::EmptyProcessSnapshotter() : ProcessSnapshotter("EmptyProcessSnapshotter") {
    LOG(WARNING) << "[EmptyProcessSnapshotter] Process enumeration is not supported on this "
                    "platform, samples will carry no processes";
}

std::vector<ProcessMetric> EmptyProcessSnapshotter::enumerate() const { return {}; }

std::unique_ptr<ProcessSnapshotter> createProcessSnapshotter() {
#if defined(_WIN32)
    return std::make_unique<ToolhelpProcessSnapshotter>();
#elif defined(__linux__)
    return std::make_unique<ProcfsProcessSnapshotter>();
#elif defined(SYSPROF_HAS_BSD_PROCESS_API)
    return std::make_unique<BsdProcessSnapshotter>();
#else
    return std::make_unique<EmptyProcessSnapshotter>();
#endif
}

}  // namespace SysProf
