#include "include/bsd_process_snapshotter.hh"

#ifdef SYSPROF_HAS_BSD_PROCESS_API

#include <algorithm>
#include <cerrno>
#include <cstring>

#if defined(__APPLE__)
#include <libproc.h>
#include <mach/mach_time.h>
#include <sys/proc_info.h>
#include <sys/resource.h>
#else
#include <sys/sysctl.h>
#include <sys/user.h>
#include <unistd.h>
#endif

namespace SysProf {

namespace Detail {

#if defined(__APPLE__)

// pid list may grow between the size query and the fill
static constexpr size_t pid_list_slack = 64;

static std::vector<pid_t> listAllPids() {
    int count = proc_listallpids(nullptr, 0);
    if (count <= 0) {
        VLOG(1) << absl::StrFormat(
            "[BsdProcessSnapshotter] proc_listallpids failed: %s", strerror(errno));
        return {};
    }

    std::vector<pid_t> pids(static_cast<size_t>(count) + pid_list_slack);
    count = proc_listallpids(pids.data(), static_cast<int>(pids.size() * sizeof(pid_t)));
    if (count <= 0) return {};
    pids.resize(std::min(pids.size(), static_cast<size_t>(count)));
    return pids;
}

// task times are in mach absolute time units, which are not nanoseconds on arm64
static uint64_t machTimeToMs(uint64_t mach_time) {
    static const mach_timebase_info_data_t timebase = []() {
        mach_timebase_info_data_t info{1, 1};
        if (mach_timebase_info(&info) != KERN_SUCCESS || info.denom == 0) info = {1, 1};
        return info;
    }();
    return mach_time * timebase.numer / timebase.denom / 1000000;
}

static std::optional<ProcessMetric> readProcess(pid_t pid) {
    struct proc_taskinfo task_info;
    int ret = proc_pidinfo(pid, PROC_PIDTASKINFO, 0, &task_info, sizeof(task_info));
    if (ret != static_cast<int>(sizeof(task_info))) return std::nullopt;

    char name[2 * MAXCOMLEN + 1] = {};
    if (proc_name(pid, name, sizeof(name)) <= 0) return std::nullopt;

    ProcessMetric metric;
    metric.set_pid(pid);
    metric.set_name(name);
    metric.set_working_set_mb(static_cast<double>(task_info.pti_resident_size) / bytes_per_mb);
    metric.set_thread_count(task_info.pti_threadnum);
    metric.set_processor_time_ms(
        machTimeToMs(task_info.pti_total_user + task_info.pti_total_system));

    // physical footprint is the private memory figure Activity Monitor shows, best-effort
    struct rusage_info_v2 usage;
    if (proc_pid_rusage(pid, RUSAGE_INFO_V2, reinterpret_cast<rusage_info_t *>(&usage)) == 0) {
        metric.set_private_memory_mb(static_cast<double>(usage.ri_phys_footprint) / bytes_per_mb);
    }
    return metric;
}

#else

static constexpr int proc_table_retries = 3;

static std::vector<struct kinfo_proc> readProcTable() {
    int mib[3] = {CTL_KERN, KERN_PROC, KERN_PROC_PROC};
    for (int attempt = 0; attempt < proc_table_retries; attempt++) {
        size_t len = 0;
        if (sysctl(mib, 3, nullptr, &len, nullptr, 0) != 0) break;

        // room for processes started since the size query
        len += len / 8;
        std::vector<struct kinfo_proc> procs(len / sizeof(struct kinfo_proc) + 1);
        len = procs.size() * sizeof(struct kinfo_proc);
        if (sysctl(mib, 3, procs.data(), &len, nullptr, 0) == 0) {
            procs.resize(len / sizeof(struct kinfo_proc));
            return procs;
        }
        if (errno != ENOMEM) break;
    }

    VLOG(1) << absl::StrFormat(
        "[BsdProcessSnapshotter] kern.proc.proc sysctl failed: %s", strerror(errno));
    return {};
}

static ProcessMetric readProcess(const struct kinfo_proc &proc, unsigned long page_size) {
    ProcessMetric metric;
    metric.set_pid(proc.ki_pid);
    metric.set_name(proc.ki_comm);
    metric.set_working_set_mb(static_cast<double>(proc.ki_rssize) * page_size / bytes_per_mb);
    metric.set_private_memory_mb(static_cast<double>(proc.ki_dsize) * page_size / bytes_per_mb);
    metric.set_thread_count(proc.ki_numthreads);
    // ki_runtime is in microseconds
    metric.set_processor_time_ms(static_cast<uint64_t>(proc.ki_runtime) / 1000);
    return metric;
}

#endif

}  // namespace Detail

BsdProcessSnapshotter::BsdProcessSnapshotter() : ProcessSnapshotter("BsdProcessSnapshotter") {}

std::vector<ProcessMetric> BsdProcessSnapshotter::enumerate() const {
    std::vector<ProcessMetric> processes;
    size_t skipped = 0;

#if defined(__APPLE__)
    for (pid_t pid : Detail::listAllPids()) {
        if (pid <= 0) continue;
        std::optional<ProcessMetric> metric = Detail::readProcess(pid);
        if (!metric) {
            // exited since listing or owned by another user
            skipped++;
            continue;
        }
        processes.push_back(std::move(*metric));
    }
#else
    const unsigned long page_size = getSystemPageSize();
    for (const struct kinfo_proc &proc : Detail::readProcTable()) {
        processes.push_back(Detail::readProcess(proc, page_size));
    }
#endif

    VLOG(2) << absl::StrFormat(
        "[BsdProcessSnapshotter] Captured %zu processes, skipped %zu", processes.size(), skipped);
    return processes;
}

}  // namespace SysProf

#endif  // SYSPROF_HAS_BSD_PROCESS_API
