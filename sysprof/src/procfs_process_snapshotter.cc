#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>

#include "include/procfs_process_snapshotter.hh"

namespace SysProf {

namespace Detail {

static constexpr size_t stat_line_max_length = 1024;

// Refer to https://man7.org/linux/man-pages/man5/proc_pid_stat.5.html
// Applied to the text following "<pid> (<comm>) ", comm is extracted separately because it may
// contain spaces and parentheses.
static const char *proc_pid_stat_times_format =
    " %*c "  // (3)  [NT] state %c
    "%*d "   // (4)  [NT] ppid %d
    "%*d "   // (5)  [NT] pgrp %d
    "%*d "   // (6)  [NT] session %d
    "%*d "   // (7)  [NT] tty_nr %d
    "%*d "   // (8)  [NT] tpgid %d
    "%*u "   // (9)  [NT] flags %u
    "%*lu "  // (10) [NT] minflt %lu
    "%*lu "  // (11) [NT] cminflt %lu
    "%*lu "  // (12) [NT] majflt %lu
    "%*lu "  // (13) [NT] cmajflt %lu
    "%lu "   // (14) [1]  utime %lu
    "%lu"    // (15) [2]  stime %lu
    ;

// Same tail, every field before num_threads skipped as an opaque token so a malformed time field
// does not shift it.
static const char *proc_pid_stat_threads_format =
    " %*s "  // (3)  [NT] state
    "%*s "   // (4)  [NT] ppid
    "%*s "   // (5)  [NT] pgrp
    "%*s "   // (6)  [NT] session
    "%*s "   // (7)  [NT] tty_nr
    "%*s "   // (8)  [NT] tpgid
    "%*s "   // (9)  [NT] flags
    "%*s "   // (10) [NT] minflt
    "%*s "   // (11) [NT] cminflt
    "%*s "   // (12) [NT] majflt
    "%*s "   // (13) [NT] cmajflt
    "%*s "   // (14) [NT] utime
    "%*s "   // (15) [NT] stime
    "%*s "   // (16) [NT] cutime
    "%*s "   // (17) [NT] cstime
    "%*s "   // (18) [NT] priority
    "%*s "   // (19) [NT] nice
    "%ld"    // (20) [1]  num_threads %ld
    ;        /** fields after num_threads are not needed for a process snapshot */

static const char *proc_pid_statm_format =
    "%*lu "  // (1) [NT] size %lu
    "%lu "   // (2) [1]  resident %lu
    "%*lu "  // (3) [NT] share %lu
    "%*lu "  // (4) [NT] text %lu
    "%*lu "  // (5) [NT] lib %lu
    "%lu"    // (6) [2]  data %lu
    ;

struct PIDStat {
    std::string comm;
    unsigned long utime = 0;
    unsigned long stime = 0;
    long num_threads = 0;
    /** utime and stime were both parsed */
    bool has_times = false;
};

static bool parseProcPIDStat(const fs::path &stat_path, PIDStat *stat) {
    ScopedFile fp = openForRead(stat_path);
    if (!fp) return false;

    char line[stat_line_max_length];
    if (!fgets(line, sizeof(line), fp.get())) return false;

    const char *comm_begin = strchr(line, '(');
    const char *comm_end = strrchr(line, ')');
    if (unlikely(!comm_begin || !comm_end || comm_end < comm_begin)) return false;

    stat->comm.assign(comm_begin + 1, comm_end);
    if (unlikely(sscanf(comm_end + 1, proc_pid_stat_threads_format, &stat->num_threads) != 1)) {
        VLOG(2) << absl::StrFormat(
            "[ProcfsProcessSnapshotter] Failed to parse num_threads from %s", stat_path.string());
        return false;
    }

    // processor time is best-effort
    int nfields = sscanf(comm_end + 1, proc_pid_stat_times_format, &stat->utime, &stat->stime);
    stat->has_times = nfields == 2;
    if (unlikely(!stat->has_times)) {
        VLOG(2) << absl::StrFormat(
            "[ProcfsProcessSnapshotter] Failed to parse times from %s: expected 2 fields, got %d",
            stat_path.string(), nfields);
        stat->utime = stat->stime = 0;
    }
    return true;
}

static bool parseProcPIDStatm(
    const fs::path &statm_path, unsigned long *resident, unsigned long *data) {
    ScopedFile fp = openForRead(statm_path);
    if (!fp) return false;

    int nfields = fscanf(fp.get(), proc_pid_statm_format, resident, data);
    if (unlikely(nfields < 2)) {
        VLOG(2) << absl::StrFormat(
            "[ProcfsProcessSnapshotter] Failed to parse %s: expected 2 fields, got %d",
            statm_path.string(), nfields);
        return false;
    }
    return true;
}

}  // namespace Detail

ProcfsProcessSnapshotter::ProcfsProcessSnapshotter(
    const fs::path &proc_dir, unsigned long page_size, unsigned clock_ticks)
    : ProcessSnapshotter("ProcfsProcessSnapshotter"),
      proc_dir(proc_dir),
      page_size(page_size ? page_size : getSystemPageSize()),
      clock_ticks(clock_ticks ? clock_ticks : getSystemHz()) {}

std::vector<pid_t> ProcfsProcessSnapshotter::listPids() const {
    std::vector<pid_t> pids;
    std::error_code ec;
    fs::directory_iterator it(proc_dir, ec);
    if (ec) {
        VLOG(1) << absl::StrFormat(
            "[ProcfsProcessSnapshotter] Cannot list %s: %s", proc_dir.string(), ec.message());
        return pids;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string entry_name = it->path().filename().string();
        pid_t pid;
        const char *begin = entry_name.data();
        const char *end = begin + entry_name.size();
        auto [ptr, parse_ec] = std::from_chars(begin, end, pid);
        if (parse_ec != std::errc() || ptr != end || pid <= 0) continue;
        pids.push_back(pid);
    }

    std::sort(pids.begin(), pids.end());
    return pids;
}

std::optional<ProcessMetric> ProcfsProcessSnapshotter::readProcess(pid_t pid) const {
    const fs::path pid_dir = proc_dir / std::to_string(pid);

    Detail::PIDStat stat;
    if (!Detail::parseProcPIDStat(pid_dir / "stat", &stat)) return std::nullopt;

    unsigned long resident_pages = 0, data_pages = 0;
    if (!Detail::parseProcPIDStatm(pid_dir / "statm", &resident_pages, &data_pages))
        return std::nullopt;

    ProcessMetric metric;
    metric.set_pid(pid);
    metric.set_name(stat.comm);
    metric.set_working_set_mb(static_cast<double>(resident_pages) * page_size / bytes_per_mb);
    metric.set_private_memory_mb(static_cast<double>(data_pages) * page_size / bytes_per_mb);
    metric.set_thread_count(static_cast<int32_t>(stat.num_threads));
    if (stat.has_times && clock_ticks > 0) {
        metric.set_processor_time_ms(
            (static_cast<uint64_t>(stat.utime) + stat.stime) * 1000 / clock_ticks);
    }
    return metric;
}

std::vector<ProcessMetric> ProcfsProcessSnapshotter::enumerate() const {
    std::vector<ProcessMetric> processes;
    size_t skipped = 0;
    for (pid_t pid : listPids()) {
        std::optional<ProcessMetric> metric = readProcess(pid);
        if (!metric) {
            // exited or inaccessible since listing
            skipped++;
            continue;
        }
        processes.push_back(std::move(*metric));
    }

    VLOG(2) << absl::StrFormat(
        "[ProcfsProcessSnapshotter] Captured %zu processes, skipped %zu", processes.size(),
        skipped);
    return processes;
}

}  // namespace SysProf
