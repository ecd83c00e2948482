#include <cerrno>
#include <cstring>

#include "include/linux_metrics_provider.hh"

namespace SysProf {

namespace Detail {

// Only the aggregate line is consumed, fields after iowait are not part of the busy/idle split
static const char *cpu_total_stat_format =
    "cpu "  // (1) [NT] aggregate tag, always the first line of /proc/stat
    "%lu "  // (2) [1]  user %lu
    "%lu "  // (3) [2]  nice %lu
    "%lu "  // (4) [3]  system %lu
    "%lu "  // (5) [4]  idle %lu
    "%lu"   // (6) [5]  iowait %lu, absent on very old kernels
    ;

struct CPUJiffies {
    uint64_t total = 0;
    uint64_t idle = 0;
};

static bool parseProcStat(const fs::path &path, CPUJiffies *jiffies) {
    ScopedFile fp = openForRead(path);
    if (unlikely(!fp)) {
        VLOG(1) << absl::StrFormat(
            "[LinuxMetricsProvider] Failed to open %s: %s", path.string(), strerror(errno));
        return false;
    }

    unsigned long user = 0, nice = 0, system = 0, idle = 0, iowait = 0;
    int nfields =
        fscanf(fp.get(), cpu_total_stat_format, &user, &nice, &system, &idle, &iowait);
    if (unlikely(nfields < 4)) {
        VLOG(1) << absl::StrFormat(
            "[LinuxMetricsProvider] Expected at least 4 fields on the cpu line of %s, got %d",
            path.string(), nfields);
        return false;
    }

    jiffies->total = user + nice + system + idle + iowait;
    jiffies->idle = idle + iowait;
    return true;
}

static constexpr size_t meminfo_line_max_length = 256;

/**
 * Parse MemTotal and MemAvailable from a meminfo formatted file.
 *
 * @note Missing keys are left at 0.
 * @return false if the file cannot be opened
 */
static bool parseMemInfo(const fs::path &path, uint64_t *total_kb, uint64_t *available_kb) {
    ScopedFile fp = openForRead(path);
    if (unlikely(!fp)) {
        VLOG(1) << absl::StrFormat(
            "[LinuxMetricsProvider] Failed to open %s: %s", path.string(), strerror(errno));
        return false;
    }

    bool found_total = false, found_available = false;
    char line[meminfo_line_max_length];
    while ((!found_total || !found_available) && fgets(line, sizeof(line), fp.get())) {
        char key[64];
        unsigned long value;
        if (sscanf(line, "%63[^:]: %lu", key, &value) != 2) continue;

        if (strcmp(key, "MemTotal") == 0) {
            *total_kb = value;
            found_total = true;
        } else if (strcmp(key, "MemAvailable") == 0) {
            *available_kb = value;
            found_available = true;
        }
    }
    return true;
}

}  // namespace Detail

LinuxMetricsProvider::LinuxMetricsProvider(
    const fs::path &proc_stat_path, const fs::path &meminfo_path)
    : MetricsProvider("LinuxMetricsProvider"),
      proc_stat_path(proc_stat_path),
      meminfo_path(meminfo_path) {}

double LinuxMetricsProvider::getCpuPercent() noexcept {
    Detail::CPUJiffies current;
    if (!Detail::parseProcStat(proc_stat_path, &current)) return 0;

    if (!baseline.primed) {
        baseline.total = current.total;
        baseline.idle = current.idle;
        baseline.primed = true;
        return 0;
    }

    // a counter that went backwards is treated as a fresh baseline
    if (current.total <= baseline.total) {
        baseline.total = current.total;
        baseline.idle = current.idle;
        return 0;
    }

    uint64_t total_delta = current.total - baseline.total;
    uint64_t idle_delta = current.idle > baseline.idle ? current.idle - baseline.idle : 0;
    baseline.total = current.total;
    baseline.idle = current.idle;

    double busy = (1.0 - static_cast<double>(idle_delta) / static_cast<double>(total_delta)) * 100;
    return clampPercent(roundOneDecimal(busy));
}

MemoryInfo LinuxMetricsProvider::getMemoryInfo() noexcept {
    MemoryInfo info;
    uint64_t total_kb = 0, available_kb = 0;
    if (!Detail::parseMemInfo(meminfo_path, &total_kb, &available_kb)) return info;

    // MemAvailable larger than MemTotal only happens on a torn read
    if (available_kb > total_kb) available_kb = total_kb;
    uint64_t used_kb = total_kb - available_kb;

    info.total_mb = total_kb / kb_per_mb;
    info.available_mb = available_kb / kb_per_mb;
    info.used_mb = used_kb / kb_per_mb;
    info.used_percent =
        total_kb > 0 ? clampPercent(roundOneDecimal(100.0 * used_kb / total_kb)) : 0;
    return info;
}

}  // namespace SysProf
