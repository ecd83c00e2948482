#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "include/fallback_metrics_provider.hh"

namespace SysProf {

namespace Detail {

constexpr unsigned processes_per_busy_cpu = 10;

}  // namespace Detail

FallbackMetricsProvider::FallbackMetricsProvider(
    const ProcessSnapshotter &snapshotter, unsigned processor_count)
    : MetricsProvider("FallbackMetricsProvider"),
      snapshotter(snapshotter),
      processor_count(processor_count ? processor_count : getSystemNProc()) {}

double FallbackMetricsProvider::getCpuPercent() noexcept {
    try {
        std::vector<ProcessMetric> processes = snapshotter.snapshot();
        size_t active = std::count_if(
            processes.begin(), processes.end(),
            [](const ProcessMetric &p) { return p.thread_count() > 0; });

        double estimate = roundOneDecimal(
            100.0 * active / (static_cast<double>(processor_count) * Detail::processes_per_busy_cpu));
        return clampPercent(std::min(100.0, estimate));
    } catch (const std::exception &e) {
        VLOG(1) << absl::StrFormat("[FallbackMetricsProvider] CPU estimate failed: %s", e.what());
        return 0;
    }
}

double FallbackMetricsProvider::getPhysicalMemoryMb() noexcept {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) return 0;
    return static_cast<double>(status.ullTotalPhys) / bytes_per_mb;
#elif defined(_SC_PHYS_PAGES)
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGESIZE);
    if (pages <= 0 || page_size <= 0) return 0;
    return static_cast<double>(pages) * page_size / bytes_per_mb;
#else
    return 0;
#endif
}

MemoryInfo FallbackMetricsProvider::getMemoryInfo() noexcept {
    MemoryInfo info;
    info.total_mb = getPhysicalMemoryMb();
    info.available_mb = info.total_mb;
    return info;
}

}  // namespace SysProf
