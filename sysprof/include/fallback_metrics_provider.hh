#pragma once

#include "include/metrics_provider.hh"
#include "include/process_snapshotter.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * Provider for platforms without a supported CPU counter, also used by the Windows provider
 * whenever one of its counters fails.
 *
 * CPU usage is an approximation: the number of processes with at least one thread relative to
 * ten processes per logical CPU, capped at 100. It tracks how busy the host looks, not how busy it
 * is, and isEstimate() reports so. Memory reports the physical total as available with usage 0.
 */
class FallbackMetricsProvider final : public MetricsProvider {
  public:
    /**
     * @param snapshotter process source for the estimate, must outlive this provider
     * @param processor_count logical CPUs, the system value when 0
     */
    explicit FallbackMetricsProvider(
        const ProcessSnapshotter &snapshotter, unsigned processor_count = 0);

    double getCpuPercent() noexcept override final;
    MemoryInfo getMemoryInfo() noexcept override final;
    bool isEstimate() const noexcept override final { return true; }

    /**
     * @return physical memory in MB as reported by the runtime, 0 if unknown
     */
    static double getPhysicalMemoryMb() noexcept;

  private:
    const ProcessSnapshotter &snapshotter;
    const unsigned processor_count;
};

}  // namespace SysProf
