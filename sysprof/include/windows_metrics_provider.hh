#pragma once

#ifdef _WIN32

#include <windows.h>

#include <pdh.h>

#include "include/fallback_metrics_provider.hh"
#include "include/metrics_provider.hh"
#include "include/utils.hh"

namespace SysProf {

/**
 * PDH based provider. CPU comes from "\Processor(_Total)\% Processor Time", memory from
 * GlobalMemoryStatusEx (total) and "\Memory\Available MBytes" (available). A counter that cannot
 * be opened or read makes that call answer like FallbackMetricsProvider.
 */
class WindowsMetricsProvider final : public MetricsProvider {
  public:
    explicit WindowsMetricsProvider(const ProcessSnapshotter &snapshotter);
    ~WindowsMetricsProvider() override;

    double getCpuPercent() noexcept override final;
    MemoryInfo getMemoryInfo() noexcept override final;

  private:
    bool readCounter(PDH_HCOUNTER counter, double *value) noexcept;

    FallbackMetricsProvider fallback;

    PDH_HQUERY query = nullptr;
    PDH_HCOUNTER cpu_counter = nullptr;
    PDH_HCOUNTER available_mb_counter = nullptr;
};

}  // namespace SysProf

#endif  // _WIN32
