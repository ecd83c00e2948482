#pragma once

#include <functional>
#include <memory>
#include <string_view>

#include "include/utils.hh"

namespace SysProf {

class ProcessSnapshotter;

struct MemoryInfo {
    double total_mb = 0;
    double used_mb = 0;
    double available_mb = 0;
    /** used / total in percent, one decimal place, 0 when total is unknown */
    double used_percent = 0;
};

/**
 * Host-wide CPU and memory source for one run. One variant is selected per platform when the run
 * starts and is destroyed when the run ends, so per-variant state (counter handles, jiffies
 * baselines) never outlives a run.
 *
 * @note None of the methods throw. A failed read degrades to a fallback or zero value.
 */
class MetricsProvider {
  public:
    explicit MetricsProvider(const std::string &name) : name(name) {}

    /* Disable copy constructor */
    MetricsProvider(const MetricsProvider &) = delete;
    MetricsProvider &operator=(const MetricsProvider &) = delete;

    virtual ~MetricsProvider() = default;

    /**
     * Overall CPU usage since the previous call.
     *
     * @return percentage in [0, 100]
     */
    virtual double getCpuPercent() noexcept = 0;

    virtual MemoryInfo getMemoryInfo() noexcept = 0;

    /**
     * @return true if getCpuPercent() is a heuristic rather than a measured value
     */
    virtual bool isEstimate() const noexcept { return false; }

    const std::string_view getName() const { return std::string_view(name); }

  protected:
    const std::string name;
};

using MetricsProviderFactory =
    std::function<std::unique_ptr<MetricsProvider>(const ProcessSnapshotter &)>;

/**
 * Select the provider for the platform this binary runs on.
 *
 * @param snapshotter process source used by the fallback CPU estimate, must outlive the provider
 */
std::unique_ptr<MetricsProvider> createMetricsProvider(const ProcessSnapshotter &snapshotter);

}  // namespace SysProf
