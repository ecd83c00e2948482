#include "include/metrics_provider.hh"
#include "include/fallback_metrics_provider.hh"

#if defined(_WIN32)
#include "include/windows_metrics_provider.hh"
#elif defined(__linux__)
#include "include/linux_metrics_provider.hh"
#endif

namespace SysProf {

std::unique_ptr<MetricsProvider> createMetricsProvider(const ProcessSnapshotter &snapshotter) {
    std::unique_ptr<MetricsProvider> provider;
#if defined(_WIN32)
    provider = std::make_unique<WindowsMetricsProvider>(snapshotter);
#elif defined(__linux__)
    UNUSED(snapshotter);
    provider = std::make_unique<LinuxMetricsProvider>();
#else
    provider = std::make_unique<FallbackMetricsProvider>(snapshotter);
#endif
    LOG(INFO) << absl::StrFormat("[MetricsProvider] Using %s", provider->getName());
    return provider;
}

}  // namespace SysProf
