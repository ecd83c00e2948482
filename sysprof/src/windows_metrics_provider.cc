#ifdef _WIN32

#include <algorithm>
#include <thread>

#include "include/windows_metrics_provider.hh"

namespace SysProf {

namespace Detail {

// Rate counters need two collections before the first valid value
constexpr cr::milliseconds counter_prime_delay{100};

}  // namespace Detail

WindowsMetricsProvider::WindowsMetricsProvider(const ProcessSnapshotter &snapshotter)
    : MetricsProvider("WindowsMetricsProvider"), fallback(snapshotter) {
    PDH_STATUS status = PdhOpenQueryW(nullptr, 0, &query);
    if (status != ERROR_SUCCESS) {
        LOG(WARNING) << absl::StrFormat(
            "[WindowsMetricsProvider] PdhOpenQuery failed (0x%08x), using fallback estimates",
            static_cast<unsigned>(status));
        query = nullptr;
        return;
    }

    status = PdhAddEnglishCounterW(query, L"\\Processor(_Total)\\% Processor Time", 0, &cpu_counter);
    if (status != ERROR_SUCCESS) {
        LOG(WARNING) << absl::StrFormat(
            "[WindowsMetricsProvider] Processor time counter unavailable (0x%08x)",
            static_cast<unsigned>(status));
        cpu_counter = nullptr;
    }

    status = PdhAddEnglishCounterW(query, L"\\Memory\\Available MBytes", 0, &available_mb_counter);
    if (status != ERROR_SUCCESS) {
        LOG(WARNING) << absl::StrFormat(
            "[WindowsMetricsProvider] Available MBytes counter unavailable (0x%08x)",
            static_cast<unsigned>(status));
        available_mb_counter = nullptr;
    }

    // discarded warm-up collection
    PdhCollectQueryData(query);
    std::this_thread::sleep_for(Detail::counter_prime_delay);
}

WindowsMetricsProvider::~WindowsMetricsProvider() {
    if (query) PdhCloseQuery(query);
}

bool WindowsMetricsProvider::readCounter(PDH_HCOUNTER counter, double *value) noexcept {
    if (!query || !counter) return false;
    if (PdhCollectQueryData(query) != ERROR_SUCCESS) return false;

    PDH_FMT_COUNTERVALUE counter_value;
    PDH_STATUS status = PdhGetFormattedCounterValue(counter, PDH_FMT_DOUBLE, nullptr, &counter_value);
    if (status != ERROR_SUCCESS || counter_value.CStatus != ERROR_SUCCESS) return false;

    *value = counter_value.doubleValue;
    return true;
}

double WindowsMetricsProvider::getCpuPercent() noexcept {
    double value;
    if (!readCounter(cpu_counter, &value)) return fallback.getCpuPercent();
    return clampPercent(roundOneDecimal(value));
}

MemoryInfo WindowsMetricsProvider::getMemoryInfo() noexcept {
    double available_mb;
    double total_mb = FallbackMetricsProvider::getPhysicalMemoryMb();
    if (total_mb <= 0 || !readCounter(available_mb_counter, &available_mb))
        return fallback.getMemoryInfo();

    MemoryInfo info;
    info.total_mb = total_mb;
    info.available_mb = std::min(available_mb, total_mb);
    info.used_mb = total_mb - info.available_mb;
    info.used_percent = clampPercent(roundOneDecimal(info.used_mb / total_mb * 100.0));
    return info;
}

}  // namespace SysProf

#endif  // _WIN32
