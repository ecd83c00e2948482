#ifdef _WIN32

#include <windows.h>

#include <psapi.h>
#include <tlhelp32.h>

#include <string>
#include <type_traits>

#include "include/toolhelp_process_snapshotter.hh"

namespace SysProf {

namespace Detail {

struct HandleCloser {
    void operator()(HANDLE h) const {
        if (h && h != INVALID_HANDLE_VALUE) CloseHandle(h);
    }
};
using ScopedHandle = std::unique_ptr<std::remove_pointer_t<HANDLE>, HandleCloser>;

static std::string narrow(const wchar_t *wide) {
    int len = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1) return std::string();
    std::string out(static_cast<size_t>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), len, nullptr, nullptr);
    return out;
}

// Image name without the extension, the way process names are usually shown
static std::string processNameFromImage(const wchar_t *exe_file) {
    std::string name = narrow(exe_file);
    size_t dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) name.resize(dot);
    return name;
}

static uint64_t fileTimeTo100ns(const FILETIME &ft) {
    ULARGE_INTEGER v;
    v.LowPart = ft.dwLowDateTime;
    v.HighPart = ft.dwHighDateTime;
    return v.QuadPart;
}

static std::optional<ProcessMetric> readProcess(const PROCESSENTRY32W &entry) {
    ScopedHandle process(OpenProcess(
        PROCESS_QUERY_LIMITED_INFORMATION | PROCESS_VM_READ, FALSE, entry.th32ProcessID));
    if (!process) return std::nullopt;

    PROCESS_MEMORY_COUNTERS_EX counters{};
    if (!GetProcessMemoryInfo(
            process.get(), reinterpret_cast<PROCESS_MEMORY_COUNTERS *>(&counters),
            sizeof(counters))) {
        return std::nullopt;
    }

    ProcessMetric metric;
    metric.set_pid(static_cast<int32_t>(entry.th32ProcessID));
    metric.set_name(processNameFromImage(entry.szExeFile));
    metric.set_working_set_mb(static_cast<double>(counters.WorkingSetSize) / bytes_per_mb);
    metric.set_private_memory_mb(static_cast<double>(counters.PrivateUsage) / bytes_per_mb);
    metric.set_thread_count(static_cast<int32_t>(entry.cntThreads));

    FILETIME creation, exit, kernel, user;
    if (GetProcessTimes(process.get(), &creation, &exit, &kernel, &user)) {
        metric.set_processor_time_ms((fileTimeTo100ns(kernel) + fileTimeTo100ns(user)) / 10000);
    }
    return metric;
}

}  // namespace Detail

ToolhelpProcessSnapshotter::ToolhelpProcessSnapshotter()
    : ProcessSnapshotter("ToolhelpProcessSnapshotter") {}

std::vector<ProcessMetric> ToolhelpProcessSnapshotter::enumerate() const {
    std::vector<ProcessMetric> processes;

    Detail::ScopedHandle snapshot(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
    if (!snapshot || snapshot.get() == INVALID_HANDLE_VALUE) {
        VLOG(1) << absl::StrFormat(
            "[ToolhelpProcessSnapshotter] CreateToolhelp32Snapshot failed (%lu)", GetLastError());
        return processes;
    }

    PROCESSENTRY32W entry{};
    entry.dwSize = sizeof(entry);
    if (!Process32FirstW(snapshot.get(), &entry)) return processes;

    do {
        std::optional<ProcessMetric> metric = Detail::readProcess(entry);
        if (metric) processes.push_back(std::move(*metric));
    } while (Process32NextW(snapshot.get(), &entry));

    return processes;
}

}  // namespace SysProf

#endif  // _WIN32
