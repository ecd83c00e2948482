#include <cerrno>
#include <cmath>
#include <cstring>
#include <thread>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

#include "include/utils.hh"

namespace SysProf {

#ifdef _WIN32

unsigned getSystemNProc() {
    unsigned n = std::thread::hardware_concurrency();
    return n ? n : 1;
}

unsigned long getSystemPageSize() {
    SYSTEM_INFO info;
    GetSystemInfo(&info);
    return info.dwPageSize;
}

// FILETIME based APIs report 100ns units, callers convert directly
unsigned getSystemHz() { return 10000000; }

std::string getPlatformDescription() {
    OSVERSIONINFOEXW info{};
    info.dwOSVersionInfoSize = sizeof(info);
    using RtlGetVersionFn = LONG(WINAPI *)(PRTL_OSVERSIONINFOW);
    HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
    auto rtl_get_version =
        ntdll ? reinterpret_cast<RtlGetVersionFn>(GetProcAddress(ntdll, "RtlGetVersion"))
              : nullptr;
    if (!rtl_get_version ||
        rtl_get_version(reinterpret_cast<PRTL_OSVERSIONINFOW>(&info)) != 0) {
        return "Microsoft Windows";
    }
    return absl::StrFormat(
        "Microsoft Windows %lu.%lu.%lu", info.dwMajorVersion, info.dwMinorVersion,
        info.dwBuildNumber);
}

#else

unsigned getSystemNProc() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? static_cast<unsigned>(n) : 1;
}

unsigned long getSystemPageSize() { return sysconf(_SC_PAGESIZE); }

// Jiffies warp around in 2^32 / HZ / 86400 = 497 days with HZ = 100 (typical)
unsigned getSystemHz() { return sysconf(_SC_CLK_TCK); }

std::string getPlatformDescription() {
    struct utsname uts {};
    if (uname(&uts) != 0) {
        LOG(WARNING) << absl::StrFormat("[Utils] uname failed: %s", strerror(errno));
        return "Unknown";
    }
    return absl::StrFormat("%s %s %s", uts.sysname, uts.release, uts.version);
}

#endif

double roundOneDecimal(double value) { return std::round(value * 10.0) / 10.0; }

double clampPercent(double value) {
    if (std::isnan(value) || value < 0.0) return 0.0;
    if (value > 100.0) return 100.0;
    return value;
}

fs::path validateDir(const std::string &dir) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(dir, ec);
    if (ec.value() == 0 && fs::is_directory(p, ec)) return p;
    return fs::path();
}

bool isWritableDir(const fs::path &dir) {
#ifdef _WIN32
    return _waccess(dir.c_str(), 2) == 0;
#else
    return access(dir.c_str(), W_OK) == 0;
#endif
}

}  // namespace SysProf
