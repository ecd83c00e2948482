#pragma once

#include <inttypes.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

// absl logging
#include <absl/log/check.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/log/log_entry.h>
#include <absl/log/log_sink.h>
// other absl
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

// protobuf
#include <google/protobuf/message.h>

#include <date/tz.h>

// global namespace alias
namespace cr = std::chrono;
namespace fs = std::filesystem;
namespace proto = google::protobuf;

// procfs layout, same naming as htop's LinuxMachine.h
#ifndef PROCDIR
#define PROCDIR "/proc"
#endif

// used in /proc/stat and /proc/<pid>/stat
#ifndef STATFILE
#define STATFILE "/stat"
#endif

#ifndef STATMFILE
#define STATMFILE "/statm"
#endif

#ifndef PROCSTATFILE
#define PROCSTATFILE PROCDIR STATFILE
#endif

#ifndef PROCMEMINFOFILE
#define PROCMEMINFOFILE PROCDIR "/meminfo"
#endif

#define SYSPROF_EXPAND(x)    x
#define SYSPROF_STRINGIFY(x) #x
#define SYSPROF_TOSTRING(x)  SYSPROF_STRINGIFY(x)

#define UNUSED(x) (void)(x)

#if defined(__GNUC__) || defined(__clang__)
#define unlikely(x) __builtin_expect(!!(x), 0)
#define likely(x)   __builtin_expect(!!(x), 1)
#else
#define unlikely(x) (x)
#define likely(x)   (x)
#endif

namespace SysProf {

constexpr double bytes_per_mb = 1024.0 * 1024.0;
constexpr double kb_per_mb = 1024.0;

// global helpper function
unsigned getSystemNProc();
unsigned long getSystemPageSize();
unsigned getSystemHz();

/**
 * @brief Round to one decimal place, the precision every percentage is reported with.
 */
double roundOneDecimal(double value);

/**
 * @brief Clamp a percentage into [0, 100]. NaN is mapped to 0.
 */
double clampPercent(double value);

/**
 * @brief Human-readable OS description in the form "<sysname> <release> <version>".
 */
std::string getPlatformDescription();

/**
 * @brief Render a wall clock time point in the given zone.
 * @param tp time point to render, already truncated to the precision wanted in the output
 * @param time_format date::format compatible format string
 * @param zone time zone, the host's current zone when nullptr
 */
template <typename Duration>
std::string formatTime(
    const date::sys_time<Duration> &tp, const std::string &time_format,
    const date::time_zone *zone = nullptr);

/**
 * Validate whether a given path exists in current filesystem and return a
 * fs::path object corresponding to it.
 *
 * @param dir target directory to be examined
 * @return realpath of dir if the directory exists, and empty path if not
 */
fs::path validateDir(const std::string &dir);

/**
 * @brief Whether the current process may create files in dir.
 */
bool isWritableDir(const fs::path &dir);

/* FILE handle closed on scope exit */
struct FileCloser {
    void operator()(FILE *fp) const {
        if (fp) fclose(fp);
    }
};
using ScopedFile = std::unique_ptr<FILE, FileCloser>;

inline ScopedFile openForRead(const fs::path &path) {
    return ScopedFile(fopen(path.string().c_str(), "r"));
}

}  // namespace SysProf

#include "include/utils.ipp"
