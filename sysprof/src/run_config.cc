#include <cstdlib>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>

#include "include/run_config.hh"

namespace SysProf {

fs::path getHomeDir() {
#ifdef _WIN32
    const char *home = std::getenv("USERPROFILE");
#else
    const char *home = std::getenv("HOME");
#endif
    if (!home || *home == '\0') return fs::path();
    return fs::path(home);
}

absl::Status validateRunConfig(RunConfig *config) {
    if (config->duration_s <= 0) {
        return absl::InvalidArgumentError("Duration must be a positive integer");
    }
    if (config->rate_s <= 0) {
        return absl::InvalidArgumentError("Rate must be a positive integer");
    }
    if (absl::StripAsciiWhitespace(config->report_path).empty()) {
        return absl::InvalidArgumentError("Report path cannot be empty");
    }

    fs::path report_path(config->report_path);
    if (absl::EqualsIgnoreCase(config->report_path, default_report_file)) {
        fs::path home = getHomeDir();
        if (home.empty()) {
            LOG(WARNING) << absl::StrFormat(
                "[RunConfig] Home directory unknown, writing %s to the working directory",
                default_report_file);
        } else {
            report_path = home / default_report_file;
        }
    }

    std::error_code ec;
    if (fs::is_directory(report_path, ec)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Report path %s is a directory", report_path.string()));
    }

    fs::path parent = report_path.parent_path();
    if (parent.empty()) parent = fs::current_path(ec);
    if (!fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            return absl::PermissionDeniedError(absl::StrFormat(
                "Could not create directory %s: %s", parent.string(), ec.message()));
        }
        LOG(INFO) << absl::StrFormat("[RunConfig] Created report directory %s", parent.string());
    }
    if (!isWritableDir(parent)) {
        return absl::PermissionDeniedError(
            absl::StrFormat("Report directory %s is not writable", parent.string()));
    }

    config->resolved_report_path = report_path;
    return absl::OkStatus();
}

SamplerOptions toSamplerOptions(const RunConfig &config) {
    SamplerOptions options;
    options.duration = cr::seconds(config.duration_s);
    options.interval = cr::seconds(config.rate_s);
    options.emit_final_progress = true;
    return options;
}

fs::path rawDumpPath(const fs::path &report_path) {
    fs::path dump = report_path;
    dump += raw_dump_suffix;
    return dump;
}

}  // namespace SysProf
