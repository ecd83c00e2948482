#pragma once

#include <string>

#include "include/sampler.hh"
#include "include/utils.hh"

namespace SysProf {

constexpr const char *default_report_file = "profile.log";
constexpr const char *raw_dump_suffix = ".pb.bin";

/**
 * Command line settings of one profiling run.
 */
struct RunConfig {
    int duration_s = 60;
    int rate_s = 2;
    std::string report_path = default_report_file;
    /** empty logs to stderr only */
    std::string log_dir;
    bool raw_dump = false;

    /** filled in by validateRunConfig() */
    fs::path resolved_report_path;
};

/**
 * Validate config and resolve where the report goes. The bare default file name resolves into
 * the user's home directory; a missing parent directory is created.
 *
 * @param config config to validate, resolved_report_path is set on success
 * @return InvalidArgument for a non-positive duration or rate, or an empty or directory path;
 *         PermissionDenied if the report directory cannot be created or written to
 */
absl::Status validateRunConfig(RunConfig *config);

/**
 * @brief The user's home directory, empty if the environment does not name one.
 */
fs::path getHomeDir();

SamplerOptions toSamplerOptions(const RunConfig &config);

/**
 * @brief Path of the raw protobuf dump written next to the report.
 */
fs::path rawDumpPath(const fs::path &report_path);

}  // namespace SysProf
