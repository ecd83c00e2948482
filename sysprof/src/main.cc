#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>

#include "include/aggregator.hh"
#include "include/logger.hh"
#include "include/process_snapshotter.hh"
#include "include/report_formatter.hh"
#include "include/run_config.hh"
#include "include/sample_store.hh"
#include "include/sampler.hh"
#include "include/stop_signal_watcher.hh"

ABSL_FLAG(int, duration, 60, "Total duration to sample (in seconds)");
ABSL_FLAG(int, rate, 2, "Interval between samples (in seconds)");
ABSL_FLAG(
    std::string, path, SysProf::default_report_file,
    "Path to the output report file, the bare default name is placed in the home directory");
ABSL_FLAG(std::string, log_dir, "", "Directory to write sysprof.log to, stderr when empty");
ABSL_FLAG(bool, raw, false, "Also dump the raw samples in protobuf form next to the report");

namespace SysProf {

namespace Detail {

static void printRunHeader(const RunConfig &config) {
    absl::PrintF("=== System Profiler ===\n\n");
    absl::PrintF("  Platform:    %s\n", getPlatformDescription());
    absl::PrintF("  Processors:  %u\n", getSystemNProc());
    absl::PrintF("  Duration:    %d seconds\n", config.duration_s);
    absl::PrintF("  Sample Rate: Every %d second(s)\n", config.rate_s);
    absl::PrintF("  Report Path: %s\n\n", config.resolved_report_path.string());
}

static int runProfiler(const RunConfig &config) {
    printRunHeader(config);

    Sampler sampler(createProcessSnapshotter());
    absl::Status status;
    {
        StopSignalWatcher stop_watcher(sampler);
        absl::PrintF("Starting profiler... Press Ctrl+C to stop early.\n\n");
        status = sampler.run(
            toSamplerOptions(config), [](const Sample &sample, double progress) {
                absl::PrintF("%s\n", formatProgress(sample, progress));
                fflush(stdout);
            });
    }
    if (!status.ok()) {
        absl::FPrintF(stderr, "Error: %s\n", status.message());
        return 1;
    }

    const SampleTimeSeries &samples = sampler.getSamples();
    if (sampler.wasStopped()) {
        absl::PrintF("Profiling stopped early after %d samples.\n\n", samples.samples_size());
    }
    if (sampler.isCpuEstimated()) {
        absl::PrintF("Note: CPU usage is estimated from process activity on this platform.\n\n");
    }

    std::optional<RunStatistics> stats = summarize(samples, interactive_top_n);
    if (stats) absl::PrintF("%s\n", formatSummary(*stats));

    status = writeReport(config.resolved_report_path, formatReport(samples, currentRunMetadata()));
    if (!status.ok()) {
        LOG(ERROR) << absl::StrFormat("[SysProf] %s", status.ToString());
        absl::FPrintF(stderr, "Error: %s\n", status.message());
        return 1;
    }

    if (config.raw_dump) {
        fs::path dump_path = rawDumpPath(config.resolved_report_path);
        status = writeSampleTimeSeries(samples, dump_path);
        if (!status.ok()) {
            LOG(ERROR) << absl::StrFormat("[SysProf] %s", status.ToString());
            absl::FPrintF(stderr, "Error: %s\n", status.message());
            return 1;
        }
        absl::PrintF("Raw samples saved to: %s\n", dump_path.string());
    }

    absl::PrintF(
        "Profiling complete. Results saved to: %s\n", config.resolved_report_path.string());
    return 0;
}

}  // namespace Detail

}  // namespace SysProf

int main(int argc, char **argv) {
    absl::SetProgramUsageMessage(
        "Samples system CPU, memory and per-process usage at a fixed rate and writes a report.");
    absl::ParseCommandLine(argc, argv);

    SysProf::RunConfig config;
    config.duration_s = absl::GetFlag(FLAGS_duration);
    config.rate_s = absl::GetFlag(FLAGS_rate);
    config.report_path = absl::GetFlag(FLAGS_path);
    config.log_dir = absl::GetFlag(FLAGS_log_dir);
    config.raw_dump = absl::GetFlag(FLAGS_raw);

    if (!SysProf::loggerInitialize(config.log_dir)) {
        absl::FPrintF(stderr, "Error: cannot write logs to %s\n", config.log_dir);
        return 1;
    }

    absl::Status status = SysProf::validateRunConfig(&config);
    if (!status.ok()) {
        absl::FPrintF(stderr, "Error: %s\n", status.message());
        SysProf::loggerDeinitialize();
        return 1;
    }

    int ret = SysProf::Detail::runProfiler(config);
    SysProf::loggerDeinitialize();
    return ret;
}
