#include <algorithm>
#include <cerrno>
#include <cstring>

#include "include/report_formatter.hh"

namespace SysProf {

namespace Detail {

constexpr size_t rule_width = 80;
constexpr size_t sample_rule_width = 74;
constexpr int bar_cells = 20;
constexpr size_t progress_name_width = 15;

static const std::string heavy_rule(rule_width, '=');
static const std::string light_rule(rule_width, '-');

static date::sys_time<cr::nanoseconds> sampleTime(const Sample &sample) {
    return date::sys_time<cr::nanoseconds>(cr::nanoseconds(sample.timestamp_ns()));
}

static std::string formatSeconds(const date::sys_time<cr::nanoseconds> &tp,
                                 const std::string &fmt, const date::time_zone *zone) {
    return formatTime(cr::floor<cr::seconds>(tp), fmt, zone);
}

static void appendSection(std::string &out, const std::string &rule, const char *title) {
    absl::StrAppendFormat(&out, "%s\n%s\n%s\n", rule, title, rule);
}

static void appendHeader(
    std::string &out, const SampleTimeSeries &series, const RunMetadata &metadata) {
    absl::StrAppendFormat(&out, "%s\n", heavy_rule);
    out += "                           SYSTEM PROFILE REPORT\n";
    absl::StrAppendFormat(&out, "%s\n\n", heavy_rule);

    absl::StrAppendFormat(
        &out, "Generated: %s\n",
        formatTime(cr::floor<cr::seconds>(metadata.generated_at), "%Y-%m-%d %H:%M:%S",
                   metadata.zone));
    absl::StrAppendFormat(&out, "Platform: %s\n", metadata.platform);
    absl::StrAppendFormat(&out, "Processors: %u\n", metadata.processor_count);
    absl::StrAppendFormat(&out, "Total Samples: %d\n", series.samples_size());

    if (series.samples_size() > 0) {
        const Sample &first = series.samples(0);
        const Sample &last = series.samples(series.samples_size() - 1);
        absl::StrAppendFormat(
            &out, "Duration: %s - %s\n",
            formatSeconds(sampleTime(first), "%H:%M:%S", metadata.zone),
            formatSeconds(sampleTime(last), "%H:%M:%S", metadata.zone));
    }
    out += "\n";
}

static void appendSummary(std::string &out, const RunStatistics &stats) {
    appendSection(out, light_rule, "SUMMARY");
    absl::StrAppendFormat(
        &out, "CPU Usage:    Min: %.1f%%   Avg: %.1f%%   Max: %.1f%%\n", stats.min_cpu_percent,
        stats.avg_cpu_percent, stats.max_cpu_percent);
    absl::StrAppendFormat(
        &out, "Memory Usage: Min: %.1f%%   Avg: %.1f%%   Max: %.1f%%\n", stats.min_memory_percent,
        stats.avg_memory_percent, stats.max_memory_percent);
    out += "\n";

    appendSection(out, light_rule, "TOP PROCESSES (by average memory usage)");
    absl::StrAppendFormat(
        &out, "%-30s %-15s %-15s %-12s\n", "Process", "Avg Memory", "Max Memory", "Avg Threads");
    absl::StrAppendFormat(&out, "%s\n", light_rule);
    for (const ProcessRollup &rollup : stats.top_processes) {
        absl::StrAppendFormat(
            &out, "%-30s %10.1f MB   %10.1f MB   %8.0f\n", rollup.name, rollup.avg_working_set_mb,
            rollup.max_working_set_mb, rollup.avg_thread_count);
    }
}

static void appendSample(std::string &out, const Sample &sample, const date::time_zone *zone) {
    absl::StrAppendFormat(
        &out, "\n--- Sample %d at %s ---\n\n", sample.sequence(),
        formatTime(
            cr::floor<cr::milliseconds>(sampleTime(sample)), "%Y-%m-%d %H:%M:%S", zone));
    absl::StrAppendFormat(&out, "CPU Usage: %.1f%%\n", sample.cpu_percent());
    absl::StrAppendFormat(
        &out, "Memory: %.0f MB used / %.0f MB total (%.1f%%)\n", sample.used_memory_mb(),
        sample.total_memory_mb(), sample.memory_percent());
    absl::StrAppendFormat(&out, "Available Memory: %.0f MB\n\n", sample.available_memory_mb());

    out += "Top 10 Processes by Memory:\n";
    absl::StrAppendFormat(
        &out, "  %-8s %-25s %-15s %-15s %-8s\n", "PID", "Process", "Working Set", "Private Mem",
        "Threads");
    absl::StrAppendFormat(&out, "  %s\n", std::string(sample_rule_width, '-'));

    size_t rows = std::min<size_t>(sample.processes_size(), report_sample_top_n);
    for (size_t i = 0; i < rows; i++) {
        const ProcessMetric &process = sample.processes(static_cast<int>(i));
        absl::StrAppendFormat(
            &out, "  %-8d %-25s %10.1f MB   %10.1f MB   %-8d\n", process.pid(), process.name(),
            process.working_set_mb(), process.private_memory_mb(), process.thread_count());
    }
}

// 5% per cell, anything outside [0, 100] saturates
static std::string bar(double percent) {
    int filled = std::clamp(static_cast<int>(percent / 5), 0, bar_cells);
    return absl::StrFormat(
        "[%s%s]", std::string(filled, '#'), std::string(bar_cells - filled, '.'));
}

static std::string truncateName(const std::string &name, size_t width) {
    return name.size() <= width ? name : name.substr(0, width);
}

}  // namespace Detail

RunMetadata currentRunMetadata() {
    RunMetadata metadata;
    metadata.generated_at = cr::system_clock::now();
    metadata.platform = getPlatformDescription();
    metadata.processor_count = getSystemNProc();
    return metadata;
}

std::string formatReport(const SampleTimeSeries &series, const RunMetadata &metadata) {
    std::string out;
    Detail::appendHeader(out, series, metadata);

    std::optional<RunStatistics> stats = summarize(series, report_top_n);
    if (!stats) {
        out += "No samples collected.\n";
        return out;
    }

    Detail::appendSummary(out, *stats);

    out += "\n";
    Detail::appendSection(out, Detail::heavy_rule, "DETAILED SAMPLES");
    for (const Sample &sample : series.samples()) {
        Detail::appendSample(out, sample, metadata.zone);
    }
    return out;
}

std::string formatProgress(const Sample &sample, double progress, const date::time_zone *zone) {
    double progress_percent = std::clamp(progress, 0.0, 1.0) * 100.0;

    std::string out;
    absl::StrAppendFormat(
        &out, "Sample #%-5d %s  %s %3.0f%%\n", sample.sequence(),
        Detail::formatSeconds(Detail::sampleTime(sample), "%H:%M:%S", zone),
        Detail::bar(progress_percent), progress_percent);
    absl::StrAppendFormat(
        &out, "  CPU     %6.1f%%              %s\n", sample.cpu_percent(),
        Detail::bar(sample.cpu_percent()));
    absl::StrAppendFormat(
        &out, "  Memory  %7.0f / %7.0f MB  %s\n", sample.used_memory_mb(),
        sample.total_memory_mb(), Detail::bar(sample.memory_percent()));

    size_t rows = std::min<size_t>(sample.processes_size(), progress_top_n);
    for (size_t i = 0; i < rows; i++) {
        const ProcessMetric &process = sample.processes(static_cast<int>(i));
        absl::StrAppendFormat(
            &out, "  (%d) %-15s %8.0f MB  %5d threads\n", i + 1,
            Detail::truncateName(process.name(), Detail::progress_name_width),
            process.working_set_mb(), process.thread_count());
    }
    return out;
}

std::string formatSummary(const RunStatistics &stats) {
    std::string out = "Summary\n";
    absl::StrAppendFormat(&out, "  %-8s %10s %10s %10s\n", "Metric", "Average", "Min", "Max");
    absl::StrAppendFormat(
        &out, "  %-8s %9.1f%% %9.1f%% %9.1f%%\n", "CPU", stats.avg_cpu_percent,
        stats.min_cpu_percent, stats.max_cpu_percent);
    absl::StrAppendFormat(
        &out, "  %-8s %9.1f%% %9.1f%% %9.1f%%\n", "Memory", stats.avg_memory_percent,
        stats.min_memory_percent, stats.max_memory_percent);

    out += "\nTop Processes (by average memory)\n";
    absl::StrAppendFormat(
        &out, "  %-25s %13s %13s %12s\n", "Process", "Avg Memory", "Max Memory", "Avg Threads");
    for (const ProcessRollup &rollup : stats.top_processes) {
        absl::StrAppendFormat(
            &out, "  %-25s %10.1f MB %10.1f MB %12.0f\n", Detail::truncateName(rollup.name, 25),
            rollup.avg_working_set_mb, rollup.max_working_set_mb, rollup.avg_thread_count);
    }
    return out;
}

absl::Status writeReport(const fs::path &path, const std::string &text) {
    ScopedFile fp(fopen(path.string().c_str(), "w"));
    if (!fp) {
        return absl::UnavailableError(absl::StrFormat(
            "Cannot open report file %s: %s", path.string(), strerror(errno)));
    }

    if (fwrite(text.data(), 1, text.size(), fp.get()) != text.size() || fflush(fp.get()) != 0) {
        return absl::DataLossError(absl::StrFormat(
            "Failed writing report file %s: %s", path.string(), strerror(errno)));
    }
    if (fclose(fp.release()) != 0) {
        return absl::DataLossError(absl::StrFormat(
            "Failed closing report file %s: %s", path.string(), strerror(errno)));
    }

    LOG(INFO) << absl::StrFormat(
        "[ReportFormatter] Report written to %s (%lu bytes)", path.string(), text.size());
    return absl::OkStatus();
}

}  // namespace SysProf
