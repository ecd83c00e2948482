#include <fstream>
#include <mutex>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/log_sink_registry.h>

#include "include/logger.hh"

namespace SysProf {

namespace Detail {

constexpr cr::seconds flush_interval = cr::seconds(10);

class FileLogSink : public absl::LogSink {
  public:
    explicit FileLogSink(const fs::path &filename) : filename(filename) {
        last_flush_time = cr::steady_clock::now();
    }

    ~FileLogSink() override {
        if (log_file_.is_open()) {
            log_file_.flush();
            log_file_.close();
            fprintf(
                stderr, "[FileLogSink] Log file saved to %s (at %s)\n", filename.string().c_str(),
                formatTime(date::floor<cr::seconds>(cr::system_clock::now()), "%Y-%m-%d %H:%M:%S %z")
                    .c_str());
        }
    }

    void Send(const absl::LogEntry &entry) override {
        std::lock_guard<std::mutex> lock(mu_);
        // lazy file allocation
        if (!log_file_.is_open()) {
            log_file_.open(filename, std::ios::out | std::ios::app);
            if (!log_file_.is_open()) return;
        }
        log_file_ << entry.text_message_with_prefix_and_newline();

        cr::steady_clock::time_point current_time = cr::steady_clock::now();
        if (entry.log_severity() >= absl::LogSeverity::kWarning ||
            current_time - last_flush_time >= flush_interval) {
            log_file_.flush();
            last_flush_time = current_time;
        }
    }

    void Flush() override {
        std::lock_guard<std::mutex> lock(mu_);
        if (log_file_.is_open()) log_file_.flush();
    }

  private:
    const fs::path filename;
    std::ofstream log_file_;
    std::mutex mu_;

    cr::steady_clock::time_point last_flush_time;
};

class Logger {
  public:
    static constexpr std::string_view log_filename = "sysprof.log";

    /**
     * Assumes the input log path is a valid directory.
     *
     * @param log_dir directory to store logs, empty for stderr only
     */
    explicit Logger(const fs::path &log_dir)
        : log_dir(log_dir), log_file_path(log_dir.empty() ? fs::path() : log_dir / log_filename) {
        if (log_dir.empty()) {
            absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
            LOG(INFO) << "[Logger] Initialized with no log directory, logging to stderr.";
        } else {
            file_sink = std::make_unique<FileLogSink>(log_file_path);
            absl::AddLogSink(file_sink.get());
            absl::SetStderrThreshold(absl::LogSeverityAtLeast::kError);
            LOG(INFO) << absl::StrFormat("[Logger] Logging to %s", log_file_path.string());
        }
    }

    ~Logger() {
        if (!file_sink) return;
        absl::RemoveLogSink(file_sink.get());
        file_sink.reset();
    }

    const fs::path &getLoggerFolder() const { return log_dir; }

    const fs::path &getLoggerFile() const { return log_file_path; }

  private:
    const fs::path log_dir;
    const fs::path log_file_path;
    std::unique_ptr<FileLogSink> file_sink;
};

static std::unique_ptr<Logger> logger;
static bool absl_log_initialized = false;

}  // namespace Detail

// this is not thread safe
bool loggerInitialize(const std::string &log_dir) {
    if (Detail::logger) return false;

    if (!Detail::absl_log_initialized) {
        absl::InitializeLog();
        Detail::absl_log_initialized = true;
    }

    if (log_dir.empty()) {
        Detail::logger = std::make_unique<Detail::Logger>(fs::path());
        return true;
    }

    fs::path p = validateDir(log_dir);
    if (p.empty()) {
        LOG(ERROR) << absl::StrFormat("[Logger] Invalid log dir %s", log_dir);
        return false;
    }
    if (!isWritableDir(p)) {
        LOG(ERROR) << absl::StrFormat("[Logger] Cannot write to log dir %s", p.string());
        return false;
    }

    Detail::logger = std::make_unique<Detail::Logger>(p);
    return true;
}

const fs::path &getLoggerFolder() {
    static const fs::path empty;
    return Detail::logger ? Detail::logger->getLoggerFolder() : empty;
}

const fs::path &getLoggerFile() {
    static const fs::path empty;
    return Detail::logger ? Detail::logger->getLoggerFile() : empty;
}

void loggerDeinitialize() { Detail::logger.reset(); }

}  // namespace SysProf
