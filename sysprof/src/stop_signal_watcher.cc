#include <cstring>

#ifdef _WIN32
#include <windows.h>
#else
#include <pthread.h>
#endif

#include "include/stop_signal_watcher.hh"

namespace SysProf {

#ifdef _WIN32

namespace Detail {

static std::atomic<Sampler *> active_sampler{nullptr};

static BOOL WINAPI consoleCtrlHandler(DWORD ctrl_type) {
    if (ctrl_type != CTRL_C_EVENT && ctrl_type != CTRL_BREAK_EVENT) return FALSE;
    Sampler *sampler = active_sampler.load();
    if (!sampler) return FALSE;
    LOG(WARNING) << "[SigHandler] Console interrupt received, stopping sampling";
    sampler->requestStop();
    return TRUE;
}

}  // namespace Detail

StopSignalWatcher::StopSignalWatcher(Sampler &sampler) {
    Detail::active_sampler.store(&sampler);
    if (!SetConsoleCtrlHandler(Detail::consoleCtrlHandler, TRUE)) {
        LOG(WARNING) << absl::StrFormat(
            "[SigHandler] Cannot install console handler (error %lu), Ctrl+C will not stop "
            "sampling gracefully",
            GetLastError());
    }
}

StopSignalWatcher::~StopSignalWatcher() {
    SetConsoleCtrlHandler(Detail::consoleCtrlHandler, FALSE);
    Detail::active_sampler.store(nullptr);
}

#else

StopSignalWatcher::StopSignalWatcher(Sampler &sampler) {
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, &old_mask);

    watcher = std::thread([this, &sampler]() { watch(sampler); });
}

StopSignalWatcher::~StopSignalWatcher() {
    finished.store(true);
    // thread-directed, so it can only be consumed by the watcher
    pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();
    pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
}

void StopSignalWatcher::watch(Sampler &sampler) {
    while (true) {
        int signum = 0;
        if (sigwait(&signals, &signum) != 0) return;
        if (finished.load()) return;

        const char *signal_name = strsignal(signum);
        if (signal_count.fetch_add(1) == 0) {
            LOG(WARNING) << absl::StrFormat(
                "[SigHandler] Caught signal: %s (signum %d), stopping sampling",
                signal_name ? signal_name : "<CANNOT_RESOLVE>", signum);
            sampler.requestStop();
        } else {
            LOG(WARNING) << absl::StrFormat(
                "[SigHandler] Caught signal: %s (signum %d), already stopping",
                signal_name ? signal_name : "<CANNOT_RESOLVE>", signum);
        }
    }
}

#endif

}  // namespace SysProf
