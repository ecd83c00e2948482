#pragma once

#include <atomic>
#include <thread>

#ifndef _WIN32
#include <signal.h>
#endif

#include "include/sampler.hh"

namespace SysProf {

/**
 * Turns SIGINT and SIGTERM (Ctrl+C and Ctrl+Break on Windows) into a stop request for the sampler
 * while in scope.
 *
 * On POSIX the signals are blocked in the constructing thread and picked up synchronously by a
 * dedicated thread with sigwait(), so the stop request never runs in signal handler context. The
 * previous signal mask is restored on destruction, after which the signals take their default
 * action again. Construct it before starting any other thread so they inherit the mask.
 */
class StopSignalWatcher {
  public:
    explicit StopSignalWatcher(Sampler &sampler);
    ~StopSignalWatcher();

    StopSignalWatcher(const StopSignalWatcher &) = delete;
    StopSignalWatcher &operator=(const StopSignalWatcher &) = delete;

#ifndef _WIN32
    /** signals consumed by the watcher thread so far */
    int getSignalCount() const { return signal_count.load(); }

  private:
    void watch(Sampler &sampler);

    sigset_t signals;
    sigset_t old_mask;
    std::atomic<bool> finished{false};
    std::atomic<int> signal_count{0};
    std::thread watcher;
#endif
};

}  // namespace SysProf
