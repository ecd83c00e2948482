#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <absl/synchronization/notification.h>

#include "include/metrics_provider.hh"
#include "include/process_snapshotter.hh"
#include "include/utils.hh"

#include "generated/proto/sample_metrics.pb.h"

namespace SysProf {

constexpr cr::milliseconds default_settle_period{500};

struct SamplerOptions {
    /** Total sampling window, measured from the first tick */
    cr::milliseconds duration{0};
    /** Time between tick starts */
    cr::milliseconds interval{0};
    /** Wait between the warm-up read and the first tick */
    cr::milliseconds settle_period = default_settle_period;
    /** Re-deliver the last sample with progress 1.0 when a run completes without being stopped */
    bool emit_final_progress = false;
};

enum class SamplerState { Idle, Running, Completed };

/**
 * Called once per tick on the sampling thread.
 *
 * @param sample the sample just appended to the run buffer
 * @param progress elapsed fraction of the sampling window, in [0, 1]
 */
using SampleCallback = std::function<void(const Sample &sample, double progress)>;

/**
 * Drives one sampling run on the calling thread: Idle -> Running -> Completed.
 *
 * Tick n is scheduled at n * interval after the first tick rather than interval after the
 * previous one, so time spent collecting a sample does not push later ticks back. Waits are
 * interrupted as soon as requestStop() is called; a stopped run keeps what it collected.
 */
class Sampler final {
  public:
    /**
     * @param snapshotter process source, also handed to the provider factory
     * @param provider_factory builds the metrics provider when the run starts
     */
    explicit Sampler(
        std::unique_ptr<ProcessSnapshotter> snapshotter,
        MetricsProviderFactory provider_factory = createMetricsProvider);

    Sampler(const Sampler &) = delete;
    Sampler &operator=(const Sampler &) = delete;

    ~Sampler();

    /**
     * Check options without running.
     *
     * @return InvalidArgument if duration or interval is not positive
     */
    static absl::Status validateOptions(const SamplerOptions &options);

    /**
     * Run the sampling loop until the window elapses or a stop is requested. Blocks the caller.
     *
     * @return OK for a full or stopped run; InvalidArgument for bad options (state stays Idle);
     *         FailedPrecondition if this sampler already ran; Internal if the loop aborted, in
     *         which case the samples collected so far are kept but may not be worth reporting
     */
    absl::Status run(const SamplerOptions &options, const SampleCallback &callback = nullptr);

    /**
     * Ask a running (or not yet started) run to stop. Safe to call from any thread, any number
     * of times.
     */
    void requestStop() noexcept;

    SamplerState getState() const;
    bool wasStopped() const;

    /**
     * @return true if the CPU figures of this run came from a heuristic estimate
     */
    bool isCpuEstimated() const;

    /**
     * Samples collected by the run, in sequence order.
     *
     * @note Only stable once run() has returned.
     */
    const SampleTimeSeries &getSamples() const;

  private:
    absl::Status runLoop(const SamplerOptions &options, const SampleCallback &callback);
    Sample collectSample(int32_t sequence, MetricsProvider &provider) const;

    /**
     * @return true if a stop was requested before the timeout expired
     */
    bool waitForStop(cr::nanoseconds timeout);

    const std::unique_ptr<ProcessSnapshotter> snapshotter;
    const MetricsProviderFactory provider_factory;

    std::atomic<SamplerState> state{SamplerState::Idle};
    std::atomic<bool> stop_requested{false};
    absl::Notification stop_signal;
    bool stopped = false;
    bool cpu_estimated = false;

    SampleTimeSeries samples;
};

}  // namespace SysProf
