#include <algorithm>
#include <exception>

#include <absl/time/time.h>

#include "include/sampler.hh"

namespace SysProf {

Sampler::Sampler(
    std::unique_ptr<ProcessSnapshotter> snapshotter, MetricsProviderFactory provider_factory)
    : snapshotter(std::move(snapshotter)), provider_factory(std::move(provider_factory)) {
    CHECK(this->snapshotter) << "[Sampler] A process snapshotter is required";
    CHECK(this->provider_factory) << "[Sampler] A metrics provider factory is required";
}

Sampler::~Sampler() = default;

absl::Status Sampler::validateOptions(const SamplerOptions &options) {
    if (options.duration <= cr::milliseconds::zero()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Sampling duration must be positive, got %d ms", options.duration.count()));
    }
    if (options.interval <= cr::milliseconds::zero()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Sampling interval must be positive, got %d ms", options.interval.count()));
    }
    if (options.settle_period < cr::milliseconds::zero()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Settle period must not be negative, got %d ms", options.settle_period.count()));
    }
    return absl::OkStatus();
}

absl::Status Sampler::run(const SamplerOptions &options, const SampleCallback &callback) {
    absl::Status status = validateOptions(options);
    if (!status.ok()) return status;

    SamplerState expected = SamplerState::Idle;
    if (!state.compare_exchange_strong(expected, SamplerState::Running)) {
        return absl::FailedPreconditionError("[Sampler] A sampler can only run once");
    }

    LOG(INFO) << absl::StrFormat(
        "[Sampler] Run started: duration %d ms, interval %d ms, settle %d ms",
        options.duration.count(), options.interval.count(), options.settle_period.count());

    try {
        status = runLoop(options, callback);
    } catch (const std::exception &e) {
        status = absl::InternalError(absl::StrFormat(
            "Sampling aborted after %d samples: %s", samples.samples_size(), e.what()));
    }

    state.store(SamplerState::Completed);
    if (!status.ok()) {
        LOG(ERROR) << absl::StrFormat("[Sampler] %s", status.ToString());
        return status;
    }

    LOG(INFO) << absl::StrFormat(
        "[Sampler] Run completed with %d samples%s", samples.samples_size(),
        stopped ? " (stopped early)" : "");
    return status;
}

absl::Status Sampler::runLoop(const SamplerOptions &options, const SampleCallback &callback) {
    // The provider lives exactly as long as the run, and with it any delta baseline.
    std::unique_ptr<MetricsProvider> provider = provider_factory(*snapshotter);
    if (!provider) return absl::InternalError("Metrics provider factory returned null");
    cpu_estimated = provider->isEstimate();

    // Delta based CPU readings need a baseline before the first tick
    (void)provider->getCpuPercent();
    if (waitForStop(options.settle_period)) {
        stopped = true;
        return absl::OkStatus();
    }

    const cr::steady_clock::time_point loop_start = cr::steady_clock::now();
    int32_t sequence = 0;
    while (true) {
        if (stop_signal.HasBeenNotified()) {
            stopped = true;
            break;
        }
        if (cr::steady_clock::now() - loop_start >= options.duration) break;

        sequence++;
        Sample sample = collectSample(sequence, *provider);
        *samples.add_samples() = std::move(sample);

        cr::steady_clock::duration elapsed = cr::steady_clock::now() - loop_start;
        if (callback) {
            double progress = std::min(
                1.0, cr::duration<double>(elapsed) / cr::duration<double>(options.duration));
            callback(samples.samples(samples.samples_size() - 1), progress);
        }

        // Next tick on the sequence * interval grid, never interval after this one
        elapsed = cr::steady_clock::now() - loop_start;
        cr::steady_clock::duration residual = options.interval * sequence - elapsed;
        if (residual <= cr::steady_clock::duration::zero()) {
            LOG_FIRST_N(WARNING, 1) << absl::StrFormat(
                "[Sampler] Tick %d overran its %d ms slot, consider a longer interval", sequence,
                options.interval.count());
            continue;
        }
        if (elapsed < options.duration) waitForStop(residual);
    }

    if (!stopped && options.emit_final_progress && callback && samples.samples_size() > 0) {
        callback(samples.samples(samples.samples_size() - 1), 1.0);
    }
    return absl::OkStatus();
}

Sample Sampler::collectSample(int32_t sequence, MetricsProvider &provider) const {
    Sample sample;
    sample.set_sequence(sequence);
    sample.set_timestamp_ns(
        cr::duration_cast<cr::nanoseconds>(cr::system_clock::now().time_since_epoch()).count());

    std::vector<ProcessMetric> processes = snapshotter->snapshot();

    sample.set_cpu_percent(clampPercent(provider.getCpuPercent()));

    MemoryInfo memory = provider.getMemoryInfo();
    sample.set_total_memory_mb(memory.total_mb);
    sample.set_used_memory_mb(memory.used_mb);
    sample.set_available_memory_mb(memory.available_mb);
    sample.set_memory_percent(clampPercent(memory.used_percent));

    sample.mutable_processes()->Reserve(static_cast<int>(processes.size()));
    for (ProcessMetric &process : processes) {
        *sample.add_processes() = std::move(process);
    }
    return sample;
}

bool Sampler::waitForStop(cr::nanoseconds timeout) {
    if (timeout <= cr::nanoseconds::zero()) return stop_signal.HasBeenNotified();
    return stop_signal.WaitForNotificationWithTimeout(absl::FromChrono(timeout));
}

void Sampler::requestStop() noexcept {
    // Notification::Notify() must only be called once
    if (stop_requested.exchange(true)) return;
    stop_signal.Notify();
}

SamplerState Sampler::getState() const { return state.load(); }

bool Sampler::wasStopped() const { return stopped; }

bool Sampler::isCpuEstimated() const { return cpu_estimated; }

const SampleTimeSeries &Sampler::getSamples() const { return samples; }

}  // namespace SysProf
