#include <gtest/gtest.h>

#include <thread>

#include "include/report_formatter.hh"
#include "include/sampler.hh"
#include "tests/test_helpers.hh"

namespace SysProf {

using Testing::FakeProcessSnapshotter;
using Testing::FakeProviderState;
using Testing::fakeProviderFactory;
using Testing::makeProcess;

namespace {

SamplerOptions quickOptions(int duration_ms, int interval_ms) {
    SamplerOptions options;
    options.duration = cr::milliseconds(duration_ms);
    options.interval = cr::milliseconds(interval_ms);
    options.settle_period = cr::milliseconds(0);
    return options;
}

}  // namespace

TEST(SamplerTest, FullRunProducesCeilDurationOverIntervalTicks) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(250, 100)).ok());

    const SampleTimeSeries &samples = sampler.getSamples();
    ASSERT_EQ(samples.samples_size(), 3);
    for (int i = 0; i < samples.samples_size(); i++) {
        EXPECT_EQ(samples.samples(i).sequence(), i + 1);
    }
    EXPECT_EQ(sampler.getState(), SamplerState::Completed);
    EXPECT_FALSE(sampler.wasStopped());
}

TEST(SamplerTest, WarmUpReadHappensBeforeFirstTick) {
    auto state = std::make_shared<FakeProviderState>();
    state->cpu_readings = {99.0, 12.5};
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());

    ASSERT_EQ(sampler.getSamples().samples_size(), 1);
    EXPECT_EQ(state->cpu_reads.load(), 2);
    // the warm-up reading is discarded
    EXPECT_DOUBLE_EQ(sampler.getSamples().samples(0).cpu_percent(), 12.5);
}

TEST(SamplerTest, CollectionTimeDoesNotDelayLaterTicks) {
    auto state = std::make_shared<FakeProviderState>();
    state->read_delay = cr::milliseconds(30);
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    // ticks at 0, 100, 200, 300 and 400 ms; chaining 100 ms sleeps after each 30 ms read would
    // only fit four
    ASSERT_TRUE(sampler.run(quickOptions(450, 100)).ok());
    EXPECT_EQ(sampler.getSamples().samples_size(), 5);
}

TEST(SamplerTest, PercentagesAreClamped) {
    auto state = std::make_shared<FakeProviderState>();
    state->cpu_readings = {150.0};
    state->memory = MemoryInfo{16000, 16000, 0, -5.0};
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());

    ASSERT_EQ(sampler.getSamples().samples_size(), 1);
    const Sample &sample = sampler.getSamples().samples(0);
    EXPECT_DOUBLE_EQ(sample.cpu_percent(), 100.0);
    EXPECT_DOUBLE_EQ(sample.memory_percent(), 0.0);
    EXPECT_DOUBLE_EQ(sample.total_memory_mb(), 16000);
    EXPECT_DOUBLE_EQ(sample.used_memory_mb(), 16000);
}

TEST(SamplerTest, SampleProcessesAreSortedByWorkingSet) {
    auto state = std::make_shared<FakeProviderState>();
    auto snapshotter = std::make_unique<FakeProcessSnapshotter>(std::vector<ProcessMetric>{
        makeProcess(1, "init", 10, 1), makeProcess(2, "db", 300, 40),
        makeProcess(3, "cache", 300, 8), makeProcess(4, "shell", 50, 1)});
    Sampler sampler(std::move(snapshotter), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());

    const Sample &sample = sampler.getSamples().samples(0);
    ASSERT_EQ(sample.processes_size(), 4);
    EXPECT_EQ(sample.processes(0).name(), "db");
    EXPECT_EQ(sample.processes(1).name(), "cache");
    EXPECT_EQ(sample.processes(2).name(), "shell");
    EXPECT_EQ(sample.processes(3).name(), "init");
}

TEST(SamplerTest, TimestampsAreNonDecreasing) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(120, 20)).ok());

    const SampleTimeSeries &samples = sampler.getSamples();
    ASSERT_GT(samples.samples_size(), 1);
    for (int i = 1; i < samples.samples_size(); i++) {
        EXPECT_LE(samples.samples(i - 1).timestamp_ns(), samples.samples(i).timestamp_ns());
    }
}

TEST(SamplerTest, CallbackSeesEverySampleWithProgress) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    std::vector<int32_t> sequences;
    std::vector<double> progress_values;
    ASSERT_TRUE(sampler
                    .run(quickOptions(250, 100),
                         [&](const Sample &sample, double progress) {
                             sequences.push_back(sample.sequence());
                             progress_values.push_back(progress);
                         })
                    .ok());

    EXPECT_EQ(sequences, (std::vector<int32_t>{1, 2, 3}));
    for (size_t i = 0; i < progress_values.size(); i++) {
        EXPECT_GE(progress_values[i], 0.0);
        EXPECT_LE(progress_values[i], 1.0);
        if (i > 0) EXPECT_GE(progress_values[i], progress_values[i - 1]);
    }
}

TEST(SamplerTest, FinalProgressRedeliversLastSample) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    SamplerOptions options = quickOptions(150, 100);
    options.emit_final_progress = true;

    std::vector<std::pair<int32_t, double>> calls;
    ASSERT_TRUE(sampler
                    .run(options,
                         [&](const Sample &sample, double progress) {
                             calls.emplace_back(sample.sequence(), progress);
                         })
                    .ok());

    ASSERT_EQ(sampler.getSamples().samples_size(), 2);
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].first, 2);
    EXPECT_DOUBLE_EQ(calls[2].second, 1.0);
}

TEST(SamplerTest, StopFromCallbackEndsRunWithPartialSamples) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    SamplerOptions options = quickOptions(10000, 1000);
    options.emit_final_progress = true;

    int callbacks = 0;
    cr::steady_clock::time_point start = cr::steady_clock::now();
    absl::Status status = sampler.run(options, [&](const Sample &sample, double progress) {
        callbacks++;
        if (sample.sequence() == 2) sampler.requestStop();
    });
    cr::steady_clock::duration elapsed = cr::steady_clock::now() - start;

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(sampler.getSamples().samples_size(), 2);
    EXPECT_TRUE(sampler.wasStopped());
    EXPECT_EQ(sampler.getState(), SamplerState::Completed);
    // a stopped run does not re-deliver the last sample
    EXPECT_EQ(callbacks, 2);
    // the second wait is cut short rather than slept through
    EXPECT_LT(elapsed, cr::milliseconds(2500));
}

TEST(SamplerTest, StoppedRunStillReportsSummary) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(
        std::make_unique<FakeProcessSnapshotter>(std::vector<ProcessMetric>{
            makeProcess(10, "postgres", 512, 12), makeProcess(11, "nginx", 64, 4)}),
        fakeProviderFactory(state));

    absl::Status status = sampler.run(quickOptions(10000, 100), [&](const Sample &sample, double) {
        if (sample.sequence() == 2) sampler.requestStop();
    });

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(sampler.getState(), SamplerState::Completed);
    EXPECT_TRUE(sampler.wasStopped());
    // a full run would take 100 ticks
    EXPECT_EQ(sampler.getSamples().samples_size(), 2);

    RunMetadata metadata;
    metadata.generated_at = cr::system_clock::now();
    metadata.platform = "test";
    metadata.processor_count = 4;
    metadata.zone = date::locate_zone("UTC");
    std::string report = formatReport(sampler.getSamples(), metadata);

    EXPECT_NE(report.find("Total Samples: 2\n"), std::string::npos);
    EXPECT_NE(report.find("SUMMARY\n"), std::string::npos);
    EXPECT_NE(report.find("--- Sample 2 at"), std::string::npos);
    EXPECT_EQ(report.find("--- Sample 3 at"), std::string::npos);
    EXPECT_NE(report.find("postgres"), std::string::npos);
    EXPECT_EQ(report.find("No samples collected."), std::string::npos);
}

TEST(SamplerTest, StopDuringSettleProducesNoSamples) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    SamplerOptions options = quickOptions(1000, 100);
    options.settle_period = cr::milliseconds(10000);

    std::thread stopper([&sampler]() {
        std::this_thread::sleep_for(cr::milliseconds(50));
        sampler.requestStop();
    });
    cr::steady_clock::time_point start = cr::steady_clock::now();
    absl::Status status = sampler.run(options);
    cr::steady_clock::duration elapsed = cr::steady_clock::now() - start;
    stopper.join();

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(sampler.getSamples().samples_size(), 0);
    EXPECT_TRUE(sampler.wasStopped());
    EXPECT_LT(elapsed, cr::milliseconds(5000));
}

TEST(SamplerTest, StopBeforeRunAndRepeatedStopsAreHarmless) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    sampler.requestStop();
    sampler.requestStop();
    ASSERT_TRUE(sampler.run(quickOptions(1000, 100)).ok());

    EXPECT_EQ(sampler.getSamples().samples_size(), 0);
    EXPECT_TRUE(sampler.wasStopped());
    sampler.requestStop();
}

TEST(SamplerTest, InvalidOptionsLeaveSamplerIdle) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    EXPECT_EQ(sampler.run(quickOptions(0, 100)).code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(sampler.run(quickOptions(1000, 0)).code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(sampler.run(quickOptions(-5, 100)).code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(sampler.getState(), SamplerState::Idle);
    EXPECT_EQ(state->cpu_reads.load(), 0);

    // still usable after rejected options
    EXPECT_TRUE(sampler.run(quickOptions(50, 100)).ok());
}

TEST(SamplerTest, SecondRunIsRejected) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());
    EXPECT_EQ(sampler.run(quickOptions(50, 100)).code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(sampler.getSamples().samples_size(), 1);
}

TEST(SamplerTest, ProviderIsReleasedWhenRunEnds) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());
    EXPECT_TRUE(state->destroyed.load());
}

TEST(SamplerTest, EstimatedProviderIsReported) {
    auto state = std::make_shared<FakeProviderState>();
    state->estimate = true;
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    ASSERT_TRUE(sampler.run(quickOptions(50, 100)).ok());
    EXPECT_TRUE(sampler.isCpuEstimated());
}

TEST(SamplerTest, ExceptionInLoopAbortsWithInternalError) {
    auto state = std::make_shared<FakeProviderState>();
    auto snapshotter = std::make_unique<FakeProcessSnapshotter>();
    snapshotter->throw_on_call = 2;
    Sampler sampler(std::move(snapshotter), fakeProviderFactory(state));

    absl::Status status = sampler.run(quickOptions(1000, 20));

    EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
    EXPECT_EQ(sampler.getState(), SamplerState::Completed);
    EXPECT_EQ(sampler.getSamples().samples_size(), 1);
    EXPECT_TRUE(state->destroyed.load());
}

TEST(SamplerTest, NullProviderIsAnInternalError) {
    Sampler sampler(
        std::make_unique<FakeProcessSnapshotter>(),
        [](const ProcessSnapshotter &) -> std::unique_ptr<MetricsProvider> { return nullptr; });

    EXPECT_EQ(sampler.run(quickOptions(50, 100)).code(), absl::StatusCode::kInternal);
    EXPECT_EQ(sampler.getState(), SamplerState::Completed);
}

}  // namespace SysProf
