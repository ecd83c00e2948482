#include <gtest/gtest.h>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <thread>

#include "include/stop_signal_watcher.hh"
#include "tests/test_helpers.hh"

namespace SysProf {

using Testing::FakeProcessSnapshotter;
using Testing::FakeProviderState;
using Testing::fakeProviderFactory;

namespace {

bool isBlocked(int signum) {
    sigset_t current;
    pthread_sigmask(SIG_BLOCK, nullptr, &current);
    return sigismember(&current, signum) == 1;
}

SamplerOptions longSettleOptions() {
    SamplerOptions options;
    options.duration = cr::milliseconds(1000);
    options.interval = cr::milliseconds(100);
    options.settle_period = cr::milliseconds(10000);
    return options;
}

}  // namespace

TEST(StopSignalWatcherTest, SignalMaskIsRestoredOnDestruction) {
    ASSERT_FALSE(isBlocked(SIGINT));
    ASSERT_FALSE(isBlocked(SIGTERM));

    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));
    {
        StopSignalWatcher watcher(sampler);
        EXPECT_TRUE(isBlocked(SIGINT));
        EXPECT_TRUE(isBlocked(SIGTERM));
    }

    EXPECT_FALSE(isBlocked(SIGINT));
    EXPECT_FALSE(isBlocked(SIGTERM));
    // the wake-up sent by the destructor is not mistaken for a stop
    EXPECT_FALSE(sampler.wasStopped());
}

TEST(StopSignalWatcherTest, InterruptStopsTheRun) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    absl::Status status;
    cr::steady_clock::time_point start = cr::steady_clock::now();
    {
        StopSignalWatcher watcher(sampler);
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
        status = sampler.run(longSettleOptions());
    }
    cr::steady_clock::duration elapsed = cr::steady_clock::now() - start;

    ASSERT_TRUE(status.ok());
    EXPECT_TRUE(sampler.wasStopped());
    EXPECT_EQ(sampler.getSamples().samples_size(), 0);
    EXPECT_LT(elapsed, cr::milliseconds(5000));
}

TEST(StopSignalWatcherTest, RepeatedSignalsAreAllConsumed) {
    auto state = std::make_shared<FakeProviderState>();
    Sampler sampler(std::make_unique<FakeProcessSnapshotter>(), fakeProviderFactory(state));

    StopSignalWatcher watcher(sampler);
    ASSERT_EQ(kill(getpid(), SIGINT), 0);
    // a pending signal of the same kind would merge, wait for the first one to be consumed
    for (int i = 0; i < 500 && watcher.getSignalCount() < 1; i++) {
        std::this_thread::sleep_for(cr::milliseconds(10));
    }
    ASSERT_EQ(watcher.getSignalCount(), 1);

    ASSERT_EQ(kill(getpid(), SIGTERM), 0);
    for (int i = 0; i < 500 && watcher.getSignalCount() < 2; i++) {
        std::this_thread::sleep_for(cr::milliseconds(10));
    }
    EXPECT_EQ(watcher.getSignalCount(), 2);
}

}  // namespace SysProf
