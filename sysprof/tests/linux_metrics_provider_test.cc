#include <gtest/gtest.h>

#include "include/linux_metrics_provider.hh"
#include "tests/test_helpers.hh"

namespace SysProf {

using Testing::TempDir;
using Testing::writeFile;

class LinuxMetricsProviderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        stat_path = dir.path() / "stat";
        meminfo_path = dir.path() / "meminfo";
    }

    void writeStat(const std::string &cpu_line) {
        writeFile(stat_path, cpu_line + "\ncpu0 1 2 3 4 5 6 7 8 9 10\nintr 12345\nctxt 678\n");
    }

    TempDir dir;
    fs::path stat_path;
    fs::path meminfo_path;
};

TEST_F(LinuxMetricsProviderTest, FirstReadingIsZero) {
    writeStat("cpu  100 0 50 800 50 0 0 0 0 0");
    LinuxMetricsProvider provider(stat_path, meminfo_path);

    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);
}

TEST_F(LinuxMetricsProviderTest, BusyShareOfElapsedJiffies) {
    writeStat("cpu  100 0 50 800 50 0 0 0 0 0");
    LinuxMetricsProvider provider(stat_path, meminfo_path);
    ASSERT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);

    // total 1000 -> 1070, idle + iowait 850 -> 905: (1 - 55 / 70) * 100
    writeStat("cpu  110 0 55 850 55 0 0 0 0 0");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 21.4);

    // each reading is relative to the previous one, not to the first
    writeStat("cpu  170 0 55 860 55 0 0 0 0 0");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 85.7);
}

TEST_F(LinuxMetricsProviderTest, FullyIdleAndFullyBusy) {
    writeStat("cpu  100 0 100 100 0");
    LinuxMetricsProvider provider(stat_path, meminfo_path);
    provider.getCpuPercent();

    writeStat("cpu  100 0 100 200 0");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);

    writeStat("cpu  200 0 100 200 0");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 100.0);
}

TEST_F(LinuxMetricsProviderTest, UnchangedCountersReadZero) {
    writeStat("cpu  100 0 50 800 50");
    LinuxMetricsProvider provider(stat_path, meminfo_path);
    provider.getCpuPercent();

    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);
}

TEST_F(LinuxMetricsProviderTest, CounterResetStartsNewBaseline) {
    writeStat("cpu  1000 0 500 8000 500");
    LinuxMetricsProvider provider(stat_path, meminfo_path);
    provider.getCpuPercent();

    writeStat("cpu  100 0 50 800 50");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);

    writeStat("cpu  110 0 55 850 55");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 21.4);
}

TEST_F(LinuxMetricsProviderTest, KernelsWithoutIowaitAreAccepted) {
    writeStat("cpu  100 0 50 850");
    LinuxMetricsProvider provider(stat_path, meminfo_path);
    provider.getCpuPercent();

    writeStat("cpu  150 0 100 900");
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 66.7);
}

TEST_F(LinuxMetricsProviderTest, UnreadableStatReadsZero) {
    LinuxMetricsProvider provider(dir.path() / "missing", meminfo_path);
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);
    EXPECT_DOUBLE_EQ(provider.getCpuPercent(), 0.0);

    writeFile(stat_path, "garbage\n");
    LinuxMetricsProvider garbled(stat_path, meminfo_path);
    EXPECT_DOUBLE_EQ(garbled.getCpuPercent(), 0.0);
}

TEST_F(LinuxMetricsProviderTest, MemoryFromMemInfo) {
    writeFile(
        meminfo_path,
        "MemTotal:       16384000 kB\n"
        "MemFree:         1024000 kB\n"
        "MemAvailable:    4096000 kB\n"
        "Buffers:          204800 kB\n"
        "Cached:          2048000 kB\n");
    LinuxMetricsProvider provider(stat_path, meminfo_path);

    MemoryInfo info = provider.getMemoryInfo();
    EXPECT_DOUBLE_EQ(info.total_mb, 16000.0);
    EXPECT_DOUBLE_EQ(info.available_mb, 4000.0);
    EXPECT_DOUBLE_EQ(info.used_mb, 12000.0);
    EXPECT_DOUBLE_EQ(info.used_percent, 75.0);
}

TEST_F(LinuxMetricsProviderTest, UsedPercentIsRoundedToOneDecimal) {
    writeFile(meminfo_path, "MemTotal: 3000 kB\nMemAvailable: 1000 kB\n");
    LinuxMetricsProvider provider(stat_path, meminfo_path);

    EXPECT_DOUBLE_EQ(provider.getMemoryInfo().used_percent, 66.7);
}

TEST_F(LinuxMetricsProviderTest, ZeroTotalMemoryHasZeroPercent) {
    writeFile(meminfo_path, "MemTotal: 0 kB\nMemAvailable: 0 kB\n");
    LinuxMetricsProvider provider(stat_path, meminfo_path);

    MemoryInfo info = provider.getMemoryInfo();
    EXPECT_DOUBLE_EQ(info.total_mb, 0.0);
    EXPECT_DOUBLE_EQ(info.used_percent, 0.0);
}

TEST_F(LinuxMetricsProviderTest, AvailableIsCappedAtTotal) {
    writeFile(meminfo_path, "MemTotal: 2048 kB\nMemAvailable: 4096 kB\n");
    LinuxMetricsProvider provider(stat_path, meminfo_path);

    MemoryInfo info = provider.getMemoryInfo();
    EXPECT_DOUBLE_EQ(info.available_mb, 2.0);
    EXPECT_DOUBLE_EQ(info.used_mb, 0.0);
    EXPECT_DOUBLE_EQ(info.used_percent, 0.0);
}

TEST_F(LinuxMetricsProviderTest, MissingMemInfoReadsZero) {
    LinuxMetricsProvider provider(stat_path, dir.path() / "missing");

    MemoryInfo info = provider.getMemoryInfo();
    EXPECT_DOUBLE_EQ(info.total_mb, 0.0);
    EXPECT_DOUBLE_EQ(info.used_mb, 0.0);
    EXPECT_DOUBLE_EQ(info.available_mb, 0.0);
    EXPECT_DOUBLE_EQ(info.used_percent, 0.0);
}

TEST(LinuxMetricsProviderHostTest, LiveReadingsAreInRange) {
    LinuxMetricsProvider provider;
    provider.getCpuPercent();
    double cpu = provider.getCpuPercent();
    EXPECT_GE(cpu, 0.0);
    EXPECT_LE(cpu, 100.0);

    MemoryInfo info = provider.getMemoryInfo();
    EXPECT_GT(info.total_mb, 0.0);
    EXPECT_GE(info.used_percent, 0.0);
    EXPECT_LE(info.used_percent, 100.0);
}

}  // namespace SysProf
