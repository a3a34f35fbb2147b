#include <gtest/gtest.h>

#include "contour/config/settings.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

using namespace contour;

namespace {

Settings::Lookup envOf(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        const auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(SettingsTest, DefaultsWithoutVariables) {
    const Settings s = Settings::fromLookup(envOf({}));
    EXPECT_EQ(s.cpuWorkers, hardwareThreads());
    EXPECT_EQ(s.acceleratorWorkers, hardwareThreads());
    EXPECT_DOUBLE_EQ(s.ramCacheFraction, 0.85);
    EXPECT_EQ(s.ramCacheMinMb, 512u);
    EXPECT_EQ(s.cacheDir, ".cache/parsed");
    EXPECT_DOUBLE_EQ(s.chordTolerance, 0.8);
    EXPECT_TRUE(s.acceleratorEnabled);
    EXPECT_TRUE(s.poolsEnabled);
    EXPECT_GT(s.totalRamBytes, 0u);
}

TEST(SettingsTest, ReadsVariables) {
    const Settings s = Settings::fromLookup(envOf({
        {"DXF_CPU_WORKERS", " 3 "},
        {"DXF_ACCEL_WORKERS", "2"},
        {"DXF_CACHE_RAM_FRACTION", "0.5"},
        {"DXF_CACHE_RAM_MIN_MB", "128"},
        {"DXF_CACHE_DIR", "/tmp/contours"},
        {"DXF_CHORD_TOLERANCE", "0.25"},
        {"DXF_ACCELERATOR", "OFF"},
        {"DXF_WORKER_POOLS", "no"},
    }));
    EXPECT_EQ(s.cpuWorkers, std::min<std::size_t>(3, maxWorkers()));
    EXPECT_EQ(s.acceleratorWorkers, std::min<std::size_t>(2, maxWorkers()));
    EXPECT_DOUBLE_EQ(s.ramCacheFraction, 0.5);
    EXPECT_EQ(s.ramCacheMinMb, 128u);
    EXPECT_EQ(s.cacheDir, "/tmp/contours");
    EXPECT_DOUBLE_EQ(s.chordTolerance, 0.25);
    EXPECT_FALSE(s.acceleratorEnabled);
    EXPECT_FALSE(s.poolsEnabled);
}

TEST(SettingsTest, ClampsOutOfRangeValues) {
    const Settings s = Settings::fromLookup(envOf({
        {"DXF_CPU_WORKERS", "0"},
        {"DXF_ACCEL_WORKERS", "-4"},
        {"DXF_CACHE_RAM_FRACTION", "2.0"},
        {"DXF_CACHE_RAM_MIN_MB", "1"},
        {"DXF_CHORD_TOLERANCE", "0"},
    }));
    EXPECT_EQ(s.cpuWorkers, 1u);
    EXPECT_EQ(s.acceleratorWorkers, 1u);
    EXPECT_DOUBLE_EQ(s.ramCacheFraction, 0.95);
    EXPECT_EQ(s.ramCacheMinMb, 64u);
    EXPECT_DOUBLE_EQ(s.chordTolerance, 0.05);

    const Settings low = Settings::fromLookup(envOf({{"DXF_CACHE_RAM_FRACTION", "0.001"}}));
    EXPECT_DOUBLE_EQ(low.ramCacheFraction, 0.05);
}

TEST(SettingsTest, WorkerCountsAreCappedPerCore) {
    EXPECT_EQ(maxWorkers(), kWorkersPerCore * hardwareThreads());

    const Settings s = Settings::fromLookup(envOf({
        {"DXF_CPU_WORKERS", "9223372036854775807"},
        {"DXF_ACCEL_WORKERS", "99999999999999999999999"},
        {"DXF_CACHE_RAM_MIN_MB", "18446744073709551615"},
    }));
    EXPECT_EQ(s.cpuWorkers, maxWorkers());
    EXPECT_EQ(s.acceleratorWorkers, maxWorkers());
    EXPECT_EQ(s.ramCacheMinMb, 1u << 20);
}

TEST(SettingsTest, IgnoresMalformedValues) {
    const Settings s = Settings::fromLookup(envOf({
        {"DXF_CPU_WORKERS", "many"},
        {"DXF_CACHE_RAM_FRACTION", "half"},
        {"DXF_CHORD_TOLERANCE", "nan"},
        {"DXF_ACCELERATOR", "maybe"},
        {"DXF_CACHE_DIR", "   "},
    }));
    EXPECT_EQ(s.cpuWorkers, hardwareThreads());
    EXPECT_DOUBLE_EQ(s.ramCacheFraction, 0.85);
    EXPECT_DOUBLE_EQ(s.chordTolerance, 0.8);
    EXPECT_TRUE(s.acceleratorEnabled);
    EXPECT_EQ(s.cacheDir, ".cache/parsed");
}

TEST(SettingsTest, LegacyAcceleratorWorkerName) {
    const Settings legacy = Settings::fromLookup(envOf({{"DXF_CUDA_WORKERS", "5"}}));
    EXPECT_EQ(legacy.acceleratorWorkers, std::min<std::size_t>(5, maxWorkers()));

    const Settings both = Settings::fromLookup(envOf({{"DXF_CUDA_WORKERS", "5"}, {"DXF_ACCEL_WORKERS", "6"}}));
    EXPECT_EQ(both.acceleratorWorkers, std::min<std::size_t>(6, maxWorkers()));
}

TEST(SettingsTest, MemoryBudgetTakesTheLargerShare) {
    constexpr std::size_t kMiB = 1024 * 1024;
    Settings s;
    s.ramCacheMinMb = 512;
    s.ramCacheFraction = 0.5;

    s.totalRamBytes = 256 * kMiB;
    EXPECT_EQ(s.memoryBudgetBytes(), 512 * kMiB);

    s.totalRamBytes = 4096 * kMiB;
    EXPECT_EQ(s.memoryBudgetBytes(), 2048 * kMiB);
}
