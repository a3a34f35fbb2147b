#ifndef CONTOUR_CONFIG_SETTINGS_H
#define CONTOUR_CONFIG_SETTINGS_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace contour {

// Process-wide tunables. Filled once at startup and read-only afterwards.
struct Settings {
    std::size_t cpuWorkers{1};
    std::size_t acceleratorWorkers{1};
    double ramCacheFraction{0.85};
    std::size_t ramCacheMinMb{512};
    std::string cacheDir{".cache/parsed"};
    double chordTolerance{0.8};
    bool acceleratorEnabled{true};
    bool poolsEnabled{true};
    std::uint64_t totalRamBytes{0};

    // Byte budget of the memory tier: max(minMb MiB, totalRam * fraction).
    std::size_t memoryBudgetBytes() const;

    static Settings defaults();
    static Settings fromEnvironment();

    // Same as fromEnvironment with a custom variable source (for tests).
    using Lookup = std::function<std::optional<std::string>(const char*)>;
    static Settings fromLookup(const Lookup& lookup);
};

// Physical memory from sysconf, or 8 GiB when the OS will not say.
std::uint64_t detectTotalRamBytes();

// std::thread::hardware_concurrency, at least 1.
std::size_t hardwareThreads();

constexpr std::size_t kWorkersPerCore = 4;

// Upper bound for DXF_CPU_WORKERS and DXF_ACCEL_WORKERS.
std::size_t maxWorkers();

} // namespace contour

#endif // CONTOUR_CONFIG_SETTINGS_H
