#include "contour/config/settings.h"

#include "contour/core/logging.h"
#include "contour/core/string_utils.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <thread>

#include <unistd.h>

namespace contour {

namespace {

constexpr std::uint64_t kFallbackRamBytes = 8ull * 1024ull * 1024ull * 1024ull;
constexpr std::uint64_t kMiB = 1024ull * 1024ull;
constexpr std::size_t kMaxRamCacheMinMb = 1u << 20;

// Out-of-range values, including ones strtoll saturates, clamp to the bounds.
std::size_t envCount(const Settings::Lookup& lookup, const char* name, std::size_t fallback, std::size_t minValue,
                     std::size_t maxValue) {
    const std::size_t dflt = std::min(maxValue, std::max(minValue, fallback));
    const auto raw = lookup(name);
    if (!raw) return dflt;
    const std::string text(trimAscii(*raw));
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0') {
        CONTOUR_LOG_WARN("ignoring %s=%s", name, raw->c_str());
        return dflt;
    }
    if (errno == ERANGE) CONTOUR_LOG_WARN("%s=%s is out of range", name, raw->c_str());
    if (v < static_cast<long long>(minValue)) return minValue;
    if (static_cast<unsigned long long>(v) > maxValue) return maxValue;
    return static_cast<std::size_t>(v);
}

double envReal(const Settings::Lookup& lookup, const char* name, double fallback, double minValue, double maxValue) {
    double value = fallback;
    if (const auto raw = lookup(name)) {
        const std::string text(trimAscii(*raw));
        char* end = nullptr;
        const double v = std::strtod(text.c_str(), &end);
        if (!text.empty() && *end == '\0' && std::isfinite(v)) {
            value = v;
        } else {
            CONTOUR_LOG_WARN("ignoring %s=%s", name, raw->c_str());
        }
    }
    return std::max(minValue, std::min(maxValue, value));
}

bool envSwitch(const Settings::Lookup& lookup, const char* name, bool fallback) {
    const auto raw = lookup(name);
    if (!raw) return fallback;
    const std::string v = toLowerAscii(trimAscii(*raw));
    if (v == "off" || v == "0" || v == "false" || v == "no") return false;
    if (v == "auto" || v == "on" || v == "1" || v == "true" || v == "yes") return true;
    CONTOUR_LOG_WARN("ignoring %s=%s", name, raw->c_str());
    return fallback;
}

} // namespace

std::uint64_t detectTotalRamBytes() {
    const long pages = ::sysconf(_SC_PHYS_PAGES);
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    if (pages <= 0 || pageSize <= 0) return kFallbackRamBytes;
    return static_cast<std::uint64_t>(pages) * static_cast<std::uint64_t>(pageSize);
}

std::size_t hardwareThreads() {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

std::size_t maxWorkers() {
    return kWorkersPerCore * hardwareThreads();
}

std::size_t Settings::memoryBudgetBytes() const {
    const std::uint64_t floorBytes = static_cast<std::uint64_t>(ramCacheMinMb) * kMiB;
    const double share = static_cast<double>(totalRamBytes) * ramCacheFraction;
    std::uint64_t budget = floorBytes;
    if (share > static_cast<double>(budget)) budget = static_cast<std::uint64_t>(share);
    if (budget > std::numeric_limits<std::size_t>::max()) return std::numeric_limits<std::size_t>::max();
    return static_cast<std::size_t>(budget);
}

Settings Settings::defaults() {
    Settings s;
    s.cpuWorkers = hardwareThreads();
    s.acceleratorWorkers = hardwareThreads();
    s.totalRamBytes = detectTotalRamBytes();
    return s;
}

Settings Settings::fromEnvironment() {
    return fromLookup([](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    });
}

Settings Settings::fromLookup(const Lookup& lookup) {
    Settings s = defaults();
    s.cpuWorkers = envCount(lookup, "DXF_CPU_WORKERS", s.cpuWorkers, 1, maxWorkers());

    // DXF_CUDA_WORKERS is the older spelling.
    const char* accelVar = lookup("DXF_ACCEL_WORKERS") ? "DXF_ACCEL_WORKERS" : "DXF_CUDA_WORKERS";
    s.acceleratorWorkers = envCount(lookup, accelVar, s.acceleratorWorkers, 1, maxWorkers());

    s.ramCacheFraction = envReal(lookup, "DXF_CACHE_RAM_FRACTION", s.ramCacheFraction, 0.05, 0.95);
    s.ramCacheMinMb = envCount(lookup, "DXF_CACHE_RAM_MIN_MB", s.ramCacheMinMb, 64, kMaxRamCacheMinMb);
    s.chordTolerance = envReal(lookup, "DXF_CHORD_TOLERANCE", s.chordTolerance, 0.05, 1000.0);
    s.acceleratorEnabled = envSwitch(lookup, "DXF_ACCELERATOR", s.acceleratorEnabled);
    s.poolsEnabled = envSwitch(lookup, "DXF_WORKER_POOLS", s.poolsEnabled);

    if (const auto dir = lookup("DXF_CACHE_DIR")) {
        const std::string_view trimmed = trimAscii(*dir);
        if (!trimmed.empty()) s.cacheDir = std::string(trimmed);
    }
    return s;
}

} // namespace contour
