#ifndef CONTOUR_DISPATCH_PARSE_SERVICE_H
#define CONTOUR_DISPATCH_PARSE_SERVICE_H

#include "contour/cache/disk_cache.h"
#include "contour/cache/memory_cache.h"
#include "contour/config/settings.h"
#include "contour/core/types.h"
#include "contour/dispatch/worker_pool.h"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace contour::dispatch {

// Where a result came from and how it was produced.
struct Provenance {
    std::string fileHash;
    bool fromCache{false};
    CacheSource cacheSource{CacheSource::None};
    ComputeMode requestedMode{ComputeMode::Cpu};
    ComputeMode usedMode{ComputeMode::Cpu};
    double parseMs{0.0};
};

struct ParseOutcome {
    ContourError status{ContourError::Ok};
    // Specific reason for input errors, generic text for internal ones.
    std::string message;
    std::shared_ptr<const ParsedDocument> document;
    Provenance provenance;

    bool ok() const noexcept { return status == ContourError::Ok && document != nullptr; }
};

struct ServiceHealth {
    std::string parserVersion;
    std::uint32_t schemaVersion{0};
    bool acceleratorAvailable{false};
    std::string simdInstructionSets;
    std::size_t cpuCores{0};
    std::size_t cpuWorkers{0};
    std::size_t acceleratorWorkers{0};
    bool poolsRunning{false};
    cache::CacheStats memory;
    std::string cacheDir;
};

// Front end of the pipeline: memory tier, disk tier, then a worker pool.
//
// Two pools keep cpu and accelerated jobs apart. Pools are started lazily on
// first use; on a pool thread, or when pools cannot be started, jobs run on
// the calling thread instead. Concurrent misses for the same file each parse.
class ParseService {
public:
    explicit ParseService(Settings settings);
    ~ParseService();

    ParseService(const ParseService&) = delete;
    ParseService& operator=(const ParseService&) = delete;

    // Cache hits and inline runs return a ready future.
    std::future<ParseOutcome> parseAsync(std::vector<std::uint8_t> data, ComputeMode requested);
    std::future<ParseOutcome> parseAsync(std::vector<std::uint8_t> data, std::string_view requestedMode);

    ParseOutcome parse(std::vector<std::uint8_t> data, ComputeMode requested);
    ParseOutcome parse(std::vector<std::uint8_t> data, std::string_view requestedMode);

    // Accelerated falls back to cpu when no accelerator is available.
    ComputeMode resolveMode(ComputeMode requested) const noexcept;
    bool acceleratorAvailable() const noexcept { return acceleratorAvailable_; }

    // True when both pools are running after the call.
    bool ensurePools();
    void shutdownPools();

    ServiceHealth health() const;

    cache::MemoryCache& memoryCache() noexcept { return memory_; }
    const cache::DiskCache& diskCache() const noexcept { return disk_; }
    const Settings& settings() const noexcept { return settings_; }

    // Number of jobs that reached the disk-then-parse stage.
    std::size_t jobCount() const noexcept { return jobs_.load(); }

private:
    ParseOutcome runJob(const std::vector<std::uint8_t>& data, const std::string& hash, ComputeMode requested,
                        ComputeMode used, double startMs);

    const Settings settings_;
    const bool acceleratorAvailable_;
    cache::MemoryCache memory_;
    cache::DiskCache disk_;
    std::atomic<std::size_t> jobs_{0};

    mutable std::mutex poolMutex_;
    std::unique_ptr<WorkerPool> cpuPool_;
    std::unique_ptr<WorkerPool> acceleratorPool_;
};

// Process-wide instance configured from the environment on first use.
ParseService& defaultService();

} // namespace contour::dispatch

#endif // CONTOUR_DISPATCH_PARSE_SERVICE_H
