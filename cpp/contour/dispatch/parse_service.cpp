#include "contour/dispatch/parse_service.h"

#include "contour/cache/cache_key.h"
#include "contour/core/logging.h"
#include "contour/core/string_utils.h"
#include "contour/core/util.h"
#include "contour/geometry/numeric_backend.h"
#include "contour/persistence/record_codec.h"
#include "contour/pipeline/parse_job.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace contour::dispatch {

namespace {

std::future<ParseOutcome> readyFuture(ParseOutcome outcome) {
    std::promise<ParseOutcome> p;
    p.set_value(std::move(outcome));
    return p.get_future();
}

ParseOutcome cachedOutcome(std::shared_ptr<const ParsedDocument> doc, CacheSource source, Provenance prov,
                           double startMs) {
    ParseOutcome out;
    out.document = std::move(doc);
    out.provenance = std::move(prov);
    out.provenance.fromCache = true;
    out.provenance.cacheSource = source;
    out.provenance.parseMs = nowMs() - startMs;
    return out;
}

} // namespace

ParseService::ParseService(Settings settings)
    : settings_(std::move(settings)),
      acceleratorAvailable_(settings_.acceleratorEnabled && geometry::simdAvailable()),
      memory_(settings_.memoryBudgetBytes()),
      disk_(settings_.cacheDir) {
    if (!disk_.ensureDirectory()) {
        CONTOUR_LOG_WARN("disk cache disabled until %s becomes writable", settings_.cacheDir.c_str());
    }
}

ParseService::~ParseService() {
    shutdownPools();
}

ComputeMode ParseService::resolveMode(ComputeMode requested) const noexcept {
    if (requested == ComputeMode::Accelerated && acceleratorAvailable_) return ComputeMode::Accelerated;
    return ComputeMode::Cpu;
}

bool ParseService::ensurePools() {
    if (!settings_.poolsEnabled || onWorkerThread()) return false;

    std::lock_guard<std::mutex> lock(poolMutex_);
    try {
        if (!cpuPool_) {
            cpuPool_ = std::make_unique<WorkerPool>("cpu", settings_.cpuWorkers);
            CONTOUR_LOG_INFO("started cpu pool with %zu workers", cpuPool_->threadCount());
        }
        if (!acceleratorPool_) {
            acceleratorPool_ = std::make_unique<WorkerPool>("accelerated", settings_.acceleratorWorkers);
            CONTOUR_LOG_INFO("started accelerated pool with %zu workers", acceleratorPool_->threadCount());
        }
    } catch (const std::exception& e) {
        CONTOUR_LOG_WARN("worker pool unavailable, parsing inline: %s", e.what());
        cpuPool_.reset();
        acceleratorPool_.reset();
        return false;
    }
    return true;
}

void ParseService::shutdownPools() {
    std::unique_ptr<WorkerPool> cpu;
    std::unique_ptr<WorkerPool> accel;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        cpu = std::move(cpuPool_);
        accel = std::move(acceleratorPool_);
    }
    // Destroying the pools drains their queues and joins the workers.
    cpu.reset();
    accel.reset();
}

ParseOutcome ParseService::runJob(const std::vector<std::uint8_t>& data, const std::string& hash,
                                  ComputeMode requested, ComputeMode used, double startMs) {
    ++jobs_;

    ParseOutcome out;
    out.provenance.fileHash = hash;
    out.provenance.requestedMode = requested;
    out.provenance.usedMode = used;

    try {
        pipeline::JobResult job =
            pipeline::runParseJob(data.data(), data.size(), hash, used, disk_, settings_.chordTolerance);
        out.status = job.parse.status;
        out.message = std::move(job.parse.message);
        if (out.status == ContourError::Ok) {
            const std::size_t bytes = persistence::encodedRecordSize(disk_.parserVersion(), job.parse.document);
            auto doc = std::make_shared<const ParsedDocument>(std::move(job.parse.document));
            memory_.put(cache::makeCacheKey(hash, used), doc, bytes);
            out.document = std::move(doc);
            if (job.diskHit) {
                out.provenance.fromCache = true;
                out.provenance.cacheSource = CacheSource::Disk;
            }
        }
    } catch (const std::exception& e) {
        CONTOUR_LOG_WARN("parse job for %s failed: %s", hash.c_str(), e.what());
        out.status = ContourError::InternalFailure;
        out.message = "parse failed: internal error";
        out.document.reset();
    }

    out.provenance.parseMs = nowMs() - startMs;
    return out;
}

std::future<ParseOutcome> ParseService::parseAsync(std::vector<std::uint8_t> data, ComputeMode requested) {
    const double startMs = nowMs();
    const ComputeMode used = resolveMode(requested);
    if (used != requested) {
        CONTOUR_LOG_DEBUG("accelerator unavailable, running %s request on cpu", computeModeName(requested));
    }

    Provenance prov;
    prov.requestedMode = requested;
    prov.usedMode = used;

    if (data.empty()) {
        ParseOutcome out;
        out.status = ContourError::EmptyInput;
        out.message = "input is empty";
        out.provenance = prov;
        return readyFuture(std::move(out));
    }

    prov.fileHash = contentHashHex(data.data(), data.size());
    const cache::CacheKey key = cache::makeCacheKey(prov.fileHash, used);

    if (auto hit = memory_.get(key)) {
        CONTOUR_LOG_DEBUG("memory hit %s", key.toString().c_str());
        return readyFuture(cachedOutcome(std::move(hit), CacheSource::Memory, std::move(prov), startMs));
    }

    ParsedDocument fromDisk;
    if (disk_.load(prov.fileHash, used, fromDisk)) {
        CONTOUR_LOG_DEBUG("disk hit %s", key.toString().c_str());
        const std::size_t bytes = persistence::encodedRecordSize(disk_.parserVersion(), fromDisk);
        auto doc = std::make_shared<const ParsedDocument>(std::move(fromDisk));
        memory_.put(key, doc, bytes);
        return readyFuture(cachedOutcome(std::move(doc), CacheSource::Disk, std::move(prov), startMs));
    }

    auto shared = std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
    if (ensurePools()) {
        std::lock_guard<std::mutex> lock(poolMutex_);
        WorkerPool* pool = used == ComputeMode::Accelerated ? acceleratorPool_.get() : cpuPool_.get();
        if (pool) {
            try {
                return pool->submit([this, shared, hash = prov.fileHash, requested, used, startMs] {
                    return runJob(*shared, hash, requested, used, startMs);
                });
            } catch (const std::runtime_error& e) {
                CONTOUR_LOG_WARN("%s, parsing inline", e.what());
            }
        }
    }

    return readyFuture(runJob(*shared, prov.fileHash, requested, used, startMs));
}

std::future<ParseOutcome> ParseService::parseAsync(std::vector<std::uint8_t> data, std::string_view requestedMode) {
    return parseAsync(std::move(data), parseComputeMode(requestedMode));
}

ParseOutcome ParseService::parse(std::vector<std::uint8_t> data, ComputeMode requested) {
    return parseAsync(std::move(data), requested).get();
}

ParseOutcome ParseService::parse(std::vector<std::uint8_t> data, std::string_view requestedMode) {
    return parseAsync(std::move(data), requestedMode).get();
}

ServiceHealth ParseService::health() const {
    ServiceHealth h;
    h.parserVersion = disk_.parserVersion();
    h.schemaVersion = disk_.schemaVersion();
    h.acceleratorAvailable = acceleratorAvailable_;
    h.simdInstructionSets = geometry::simdInstructionSets();
    h.cpuCores = hardwareThreads();
    h.cpuWorkers = settings_.cpuWorkers;
    h.acceleratorWorkers = settings_.acceleratorWorkers;
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        h.poolsRunning = cpuPool_ != nullptr && acceleratorPool_ != nullptr;
    }
    h.memory = memory_.stats();
    h.cacheDir = disk_.directory();
    return h;
}

ParseService& defaultService() {
    static ParseService service(Settings::fromEnvironment());
    return service;
}

} // namespace contour::dispatch
