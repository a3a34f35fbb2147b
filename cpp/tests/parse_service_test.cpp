#include <gtest/gtest.h>

#include "contour/dispatch/parse_service.h"
#include "contour/dispatch/worker_pool.h"
#include "contour/geometry/numeric_backend.h"
#include "contour/persistence/record_codec.h"
#include "test_support.h"

#include <atomic>
#include <future>
#include <limits>
#include <vector>

using namespace contour;
using namespace contour::dispatch;
using contour::test::DxfBuilder;
using contour::test::TempDir;

namespace {

Settings testSettings(const TempDir& dir) {
    Settings s;
    s.cpuWorkers = 2;
    s.acceleratorWorkers = 2;
    s.ramCacheMinMb = 64;
    s.ramCacheFraction = 0.05;
    s.totalRamBytes = 0;
    s.cacheDir = dir.path();
    return s;
}

std::vector<std::uint8_t> squareBytes(double size = 10.0) {
    DxfBuilder b;
    b.lwpolyline({{0, 0, 0}, {size, 0, 0}, {size, size, 0}, {0, size, 0}}, true);
    return b.bytes();
}

} // namespace

TEST(WorkerPoolTest, RunsTasksOnWorkerThreads) {
    WorkerPool pool("test", 3);
    EXPECT_EQ(pool.threadCount(), 3u);
    EXPECT_FALSE(onWorkerThread());

    std::vector<std::future<bool>> results;
    for (int i = 0; i < 16; ++i) results.push_back(pool.submit([] { return onWorkerThread(); }));
    for (auto& f : results) EXPECT_TRUE(f.get());
}

TEST(WorkerPoolTest, ShutdownDrainsQueueThenRejects) {
    std::atomic<int> ran{0};
    WorkerPool pool("drain", 1);
    for (int i = 0; i < 20; ++i) pool.submit([&ran] { ++ran; });
    pool.shutdown();
    EXPECT_EQ(ran.load(), 20);
    EXPECT_THROW(pool.submit([] { return 0; }), std::runtime_error);
    pool.shutdown();
}

TEST(ParseServiceTest, SecondCallIsAMemoryHit) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));

    const ParseOutcome first = service.parse(squareBytes(), ComputeMode::Cpu);
    ASSERT_TRUE(first.ok()) << first.message;
    EXPECT_FALSE(first.provenance.fromCache);
    EXPECT_EQ(first.provenance.cacheSource, CacheSource::None);
    EXPECT_EQ(first.provenance.fileHash.size(), 16u);

    const ParseOutcome second = service.parse(squareBytes(), ComputeMode::Cpu);
    ASSERT_TRUE(second.ok());
    EXPECT_TRUE(second.provenance.fromCache);
    EXPECT_EQ(second.provenance.cacheSource, CacheSource::Memory);
    EXPECT_EQ(second.provenance.fileHash, first.provenance.fileHash);
    EXPECT_EQ(persistence::encodeRecord({kCacheSchemaVersion, kParserVersion, *first.document}),
              persistence::encodeRecord({kCacheSchemaVersion, kParserVersion, *second.document}));
    EXPECT_EQ(service.jobCount(), 1u);
    EXPECT_EQ(service.health().memory.entries, 1u);
}

TEST(ParseServiceTest, FreshServiceReadsFromDisk) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParsedDocument original;
    {
        ParseService service(testSettings(dir));
        const ParseOutcome first = service.parse(squareBytes(), ComputeMode::Cpu);
        ASSERT_TRUE(first.ok());
        original = *first.document;
    }

    ParseService restarted(testSettings(dir));
    const ParseOutcome again = restarted.parse(squareBytes(), ComputeMode::Cpu);
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.provenance.fromCache);
    EXPECT_EQ(again.provenance.cacheSource, CacheSource::Disk);
    EXPECT_EQ(*again.document, original);
    EXPECT_EQ(restarted.jobCount(), 0u);

    // The disk hit was promoted to memory.
    EXPECT_EQ(restarted.parse(squareBytes(), ComputeMode::Cpu).provenance.cacheSource, CacheSource::Memory);
}

TEST(ParseServiceTest, ModesAreCachedSeparately) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));
    if (!service.acceleratorAvailable()) GTEST_SKIP() << "no SIMD support on this machine";

    ASSERT_TRUE(service.parse(squareBytes(), ComputeMode::Cpu).ok());
    const ParseOutcome accel = service.parse(squareBytes(), ComputeMode::Accelerated);
    ASSERT_TRUE(accel.ok());
    EXPECT_FALSE(accel.provenance.fromCache);
    EXPECT_EQ(accel.provenance.usedMode, ComputeMode::Accelerated);
    EXPECT_EQ(dir.fileCount(), 2u);
}

TEST(ParseServiceTest, AcceleratedFallsBackToCpu) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    Settings s = testSettings(dir);
    s.acceleratorEnabled = false;
    ParseService service(s);
    EXPECT_FALSE(service.acceleratorAvailable());
    EXPECT_FALSE(service.health().acceleratorAvailable);

    const ParseOutcome out = service.parse(squareBytes(), "CUDA");
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.provenance.requestedMode, ComputeMode::Accelerated);
    EXPECT_EQ(out.provenance.usedMode, ComputeMode::Cpu);

    // Same key as a plain cpu request.
    EXPECT_EQ(service.parse(squareBytes(), ComputeMode::Cpu).provenance.cacheSource, CacheSource::Memory);
}

TEST(ParseServiceTest, InputErrorsAreReported) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));

    const ParseOutcome empty = service.parse({}, ComputeMode::Cpu);
    EXPECT_EQ(empty.status, ContourError::EmptyInput);
    EXPECT_TRUE(isInputError(empty.status));
    EXPECT_FALSE(empty.ok());

    const ParseOutcome garbage = service.parse(DxfBuilder::toBytes("\x01\x02 junk\n"), ComputeMode::Cpu);
    EXPECT_TRUE(isInputError(garbage.status));
    EXPECT_FALSE(garbage.message.empty());
    EXPECT_EQ(garbage.document, nullptr);

    // Failures are not cached.
    EXPECT_EQ(service.health().memory.entries, 0u);
    EXPECT_EQ(dir.fileCount(), 0u);
}

TEST(ParseServiceTest, WorksWithoutPools) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    Settings s = testSettings(dir);
    s.poolsEnabled = false;
    ParseService service(s);
    EXPECT_FALSE(service.ensurePools());

    const ParseOutcome out = service.parse(squareBytes(), ComputeMode::Cpu);
    ASSERT_TRUE(out.ok());
    EXPECT_FALSE(service.health().poolsRunning);
}

TEST(ParseServiceTest, PoolStartupFailureFallsBackInline) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    Settings s = testSettings(dir);
    s.cpuWorkers = std::numeric_limits<std::size_t>::max() / 2;
    ParseService service(s);
    EXPECT_FALSE(service.ensurePools());

    const ParseOutcome out = service.parse(squareBytes(), "cpu");
    ASSERT_TRUE(out.ok()) << out.message;
    EXPECT_DOUBLE_EQ(out.document->width, 10.0);
    EXPECT_FALSE(service.health().poolsRunning);

    std::future<ParseOutcome> later = service.parseAsync(squareBytes(7.0), ComputeMode::Cpu);
    EXPECT_TRUE(later.get().ok());
}

TEST(ParseServiceTest, ConcurrentRequests) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));

    std::vector<std::future<ParseOutcome>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(service.parseAsync(squareBytes(5.0 + i % 4), ComputeMode::Cpu));
    }
    for (int i = 0; i < 12; ++i) {
        const ParseOutcome out = futures[i].get();
        ASSERT_TRUE(out.ok()) << out.message;
        EXPECT_DOUBLE_EQ(out.document->width, 5.0 + i % 4);
    }
    EXPECT_TRUE(service.health().poolsRunning);
    EXPECT_EQ(dir.fileCount(), 4u);

    service.shutdownPools();
    EXPECT_FALSE(service.health().poolsRunning);
    EXPECT_TRUE(service.parse(squareBytes(42.0), ComputeMode::Cpu).ok());
}

TEST(ParseServiceTest, NestedRequestRunsInline) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));
    ASSERT_TRUE(service.ensurePools());

    WorkerPool outer("outer", 1);
    auto nested = outer.submit([&service] { return service.parse(squareBytes(), ComputeMode::Cpu); });
    const ParseOutcome out = nested.get();
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.document->contours.size(), 1u);
}

TEST(ParseServiceTest, HealthReport) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    ParseService service(testSettings(dir));
    const ServiceHealth h = service.health();
    EXPECT_EQ(h.parserVersion, kParserVersion);
    EXPECT_EQ(h.schemaVersion, kCacheSchemaVersion);
    EXPECT_EQ(h.cpuWorkers, 2u);
    EXPECT_EQ(h.acceleratorWorkers, 2u);
    EXPECT_GE(h.cpuCores, 1u);
    EXPECT_EQ(h.cacheDir, dir.path());
    EXPECT_EQ(h.memory.maxBytes, 64u * 1024u * 1024u);
    EXPECT_EQ(h.acceleratorAvailable, geometry::simdAvailable());
}
