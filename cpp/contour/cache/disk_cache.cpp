#include "contour/cache/disk_cache.h"

#include "contour/cache/cache_key.h"
#include "contour/core/logging.h"
#include "contour/persistence/record_codec.h"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace contour::cache {

namespace {

bool readWholeFile(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool writeAll(int fd, const std::uint8_t* data, std::size_t size) {
    std::size_t done = 0;
    while (done < size) {
        const ssize_t n = ::write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

DiskCache::DiskCache(std::string directory, std::uint32_t schemaVersion, std::string parserVersion)
    : directory_(std::move(directory)),
      schemaVersion_(schemaVersion),
      parserVersion_(std::move(parserVersion)) {}

std::string DiskCache::pathFor(const std::string& contentHash, ComputeMode mode) const {
    return (std::filesystem::path(directory_) / cacheFileName(contentHash, mode)).string();
}

bool DiskCache::ensureDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        CONTOUR_LOG_WARN("cannot create cache dir %s: %s", directory_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool DiskCache::load(const std::string& contentHash, ComputeMode mode, ParsedDocument& out) const {
    const std::string path = pathFor(contentHash, mode);
    std::vector<std::uint8_t> bytes;
    if (!readWholeFile(path, bytes)) return false;

    persistence::CacheRecord record;
    const ContourError err = persistence::decodeRecord(bytes.data(), bytes.size(), record);
    if (err != ContourError::Ok) {
        CONTOUR_LOG_DEBUG("disk record %s rejected: %s", path.c_str(), errorName(err));
        return false;
    }
    if (record.schemaVersion != schemaVersion_ || record.parserVersion != parserVersion_) {
        CONTOUR_LOG_DEBUG("disk record %s is stale (schema %u, parser %s)", path.c_str(), record.schemaVersion,
                          record.parserVersion.c_str());
        return false;
    }
    if (!persistence::isValidDocument(record.parsed)) {
        CONTOUR_LOG_DEBUG("disk record %s holds an invalid document", path.c_str());
        return false;
    }

    out = std::move(record.parsed);
    return true;
}

ContourError DiskCache::store(const std::string& contentHash, ComputeMode mode, const ParsedDocument& doc) const {
    if (!ensureDirectory()) return ContourError::IoFailure;

    persistence::CacheRecord record;
    record.schemaVersion = schemaVersion_;
    record.parserVersion = parserVersion_;
    record.parsed = doc;
    const std::vector<std::uint8_t> bytes = persistence::encodeRecord(record);

    const std::string target = pathFor(contentHash, mode);
    std::string tmpl = target + ".tmp.XXXXXX";
    const int fd = ::mkstemp(tmpl.data());
    if (fd < 0) {
        CONTOUR_LOG_WARN("cannot create temp file for %s", target.c_str());
        return ContourError::IoFailure;
    }

    const bool written = writeAll(fd, bytes.data(), bytes.size());
    const bool closed = ::close(fd) == 0;
    if (!written || !closed || std::rename(tmpl.c_str(), target.c_str()) != 0) {
        CONTOUR_LOG_WARN("disk cache write failed for %s", target.c_str());
        ::unlink(tmpl.c_str());
        return ContourError::IoFailure;
    }
    return ContourError::Ok;
}

} // namespace contour::cache
