#ifndef CONTOUR_CACHE_DISK_CACHE_H
#define CONTOUR_CACHE_DISK_CACHE_H

#include "contour/core/types.h"

#include <cstdint>
#include <string>

namespace contour::cache {

// One record file per (content hash, compute mode) under a directory.
//
// Readers never see a partial file: writes go to a temp file in the same
// directory and are renamed into place. Records written under other version
// tags, or that fail to decode, read as misses and are left on disk until the
// next store for that key replaces them. Safe to share across threads and
// processes.
class DiskCache {
public:
    explicit DiskCache(std::string directory,
                       std::uint32_t schemaVersion = kCacheSchemaVersion,
                       std::string parserVersion = kParserVersion);

    bool load(const std::string& contentHash, ComputeMode mode, ParsedDocument& out) const;

    // Ok or IoFailure. A failed store leaves no temp file behind.
    ContourError store(const std::string& contentHash, ComputeMode mode, const ParsedDocument& doc) const;

    std::string pathFor(const std::string& contentHash, ComputeMode mode) const;
    bool ensureDirectory() const;

    const std::string& directory() const noexcept { return directory_; }
    std::uint32_t schemaVersion() const noexcept { return schemaVersion_; }
    const std::string& parserVersion() const noexcept { return parserVersion_; }

private:
    std::string directory_;
    std::uint32_t schemaVersion_;
    std::string parserVersion_;
};

} // namespace contour::cache

#endif // CONTOUR_CACHE_DISK_CACHE_H
