#ifndef CONTOUR_CACHE_CACHE_KEY_H
#define CONTOUR_CACHE_CACHE_KEY_H

#include "contour/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace contour::cache {

// Identity of one cached parse. Version tags are part of the key, so bumping
// either one makes every earlier entry unreachable. contentHash is the 64-bit
// FNV-1a of contentHashHex, which is fast but not collision resistant.
class CacheKey {
public:
    CacheKey(std::uint32_t schemaVersion, std::string parserVersion, std::string contentHash, ComputeMode mode);

    std::uint32_t schemaVersion() const noexcept { return schemaVersion_; }
    const std::string& parserVersion() const noexcept { return parserVersion_; }
    const std::string& contentHash() const noexcept { return contentHash_; }
    ComputeMode mode() const noexcept { return mode_; }

    // "<schema>:<parser>:<hash>:<mode>"
    const std::string& toString() const noexcept { return text_; }

    // "<hash>-<mode>.bin"; the version tags live inside the record.
    std::string fileName() const;

    bool operator==(const CacheKey& other) const noexcept { return text_ == other.text_; }
    bool operator!=(const CacheKey& other) const noexcept { return !(*this == other); }

private:
    std::uint32_t schemaVersion_;
    std::string parserVersion_;
    std::string contentHash_;
    ComputeMode mode_;
    std::string text_;
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept;
};

// Key for the current build's versions.
CacheKey makeCacheKey(const std::string& contentHash, ComputeMode mode);

std::string cacheFileName(const std::string& contentHash, ComputeMode mode);

} // namespace contour::cache

#endif // CONTOUR_CACHE_CACHE_KEY_H
