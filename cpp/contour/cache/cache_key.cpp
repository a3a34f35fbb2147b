#include "contour/cache/cache_key.h"

#include "contour/core/string_utils.h"

#include <utility>

namespace contour::cache {

CacheKey::CacheKey(std::uint32_t schemaVersion, std::string parserVersion, std::string contentHash, ComputeMode mode)
    : schemaVersion_(schemaVersion),
      parserVersion_(std::move(parserVersion)),
      contentHash_(std::move(contentHash)),
      mode_(mode) {
    text_ = std::to_string(schemaVersion_);
    text_ += ':';
    text_ += parserVersion_;
    text_ += ':';
    text_ += contentHash_;
    text_ += ':';
    text_ += computeModeName(mode_);
}

std::string CacheKey::fileName() const {
    return cacheFileName(contentHash_, mode_);
}

std::size_t CacheKeyHash::operator()(const CacheKey& key) const noexcept {
    const std::string& s = key.toString();
    const std::uint64_t h = hashBytes(kDigestOffset, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    return static_cast<std::size_t>(h);
}

CacheKey makeCacheKey(const std::string& contentHash, ComputeMode mode) {
    return CacheKey(kCacheSchemaVersion, kParserVersion, contentHash, mode);
}

std::string cacheFileName(const std::string& contentHash, ComputeMode mode) {
    std::string name = contentHash;
    name += '-';
    name += computeModeName(mode);
    name += ".bin";
    return name;
}

} // namespace contour::cache
