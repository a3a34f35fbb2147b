#ifndef CONTOUR_PIPELINE_PARSE_JOB_H
#define CONTOUR_PIPELINE_PARSE_JOB_H

#include "contour/cache/disk_cache.h"
#include "contour/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace contour::pipeline {

struct ParseResult {
    ContourError status{ContourError::Ok};
    std::string message;
    ParsedDocument document;
    bool repaired{false};
};

// Bytes in, normalized document out: read, collect, normalize. Input problems
// come back as input errors; anything thrown underneath is InternalFailure.
ParseResult parseDocumentBytes(const std::uint8_t* data, std::size_t size, ComputeMode mode,
                               double chordTolerance = kDefaultChordTolerance);

struct JobResult {
    ParseResult parse;
    // True when the record was already on disk and no parse ran.
    bool diskHit{false};
};

// What a pool worker runs: disk tier first, then a full parse whose result is
// written back to disk. A failed disk write is logged and otherwise ignored.
JobResult runParseJob(const std::uint8_t* data, std::size_t size, const std::string& contentHash,
                      ComputeMode usedMode, const cache::DiskCache& disk,
                      double chordTolerance = kDefaultChordTolerance);

} // namespace contour::pipeline

#endif // CONTOUR_PIPELINE_PARSE_JOB_H
