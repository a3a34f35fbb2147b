#include "contour/pipeline/parse_job.h"

#include "contour/core/logging.h"
#include "contour/dxf/dxf_reader.h"
#include "contour/geometry/numeric_backend.h"
#include "contour/pipeline/contour_collector.h"
#include "contour/pipeline/normalizer.h"

#include <exception>
#include <new>

namespace contour::pipeline {

namespace {

const char* inputErrorMessage(ContourError err) {
    switch (err) {
        case ContourError::EmptyInput: return "input is empty";
        case ContourError::NoValidContours: return "no valid contours found in the drawing";
        case ContourError::DegenerateExtent: return "drawing has zero width or height";
        case ContourError::UnreadableSource: return "input is not a readable DXF file";
        default: return "invalid input";
    }
}

ParseResult failure(ContourError err) {
    ParseResult r;
    r.status = err;
    r.message = inputErrorMessage(err);
    return r;
}

} // namespace

ParseResult parseDocumentBytes(const std::uint8_t* data, std::size_t size, ComputeMode mode, double chordTolerance) {
    if (!data || size == 0) return failure(ContourError::EmptyInput);

    try {
        dxf::ReadResult read = dxf::readDxf(data, size);
        if (read.status != ContourError::Ok || !read.document) return failure(ContourError::UnreadableSource);

        const geometry::NumericBackend& backend = geometry::backendFor(mode);
        const std::vector<RawContour> raw = collectContours(*read.document, backend, chordTolerance);

        ParseResult result;
        result.repaired = read.repaired;
        const ContourError err = normalizeContours(raw, backend, result.document);
        if (err != ContourError::Ok) return failure(err);
        return result;
    } catch (const std::bad_alloc&) {
        CONTOUR_LOG_WARN("parse ran out of memory");
        ParseResult r;
        r.status = ContourError::InternalFailure;
        r.message = "parse failed: out of memory";
        return r;
    } catch (const std::exception& e) {
        CONTOUR_LOG_WARN("parse failed: %s", e.what());
        ParseResult r;
        r.status = ContourError::InternalFailure;
        r.message = "parse failed: internal error";
        return r;
    }
}

JobResult runParseJob(const std::uint8_t* data, std::size_t size, const std::string& contentHash,
                      ComputeMode usedMode, const cache::DiskCache& disk, double chordTolerance) {
    JobResult job;
    if (disk.load(contentHash, usedMode, job.parse.document)) {
        CONTOUR_LOG_DEBUG("worker cache hit %s", contentHash.c_str());
        job.diskHit = true;
        return job;
    }

    job.parse = parseDocumentBytes(data, size, usedMode, chordTolerance);
    if (job.parse.status == ContourError::Ok) {
        if (disk.store(contentHash, usedMode, job.parse.document) != ContourError::Ok) {
            CONTOUR_LOG_WARN("could not persist %s", contentHash.c_str());
        }
    }
    return job;
}

} // namespace contour::pipeline
