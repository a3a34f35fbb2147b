#ifndef CONTOUR_DXF_DXF_READER_H
#define CONTOUR_DXF_DXF_READER_H

#include "contour/dxf/dxf_entities.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace contour::dxf {

// In-memory document filled from dxflib callbacks. Modelspace only.
class DxfDocument final : public Document {
public:
    DxfDocument() = default;
    explicit DxfDocument(std::vector<Entity> entities) : entities_(std::move(entities)) {}

    const std::vector<Entity>& entities() const override { return entities_; }
    std::vector<Point2> flattenSpline(const SplineEntity& spline, double tolerance) const override;

    void addEntity(Entity entity) { entities_.push_back(std::move(entity)); }
    std::size_t entityCount() const noexcept { return entities_.size(); }

private:
    std::vector<Entity> entities_;
};

struct ReadResult {
    ContourError status{ContourError::Ok};
    bool repaired{false};
    std::unique_ptr<DxfDocument> document;
    // Human-readable reasons the strict path gave up, if it did.
    std::vector<std::string> warnings;
};

// Lines longer than this are rejected by the strict reader and cut short by
// the repair reader; dxflib cannot read them.
constexpr std::size_t kMaxDxfLineLength = 1000;

// Well-formed files only: LF or CRLF line endings, no BOM, no over-long lines,
// an ENTITIES section and a closing EOF. Failure leaves document null.
ReadResult readDxfStrict(const std::uint8_t* data, std::size_t size);

// Best-effort reader for damaged or hand-edited files. Strips a UTF-8 BOM,
// normalizes CR and CRLF line endings, drops stray lines that sit where a
// group code belongs, and appends a missing EOF. Fails only when dxflib finds
// nothing it recognizes.
ReadResult readDxfRepair(const std::uint8_t* data, std::size_t size);

// Strict first, repair second. status is UnreadableSource when both fail.
ReadResult readDxf(const std::uint8_t* data, std::size_t size);

} // namespace contour::dxf

#endif // CONTOUR_DXF_DXF_READER_H
