#include "contour/dxf/dxf_reader.h"

#include "contour/core/logging.h"
#include "contour/core/string_utils.h"
#include "contour/dxf/spline_eval.h"

#include <dl_creationadapter.h>
#include <dl_dxf.h>

#include <charconv>
#include <exception>
#include <mutex>
#include <optional>
#include <sstream>
#include <string_view>
#include <utility>
#include <variant>

namespace contour::dxf {

namespace {

// DL_Dxf keeps its line counter in a function-local static.
std::mutex& dxflibMutex() {
    static std::mutex m;
    return m;
}

bool hasBom(std::string_view text) {
    return text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
           static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF;
}

// Splits on LF, CRLF and bare CR.
std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' || text[i] == '\r') {
            lines.push_back(text.substr(start, i - start));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            start = i + 1;
        }
    }
    if (start < text.size()) lines.push_back(text.substr(start));
    return lines;
}

bool isGroupCode(std::string_view line) {
    const std::string_view s = trimAscii(line);
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') ++first;
    int code = 0;
    const auto res = std::from_chars(first, last, code);
    return res.ec == std::errc() && res.ptr == last;
}

std::string_view lastNonEmptyLine(const std::vector<std::string_view>& lines) {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const std::string_view s = trimAscii(*it);
        if (!s.empty()) return s;
    }
    return std::string_view();
}

// Turns dxflib callbacks into entities. Polylines and splines arrive as a
// header callback followed by vertex/knot/control-point callbacks, so they
// stay pending until the next entity, a SEQEND or the end of the read.
class EntityCollector final : public DL_CreationAdapter {
public:
    explicit EntityCollector(DxfDocument& doc) : doc_(doc) {}

    void addLayer(const DL_LayerData&) override { ++records_; }

    void addBlock(const DL_BlockData&) override {
        flush();
        ++records_;
        inBlock_ = true;
    }

    void endBlock() override {
        flush();
        inBlock_ = false;
    }

    void setVariableVector(const std::string&, double, double, double, int) override { ++records_; }
    void setVariableString(const std::string&, const std::string&, int) override { ++records_; }
    void setVariableInt(const std::string&, int, int) override { ++records_; }
    void setVariableDouble(const std::string&, double, int) override { ++records_; }

    void addLine(const DL_LineData& d) override {
        if (!beginEntity()) return;
        doc_.addEntity(LineEntity{Point2{d.x1, d.y1}, Point2{d.x2, d.y2}});
    }

    void addArc(const DL_ArcData& d) override {
        if (!beginEntity()) return;
        ArcEntity arc;
        arc.center = Point2{d.cx, d.cy};
        arc.radius = d.radius;
        arc.startAngle = d.angle1;
        arc.endAngle = d.angle2;
        doc_.addEntity(arc);
    }

    void addCircle(const DL_CircleData& d) override {
        if (!beginEntity()) return;
        CircleEntity circle;
        circle.center = Point2{d.cx, d.cy};
        circle.radius = d.radius;
        doc_.addEntity(circle);
    }

    void addPolyline(const DL_PolylineData& d) override {
        if (!beginEntity()) return;
        polyline_.emplace();
        polyline_->closed = (d.flags & 0x01) != 0;
    }

    void addVertex(const DL_VertexData& d) override {
        if (polyline_) polyline_->vertices.push_back(PolylineVertex{d.x, d.y, d.bulge});
    }

    void addSpline(const DL_SplineData& d) override {
        if (!beginEntity()) return;
        spline_.emplace();
        spline_->closed = (d.flags & 0x01) != 0;
        spline_->degree = static_cast<int>(d.degree);
    }

    void addControlPoint(const DL_ControlPointData& d) override {
        if (!spline_) return;
        spline_->controlPoints.push_back(Point2{d.x, d.y});
        spline_->weights.push_back(d.w);
    }

    void addFitPoint(const DL_FitPointData& d) override {
        if (spline_) spline_->fitPoints.push_back(Point2{d.x, d.y});
    }

    void addKnot(const DL_KnotData& d) override {
        if (spline_) spline_->knots.push_back(d.k);
    }

    void endSequence() override { flush(); }

    void addPoint(const DL_PointData&) override { unsupported("POINT"); }
    void addXLine(const DL_XLineData&) override { unsupported("XLINE"); }
    void addRay(const DL_RayData&) override { unsupported("RAY"); }
    void addEllipse(const DL_EllipseData&) override { unsupported("ELLIPSE"); }
    void addInsert(const DL_InsertData&) override { unsupported("INSERT"); }
    void addText(const DL_TextData&) override { unsupported("TEXT"); }
    void addMText(const DL_MTextData&) override { unsupported("MTEXT"); }
    void addSolid(const DL_SolidData&) override { unsupported("SOLID"); }
    void addTrace(const DL_TraceData&) override { unsupported("TRACE"); }
    void addHatch(const DL_HatchData&) override { unsupported("HATCH"); }

    // Call once dxflib returns.
    void finish() { flush(); }

    std::size_t records() const noexcept { return records_; }
    std::size_t skippedPaperspace() const noexcept { return paperspace_; }

private:
    // Closes any pending entity and decides whether the new one belongs to
    // modelspace. Block definitions and paperspace (group 67 = 1) are dropped.
    bool beginEntity() {
        flush();
        ++records_;
        if (inBlock_) return false;
        if (getAttributes().isInPaperSpace()) {
            ++paperspace_;
            return false;
        }
        return true;
    }

    void unsupported(const char* type) {
        if (beginEntity()) doc_.addEntity(UnsupportedEntity{type});
    }

    void flush() {
        if (polyline_) {
            doc_.addEntity(std::move(*polyline_));
            polyline_.reset();
        }
        if (spline_) {
            doc_.addEntity(std::move(*spline_));
            spline_.reset();
        }
    }

    DxfDocument& doc_;
    std::optional<PolylineEntity> polyline_;
    std::optional<SplineEntity> spline_;
    bool inBlock_{false};
    std::size_t records_{0};
    std::size_t paperspace_{0};
};

// Runs dxflib over `text`. Fills `result` and returns true when at least one
// record was recognized.
bool readWithDxflib(const std::string& text, ReadResult& result) {
    auto doc = std::make_unique<DxfDocument>();
    EntityCollector collector(*doc);
    std::istringstream in(text);

    bool complete = false;
    try {
        std::lock_guard<std::mutex> lock(dxflibMutex());
        auto reader = std::make_unique<DL_Dxf>();
        complete = reader->in(in, &collector);
    } catch (const std::exception& e) {
        result.warnings.push_back(std::string("dxflib failed: ") + e.what());
        return false;
    }
    collector.finish();

    if (collector.records() == 0) {
        result.warnings.push_back("no DXF records found");
        return false;
    }
    if (!complete) CONTOUR_LOG_DEBUG("dxflib stopped early after %zu records", collector.records());
    if (collector.skippedPaperspace() > 0) {
        CONTOUR_LOG_DEBUG("skipped %zu paperspace entities", collector.skippedPaperspace());
    }

    result.status = ContourError::Ok;
    result.document = std::move(doc);
    return true;
}

// Group-code/value pairs with stray lines in group-code position dropped,
// over-long lines cut, and EOF appended when missing.
std::string repairText(std::string_view text, std::vector<std::string>& warnings) {
    const std::vector<std::string_view> lines = splitLines(text);

    std::string out;
    out.reserve(text.size() + 16);
    std::size_t dropped = 0;
    std::size_t truncated = 0;
    std::string_view lastCode;
    std::string_view lastValue;

    std::size_t i = 0;
    while (i < lines.size()) {
        if (!isGroupCode(lines[i])) {
            if (!trimAscii(lines[i]).empty()) ++dropped;
            ++i;
            continue;
        }
        if (i + 1 >= lines.size()) break;
        std::string_view value = lines[i + 1];
        if (value.size() > kMaxDxfLineLength) {
            value = value.substr(0, kMaxDxfLineLength);
            ++truncated;
        }
        lastCode = trimAscii(lines[i]);
        lastValue = trimAscii(value);
        out.append(lastCode.data(), lastCode.size());
        out.push_back('\n');
        out.append(value.data(), value.size());
        out.push_back('\n');
        i += 2;
    }

    if (dropped > 0) warnings.push_back("dropped " + std::to_string(dropped) + " stray lines");
    if (truncated > 0) warnings.push_back("truncated " + std::to_string(truncated) + " over-long values");
    if (!(lastCode == "0" && lastValue == "EOF")) out += "0\nEOF\n";
    return out;
}

struct TypeNameVisitor {
    const char* operator()(const LineEntity&) const { return "LINE"; }
    const char* operator()(const PolylineEntity&) const { return "POLYLINE"; }
    const char* operator()(const ArcEntity&) const { return "ARC"; }
    const char* operator()(const CircleEntity&) const { return "CIRCLE"; }
    const char* operator()(const SplineEntity&) const { return "SPLINE"; }
    const char* operator()(const UnsupportedEntity& u) const { return u.type.c_str(); }
};

} // namespace

const char* entityTypeName(const Entity& entity) {
    return std::visit(TypeNameVisitor{}, entity);
}

std::vector<Point2> DxfDocument::flattenSpline(const SplineEntity& spline, double tolerance) const {
    SplineFlattenOptions opt;
    opt.tolerance = tolerance;
    return ::contour::dxf::flattenSpline(spline, opt);
}

ReadResult readDxfStrict(const std::uint8_t* data, std::size_t size) {
    ReadResult result;
    result.status = ContourError::UnreadableSource;

    const std::string_view text(reinterpret_cast<const char*>(data), size);
    if (hasBom(text)) {
        result.warnings.push_back("UTF-8 byte order mark");
        return result;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n')) {
            result.warnings.push_back("bare CR line ending");
            return result;
        }
    }

    const std::vector<std::string_view> lines = splitLines(text);
    bool hasEntities = false;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].size() > kMaxDxfLineLength) {
            result.warnings.push_back("line " + std::to_string(i + 1) + " is too long");
            return result;
        }
        if (trimAscii(lines[i]) == "ENTITIES") hasEntities = true;
    }
    if (!hasEntities) {
        result.warnings.push_back("missing ENTITIES section");
        return result;
    }
    if (lastNonEmptyLine(lines) != "EOF") {
        result.warnings.push_back("missing EOF marker");
        return result;
    }

    readWithDxflib(std::string(text), result);
    return result;
}

ReadResult readDxfRepair(const std::uint8_t* data, std::size_t size) {
    ReadResult result;
    result.status = ContourError::UnreadableSource;
    result.repaired = true;

    std::string_view text(reinterpret_cast<const char*>(data), size);
    if (hasBom(text)) text.remove_prefix(3);

    readWithDxflib(repairText(text, result.warnings), result);
    return result;
}

ReadResult readDxf(const std::uint8_t* data, std::size_t size) {
    ReadResult strict = readDxfStrict(data, size);
    if (strict.status == ContourError::Ok) return strict;

    CONTOUR_LOG_DEBUG("strict DXF read failed (%s), trying repair",
                      strict.warnings.empty() ? "unknown" : strict.warnings.front().c_str());
    ReadResult repaired = readDxfRepair(data, size);
    repaired.warnings.insert(repaired.warnings.begin(), strict.warnings.begin(), strict.warnings.end());
    if (repaired.status != ContourError::Ok) {
        CONTOUR_LOG_WARN("DXF repair read found nothing usable");
    }
    return repaired;
}

} // namespace contour::dxf
