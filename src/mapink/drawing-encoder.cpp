#include "codec-internal.h"
#include <mapink/coord-plan.h>
#include <mapink/drawing-codec.h>
#include <mapink/palette.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace mapink {

namespace {

int64_t quantize(double v, int32_t origin, uint8_t scale) {
    return static_cast<int64_t>(std::floor((v - origin) / scale));
}

uint8_t styleIndexFor(const Shape& shape, float defaultStroke) {
    if (shape.type == ShapeType::Text) {
        auto text = shape.textStyle();
        return nearestFontSizeIndex(text ? text->fontSize : DEFAULT_FONT_SIZE);
    }
    auto stroke = shape.stroke();
    float width = (stroke && stroke->width) ? *stroke->width : defaultStroke;
    return nearestStrokeIndex(width);
}

template<typename T>
bool fits(int64_t lo, int64_t hi) {
    return lo >= std::numeric_limits<T>::min() && hi <= std::numeric_limits<T>::max();
}

size_t deltaWidth(const std::vector<int64_t>& q) {
    int64_t lo = 0;
    int64_t hi = 0;
    for (size_t i = 2; i < q.size(); i++) {
        int64_t d = q[i] - q[i - 2];
        lo = std::min(lo, d);
        hi = std::max(hi, d);
    }
    if (fits<int8_t>(lo, hi)) return 1;
    if (fits<int16_t>(lo, hi)) return 2;
    return 4;
}

Result<void> validateShape(const Shape& shape, size_t index) {
    auto where = "encodeDrawing: shape " + std::to_string(index) + " (" +
                 shapeTypeName(shape.type) + ")";
    if (shape.pos.size() < shapeArity(shape.type)) {
        return Err(where + " has too few coordinates");
    }
    if (isPolyline(shape.type)) {
        if (shape.pos.size() % 2 != 0) {
            return Err(where + " has an odd coordinate count");
        }
        if (shape.pos.size() / 2 > MAX_POLYLINE_VERTICES) {
            return Err(where + " has more than " + std::to_string(MAX_POLYLINE_VERTICES) +
                       " vertices");
        }
    }
    for (double v : shape.pos) {
        if (!std::isfinite(v)) {
            return Err(where + " has a non-finite coordinate");
        }
    }
    return Ok();
}

class GeometryWriter {
public:
    GeometryWriter(ByteWriter& out, const CoordPlan& plan)
        : _out(out), _plan(plan), _width(plan.coordBytes()) {}

    void x(double v) { _out.appendSigned(quantize(v, _plan.xOrigin, _plan.scale), _width); }
    void y(double v) { _out.appendSigned(quantize(v, _plan.yOrigin, _plan.scale), _width); }

    void polyline(const std::vector<double>& pos) {
        std::vector<int64_t> q(pos.size());
        for (size_t i = 0; i < pos.size(); i++) {
            q[i] = quantize(pos[i], i % 2 == 0 ? _plan.xOrigin : _plan.yOrigin, _plan.scale);
        }
        size_t width = deltaWidth(q);
        uint8_t flag = width == 4 ? POLYLINE_DELTA32 : width == 2 ? POLYLINE_DELTA16 : 0;

        _out.appendU8(flag);
        _out.appendU16(static_cast<uint16_t>(q.size() / 2));
        if (q.empty()) return;

        _out.appendSigned(q[0], _width);
        _out.appendSigned(q[1], _width);
        for (size_t i = 2; i < q.size(); i++) {
            _out.appendSigned(q[i] - q[i - 2], width);
        }
    }

private:
    ByteWriter& _out;
    const CoordPlan& _plan;
    size_t _width;
};

} // namespace

std::string_view truncateUtf8(std::string_view text, size_t maxBytes) {
    if (text.size() <= maxBytes) return text;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<uint8_t>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut);
}

void writeShapeRecordHeader(ByteWriter& writer, const Shape& shape) {
    ColorCode code = encodeColor(shape.color);
    uint8_t header = static_cast<uint8_t>(static_cast<uint8_t>(shape.type) & 0x0F);
    header |= static_cast<uint8_t>((code.index & 0x07) << 4);
    if (shape.filled) header |= 0x80;
    writer.appendU8(header);

    if (code.index == COLOR_ESCAPE) {
        writer.appendU8(code.escapeMode);
        if (code.escapeMode == ESCAPE_MODE_RGB) {
            writer.appendU8(code.rgb.r);
            writer.appendU8(code.rgb.g);
            writer.appendU8(code.rgb.b);
        }
    }
}

Result<std::vector<uint8_t>> encodeDrawing(const Drawing& drawing) {
    const auto& shapes = drawing.shapes;
    if (shapes.empty()) {
        return Err<std::vector<uint8_t>>("encodeDrawing: no shapes");
    }
    if (shapes.size() > MAX_SHAPES) {
        return Err<std::vector<uint8_t>>("encodeDrawing: " + std::to_string(shapes.size()) +
                                         " shapes exceed the limit of " +
                                         std::to_string(MAX_SHAPES));
    }
    if (drawing.mapName.size() > MAX_MAP_NAME_BYTES) {
        return Err<std::vector<uint8_t>>("encodeDrawing: map name longer than " +
                                         std::to_string(MAX_MAP_NAME_BYTES) + " bytes");
    }
    for (size_t i = 0; i < shapes.size(); i++) {
        if (auto res = validateShape(shapes[i], i); !res) {
            return Err<std::vector<uint8_t>>("encodeDrawing: invalid shape", res);
        }
    }

    auto planRes = planCoordinates(shapes);
    if (!planRes) {
        return Err<std::vector<uint8_t>>("encodeDrawing: cannot plan coordinates", planRes);
    }
    const CoordPlan& plan = *planRes;

    ByteWriter out;

    // Header
    out.appendU8(static_cast<uint8_t>(FORMAT_VERSION | (plan.coordClass << FLAG_CLASS_SHIFT)));
    out.appendU8(plan.scale);
    out.appendI32(plan.xOrigin);
    out.appendI32(plan.yOrigin);
    out.appendU8(static_cast<uint8_t>(drawing.mapName.size()));
    out.appendString(drawing.mapName);
    out.appendU8(static_cast<uint8_t>(shapes.size()));

    // Style table
    std::vector<uint8_t> styles(packedTableSize(shapes.size()), 0);
    for (size_t i = 0; i < shapes.size(); i++) {
        styles[i / 4] |= static_cast<uint8_t>(
            styleIndexFor(shapes[i], drawing.strokeWidth) << ((i % 4) * 2));
    }
    out.appendBytes(styles.data(), styles.size());

    // Shape records
    GeometryWriter geom(out, plan);
    for (const auto& shape : shapes) {
        writeShapeRecordHeader(out, shape);
        const auto& p = shape.pos;

        switch (shape.type) {
            case ShapeType::Point:
                geom.x(p[0]);
                geom.y(p[1]);
                break;
            case ShapeType::Circle:
                geom.x(p[0]);
                geom.y(p[1]);
                geom.x(p[0] + p[2]);
                break;
            case ShapeType::Line:
            case ShapeType::ArrowLine:
                geom.x(p[0]);
                geom.y(p[1]);
                geom.x(p[2]);
                geom.y(p[3]);
                break;
            case ShapeType::Rect:
            case ShapeType::Ellipse:
                geom.x(p[0]);
                geom.y(p[1]);
                geom.x(p[0] + p[2]);
                geom.y(p[1] + p[3]);
                break;
            case ShapeType::Path:
            case ShapeType::ClosedPath:
            case ShapeType::Polygon:
                geom.polyline(p);
                break;
            case ShapeType::Text: {
                geom.x(p[0]);
                geom.y(p[1]);
                auto style = shape.textStyle();
                std::string_view text = style ? std::string_view(style->text) : std::string_view();
                auto kept = truncateUtf8(text, MAX_TEXT_BYTES);
                if (kept.size() < text.size()) {
                    ywarn("encodeDrawing: text truncated from {} to {} bytes",
                          text.size(), kept.size());
                }
                out.appendU8(static_cast<uint8_t>(kept.size()));
                out.appendString(kept);
                break;
            }
        }
    }

    yinfo("encodeDrawing: {} shapes, class {}, {} bytes",
          shapes.size(), plan.coordClass, out.size());
    return Ok(out.take());
}

} // namespace mapink
