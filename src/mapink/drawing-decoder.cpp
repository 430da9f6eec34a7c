#include "codec-internal.h"
#include <mapink/coord-plan.h>
#include <mapink/drawing-codec.h>
#include <mapink/palette.h>
#include <ytrace/ytrace.hpp>

namespace mapink {

namespace {

//=============================================================================
// Polyline framing: selected once per buffer from the version
//=============================================================================

struct PolylineFraming {
    size_t vertexCount = 0;
    size_t deltaWidth = 1;
};

using PolylineFramingReader = bool (*)(ByteCursor&, PolylineFraming&);

// v0: one byte, bit7 = 2-byte deltas, bits0-6 = vertex count
bool readPolylineFramingV0(ByteCursor& cursor, PolylineFraming& out) {
    uint8_t b;
    if (!cursor.readU8(b)) return false;
    out.vertexCount = b & V0_POLYLINE_COUNT_MASK;
    out.deltaWidth = (b & V0_POLYLINE_DELTA16) ? 2 : 1;
    return true;
}

// v1: flag byte, u16 vertex count
bool readPolylineFramingV1(ByteCursor& cursor, PolylineFraming& out) {
    uint8_t flag;
    uint16_t count;
    if (!cursor.readU8(flag) || !cursor.readU16(count)) return false;
    out.vertexCount = count;
    out.deltaWidth = (flag & POLYLINE_DELTA32) ? 4 : (flag & POLYLINE_DELTA16) ? 2 : 1;
    return true;
}

//=============================================================================
// Header
//=============================================================================

struct HeaderState {
    DrawingHeader header;
    uint8_t scale = 1;
    bool complete = false;
};

Result<HeaderState> readAdaptiveHeader(ByteCursor& cursor, size_t size) {
    HeaderState state;
    uint8_t flags = 0;
    if (!cursor.readU8(flags)) {
        return Err<HeaderState>("decodeDrawing: empty buffer");
    }
    state.header.version = flags & FLAG_VERSION_MASK;
    if (size < MIN_HEADER_SIZE) {
        return Err<HeaderState>("decodeDrawing: buffer of " + std::to_string(size) +
                                " bytes is shorter than the header");
    }
    if (flags & FLAG_RESERVED) {
        return Err<HeaderState>("decodeDrawing: reserved flag bit set");
    }
    state.header.coordClass = (flags & FLAG_CLASS_MASK) >> FLAG_CLASS_SHIFT;
    if (state.header.coordClass > 2) {
        return Err<HeaderState>("decodeDrawing: invalid coordinate class 3");
    }

    uint8_t nameLen = 0;
    if (!cursor.readU8(state.scale) || !cursor.readI32(state.header.xOrigin) ||
        !cursor.readI32(state.header.yOrigin) || !cursor.readU8(nameLen)) {
        return Ok(state);
    }
    if (state.scale == 0) state.scale = 1;

    if (!cursor.readString(nameLen, state.header.mapName)) {
        return Ok(state);
    }
    uint8_t count = 0;
    if (!cursor.readU8(count)) {
        return Ok(state);
    }
    state.header.shapeCount = count;
    state.complete = true;
    return Ok(state);
}

//=============================================================================
// Shape records
//=============================================================================

class GeometryReader {
public:
    GeometryReader(ByteCursor& cursor, const DrawingHeader& header, uint8_t scale)
        : _cursor(cursor), _header(header), _scale(scale),
          _width(CoordPlan::coordBytesForClass(header.coordClass)) {}

    bool x(double& out) { return coord(_header.xOrigin, out); }
    bool y(double& out) { return coord(_header.yOrigin, out); }

    bool polyline(const PolylineFraming& framing, std::vector<double>& out) {
        out.clear();
        if (framing.vertexCount == 0) return true;

        int64_t qx, qy;
        if (!_cursor.readCoord(_width, qx) || !_cursor.readCoord(_width, qy)) return false;
        out.reserve(framing.vertexCount * 2);
        out.push_back(toWorld(_header.xOrigin, qx));
        out.push_back(toWorld(_header.yOrigin, qy));

        for (size_t i = 1; i < framing.vertexCount; i++) {
            int64_t dx, dy;
            if (!_cursor.readSigned(framing.deltaWidth, dx) ||
                !_cursor.readSigned(framing.deltaWidth, dy)) {
                return false;
            }
            qx += dx;
            qy += dy;
            out.push_back(toWorld(_header.xOrigin, qx));
            out.push_back(toWorld(_header.yOrigin, qy));
        }
        return true;
    }

private:
    bool coord(int32_t origin, double& out) {
        int64_t q;
        if (!_cursor.readCoord(_width, q)) return false;
        out = toWorld(origin, q);
        return true;
    }

    double toWorld(int32_t origin, int64_t q) const {
        return static_cast<double>(origin) + static_cast<double>(q) * _scale;
    }

    ByteCursor& _cursor;
    const DrawingHeader& _header;
    uint8_t _scale;
    size_t _width;
};

// False when the record could not be read completely
bool readGeometry(GeometryReader& geom, ByteCursor& cursor, PolylineFramingReader framingReader,
                  Shape& shape) {
    auto& p = shape.pos;
    switch (shape.type) {
        case ShapeType::Point: {
            p.resize(2);
            return geom.x(p[0]) && geom.y(p[1]);
        }
        case ShapeType::Circle: {
            double edge;
            p.resize(3);
            if (!geom.x(p[0]) || !geom.y(p[1]) || !geom.x(edge)) return false;
            p[2] = edge - p[0];
            return true;
        }
        case ShapeType::Line:
        case ShapeType::ArrowLine: {
            p.resize(4);
            return geom.x(p[0]) && geom.y(p[1]) && geom.x(p[2]) && geom.y(p[3]);
        }
        case ShapeType::Rect:
        case ShapeType::Ellipse: {
            double x2, y2;
            p.resize(4);
            if (!geom.x(p[0]) || !geom.y(p[1]) || !geom.x(x2) || !geom.y(y2)) return false;
            p[2] = x2 - p[0];
            p[3] = y2 - p[1];
            return true;
        }
        case ShapeType::Path:
        case ShapeType::ClosedPath:
        case ShapeType::Polygon: {
            PolylineFraming framing;
            return framingReader(cursor, framing) && geom.polyline(framing, p);
        }
        case ShapeType::Text: {
            uint8_t len;
            p.resize(2);
            if (!geom.x(p[0]) || !geom.y(p[1]) || !cursor.readU8(len)) return false;
            auto& style = std::get<TextStyle>(shape.style);
            return cursor.readString(len, style.text);
        }
    }
    return false;
}

Result<DecodedDrawing> decodeAdaptive(ByteCursor& cursor, size_t size) {
    auto headerRes = readAdaptiveHeader(cursor, size);
    if (!headerRes) {
        return Result<DecodedDrawing>(headerRes.error());
    }
    const HeaderState& state = *headerRes;
    const DrawingHeader& header = state.header;

    DecodedDrawing result;
    result.version = header.version;
    result.mapName = header.mapName;
    result.declaredShapeCount = header.shapeCount;

    if (!state.complete) {
        ywarn("decodeDrawing: buffer ends inside the header");
        result.truncated = true;
        return Ok(std::move(result));
    }

    std::vector<uint8_t> styles;
    const uint8_t* styleBytes = nullptr;
    if (!cursor.readBytes(packedTableSize(header.shapeCount), styleBytes)) {
        ywarn("decodeDrawing: buffer ends inside the style table");
        result.truncated = true;
        return Ok(std::move(result));
    }
    styles.assign(styleBytes, styleBytes + packedTableSize(header.shapeCount));

    PolylineFramingReader framingReader =
        header.version == FORMAT_VERSION_V0 ? readPolylineFramingV0 : readPolylineFramingV1;
    GeometryReader geom(cursor, header, state.scale);

    for (size_t i = 0; i < header.shapeCount; i++) {
        ShapeRecordHeader record;
        std::string reason;
        if (!readShapeRecordHeader(cursor, record, reason)) {
            ywarn("decodeDrawing: stopped at shape {} of {}: {}", i, header.shapeCount, reason);
            result.truncated = true;
            break;
        }

        Shape shape = makeDecodedShape(record, packedIndex(styles, i));
        if (!readGeometry(geom, cursor, framingReader, shape)) {
            ywarn("decodeDrawing: buffer ends inside shape {} of {}", i, header.shapeCount);
            result.truncated = true;
            break;
        }
        ydebug("decodeDrawing: shape {} {} with {} coordinates",
               i, shapeTypeName(shape.type), shape.pos.size());
        result.shapes.push_back(std::move(shape));
    }

    result.strokeWidth = ambientStrokeWidth(result.shapes);
    return Ok(std::move(result));
}

} // namespace

//=============================================================================
// Shared record helpers
//=============================================================================

bool readShapeRecordHeader(ByteCursor& cursor, ShapeRecordHeader& out, std::string& reason) {
    uint8_t header;
    if (!cursor.readU8(header)) {
        reason = "buffer ends before the shape header";
        return false;
    }
    auto type = shapeTypeFromCode(header & 0x0F);
    if (!type) {
        reason = "unknown type code " + std::to_string(header & 0x0F);
        return false;
    }
    out.type = *type;
    out.filled = (header & 0x80) != 0;

    uint8_t colorIndex = (header >> 4) & 0x07;
    if (colorIndex != COLOR_ESCAPE) {
        out.color = COLOR_PALETTE[colorIndex];
        return true;
    }

    uint8_t mode;
    if (!cursor.readU8(mode)) {
        reason = "buffer ends inside the escape color";
        return false;
    }
    if (mode == ESCAPE_MODE_DEFAULT) {
        out.color = COLOR_PALETTE[COLOR_ESCAPE];
        return true;
    }
    if (mode != ESCAPE_MODE_RGB) {
        reason = "invalid escape mode " + std::to_string(mode);
        return false;
    }
    if (!cursor.readU8(out.color.r) || !cursor.readU8(out.color.g) ||
        !cursor.readU8(out.color.b)) {
        reason = "buffer ends inside the escape color";
        return false;
    }
    return true;
}

Shape makeDecodedShape(const ShapeRecordHeader& header, uint8_t styleIdx) {
    Shape shape;
    shape.id = newShapeId();
    shape.type = header.type;
    shape.color = header.color;
    shape.filled = header.filled;
    if (header.type == ShapeType::Text) {
        shape.style = TextStyle{FONT_SIZES[styleIdx & 0x03], {}};
    } else {
        shape.style = StrokeStyle{STROKE_WIDTHS[styleIdx & 0x03]};
    }
    return shape;
}

float ambientStrokeWidth(const std::vector<Shape>& shapes) {
    for (const auto& shape : shapes) {
        if (auto stroke = shape.stroke(); stroke && stroke->width) {
            return *stroke->width;
        }
    }
    return DEFAULT_STROKE_WIDTH;
}

//=============================================================================
// Public entry points
//=============================================================================

Result<DecodedDrawing> decodeDrawing(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Err<DecodedDrawing>("decodeDrawing: empty buffer");
    }

    // Version 5 has no flag bits, the whole first byte is the version
    if (data[0] == LEGACY_EXPORT_VERSION) {
        if (size < MIN_LEGACY_HEADER_SIZE) {
            return Err<DecodedDrawing>("decodeDrawing: buffer of " + std::to_string(size) +
                                       " bytes is shorter than the version 5 header");
        }
        yinfo("decodeDrawing: importing offline exporter buffer ({} bytes)", size);
        ByteCursor cursor(data + 1, size - 1);
        return decodeLegacyExport(cursor);
    }

    uint8_t version = data[0] & FLAG_VERSION_MASK;
    if (version == FORMAT_VERSION || version == FORMAT_VERSION_V0) {
        ByteCursor cursor(data, size);
        return decodeAdaptive(cursor, size);
    }
    return Err<DecodedDrawing>("decodeDrawing: unsupported version " + std::to_string(version));
}

Result<DecodedDrawing> decodeDrawing(const std::vector<uint8_t>& bytes) {
    return decodeDrawing(bytes.data(), bytes.size());
}

Result<DrawingHeader> readDrawingHeader(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return Err<DrawingHeader>("readDrawingHeader: empty buffer");
    }
    uint8_t version = bytes[0] & FLAG_VERSION_MASK;
    if (version != FORMAT_VERSION && version != FORMAT_VERSION_V0) {
        auto decoded = decodeDrawing(bytes);
        if (!decoded) {
            return Err<DrawingHeader>("readDrawingHeader: cannot read buffer", decoded);
        }
        DrawingHeader header;
        header.version = decoded->version;
        header.coordClass = 2;
        header.mapName = decoded->mapName;
        header.shapeCount = decoded->declaredShapeCount;
        return Ok(header);
    }

    ByteCursor cursor(bytes.data(), bytes.size());
    auto state = readAdaptiveHeader(cursor, bytes.size());
    if (!state) {
        return Err<DrawingHeader>("readDrawingHeader: invalid header", state);
    }
    return Ok(state->header);
}

} // namespace mapink
