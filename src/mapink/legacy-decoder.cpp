#include "codec-internal.h"
#include <mapink/drawing-codec.h>
#include <mapink/palette.h>
#include <ytrace/ytrace.hpp>

namespace mapink {

namespace {

bool readRaw(ByteCursor& cursor, size_t n, std::vector<double>& out) {
    out.resize(n);
    for (size_t i = 0; i < n; i++) {
        int32_t v;
        if (!cursor.readI32(v)) return false;
        out[i] = v;
    }
    return true;
}

// Absolute int32 geometry; rect and ellipse carry width and height
bool readLegacyGeometry(ByteCursor& cursor, Shape& shape) {
    switch (shape.type) {
        case ShapeType::Circle:
            return readRaw(cursor, 3, shape.pos);
        case ShapeType::Line:
        case ShapeType::ArrowLine:
        case ShapeType::Rect:
        case ShapeType::Ellipse:
            return readRaw(cursor, 4, shape.pos);
        case ShapeType::Path:
        case ShapeType::ClosedPath:
        case ShapeType::Polygon: {
            uint16_t count;
            if (!cursor.readU16(count)) return false;
            return readRaw(cursor, static_cast<size_t>(count) * 2, shape.pos);
        }
        case ShapeType::Point:
        case ShapeType::Text:
            return readRaw(cursor, 2, shape.pos);
    }
    return false;
}

} // namespace

Result<DecodedDrawing> decodeLegacyExport(ByteCursor& cursor) {
    DecodedDrawing result;
    result.version = LEGACY_EXPORT_VERSION;

    uint8_t nameLen;
    uint32_t count;
    if (!cursor.readU8(nameLen) || !cursor.readString(nameLen, result.mapName) ||
        !cursor.readU32(count)) {
        return Err<DecodedDrawing>("decodeLegacyExport: buffer ends inside the header");
    }
    result.declaredShapeCount = count;

    const uint8_t* strokeBytes = nullptr;
    const uint8_t* fillBytes = nullptr;
    size_t tableSize = packedTableSize(count);
    if (!cursor.readBytes(tableSize, strokeBytes) || !cursor.readBytes(tableSize, fillBytes)) {
        ywarn("decodeLegacyExport: buffer ends inside the style tables");
        result.truncated = true;
        return Ok(std::move(result));
    }
    std::vector<uint8_t> strokes(strokeBytes, strokeBytes + tableSize);
    std::vector<uint8_t> fills(fillBytes, fillBytes + tableSize);

    for (size_t i = 0; i < count; i++) {
        ShapeRecordHeader record;
        std::string reason;
        if (!readShapeRecordHeader(cursor, record, reason)) {
            ywarn("decodeLegacyExport: stopped at shape {} of {}: {}", i, count, reason);
            result.truncated = true;
            break;
        }

        Shape shape = makeDecodedShape(record, packedIndex(strokes, i));
        if (record.type == ShapeType::Text) {
            shape.style = TextStyle{DEFAULT_FONT_SIZE, {}};
        }
        if (record.filled) {
            shape.fillAlpha = FILL_ALPHAS[packedIndex(fills, i)];
        }
        if (!readLegacyGeometry(cursor, shape)) {
            ywarn("decodeLegacyExport: buffer ends inside shape {} of {}", i, count);
            result.truncated = true;
            break;
        }
        result.shapes.push_back(std::move(shape));
    }

    result.strokeWidth = ambientStrokeWidth(result.shapes);
    yinfo("decodeLegacyExport: imported {} of {} shapes", result.shapes.size(), count);
    return Ok(std::move(result));
}

} // namespace mapink
