#pragma once

#include "byte-io.h"
#include <mapink/result.hpp>
#include <mapink/shape.h>
#include <cstdint>
#include <string>
#include <vector>

namespace mapink {

// Shape header byte plus the escape color that may follow it
struct ShapeRecordHeader {
    ShapeType type = ShapeType::Point;
    Rgb color;
    bool filled = false;
};

// False when the buffer ends or the record is unreadable; reason says which
bool readShapeRecordHeader(ByteCursor& cursor, ShapeRecordHeader& out, std::string& reason);

void writeShapeRecordHeader(ByteWriter& writer, const Shape& shape);

// 2-bit entry i of a packed table, low bits first
inline uint8_t packedIndex(const std::vector<uint8_t>& table, size_t i) {
    return static_cast<uint8_t>((table[i / 4] >> ((i % 4) * 2)) & 0x03);
}

inline size_t packedTableSize(size_t count) { return (count + 3) / 4; }

// Fresh shape with a new id and the style matching its type
Shape makeDecodedShape(const ShapeRecordHeader& header, uint8_t styleIdx);

// Stroke width of the first non-text shape, else the default
float ambientStrokeWidth(const std::vector<Shape>& shapes);

// Version 5 body, cursor positioned after the version byte
Result<DecodedDrawing> decodeLegacyExport(ByteCursor& cursor);

} // namespace mapink
