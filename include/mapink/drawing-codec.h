#pragma once

#include <mapink/result.hpp>
#include <mapink/shape.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

//=============================================================================
// Binary drawing codec
//
// Layout (version 1, all multi-byte fields little-endian):
//   flags:1       bits0-2 version, bit3 reserved, bits4-5 coordinate class
//   scale:1       always 1
//   xOrigin:4     int32
//   yOrigin:4     int32
//   nameLen:1 name:n
//   shapeCount:1
//   style table   ceil(count/4) bytes, 2 bits per shape
//   shapes        header byte (type | color<<4 | filled<<7), optional
//                 escape color, geometry in coordinate-class width
//
// Version 0 differs only in polyline framing. Version 5 is the offline
// exporter's fixed int32 layout and is read, never written.
//=============================================================================

static constexpr uint8_t FORMAT_VERSION = 1;
static constexpr uint8_t FORMAT_VERSION_V0 = 0;
static constexpr uint8_t LEGACY_EXPORT_VERSION = 5;

static constexpr uint8_t FLAG_VERSION_MASK = 0x07;
static constexpr uint8_t FLAG_RESERVED = 0x08;
static constexpr uint8_t FLAG_CLASS_SHIFT = 4;
static constexpr uint8_t FLAG_CLASS_MASK = 0x30;

static constexpr uint8_t POLYLINE_DELTA16 = 0x01;
static constexpr uint8_t POLYLINE_DELTA32 = 0x02;
static constexpr uint8_t V0_POLYLINE_DELTA16 = 0x80;
static constexpr uint8_t V0_POLYLINE_COUNT_MASK = 0x7F;

static constexpr size_t MAX_SHAPES = 255;
static constexpr size_t MAX_MAP_NAME_BYTES = 255;
static constexpr size_t MAX_TEXT_BYTES = 255;
static constexpr size_t MAX_POLYLINE_VERTICES = 65535;
static constexpr size_t MIN_HEADER_SIZE = 12;
// version, name length, u32 shape count
static constexpr size_t MIN_LEGACY_HEADER_SIZE = 6;

Result<std::vector<uint8_t>> encodeDrawing(const Drawing& drawing);

// Truncation mid-stream is not an error: the result carries the shapes read
// so far with truncated = true.
Result<DecodedDrawing> decodeDrawing(const uint8_t* data, size_t size);
Result<DecodedDrawing> decodeDrawing(const std::vector<uint8_t>& bytes);

// Header fields only, for diagnostics
struct DrawingHeader {
    uint8_t version = 0;
    uint8_t coordClass = 0;
    int32_t xOrigin = 0;
    int32_t yOrigin = 0;
    std::string mapName;
    uint32_t shapeCount = 0;
};

Result<DrawingHeader> readDrawingHeader(const std::vector<uint8_t>& bytes);

// Longest prefix of at most maxBytes that does not split a UTF-8 sequence
std::string_view truncateUtf8(std::string_view text, size_t maxBytes);

} // namespace mapink
