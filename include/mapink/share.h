#pragma once

#include <mapink/result.hpp>
#include <mapink/shape.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

// Base64URL text of the encoded drawing, ready for a URL fragment
Result<std::string> encodeDrawingLink(const Drawing& drawing);

Result<DecodedDrawing> decodeDrawingLink(std::string_view text);

// Complete WebP carrying the encoded drawing and its map name
Result<std::vector<uint8_t>> buildShareImage(const Drawing& drawing);

// WebP or raw codec buffer; empty optional for a WebP without a drawing
Result<std::optional<DecodedDrawing>> importDrawingBlob(const std::vector<uint8_t>& bytes);

enum class InputFormat : uint8_t {
    Webp,      // RIFF/WEBP magic
    LinkText,  // base64 alphabet (either variant) and padding, whitespace around it
    Binary,    // anything else, taken as a raw codec buffer
};

InputFormat detectInputFormat(const std::vector<uint8_t>& bytes);

// Raw codec buffer from a WebP, link text or raw input
Result<std::vector<uint8_t>> loadCodecBytes(const std::vector<uint8_t>& input);

} // namespace mapink
