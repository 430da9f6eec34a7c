#include <mapink/base64url.h>
#include <mapink/drawing-codec.h>
#include <mapink/share.h>
#include <mapink/webp-container.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cctype>

namespace mapink {

namespace {

std::string_view trimWhitespace(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string_view asText(const std::vector<uint8_t>& bytes) {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

bool isLinkChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
           c == '+' || c == '/' || c == '=';
}

} // namespace

Result<std::string> encodeDrawingLink(const Drawing& drawing) {
    auto encoded = encodeDrawing(drawing);
    if (!encoded) {
        return Err<std::string>("encodeDrawingLink: encode failed", encoded);
    }
    return Ok(base64UrlEncode(*encoded));
}

Result<DecodedDrawing> decodeDrawingLink(std::string_view text) {
    auto bytes = base64UrlDecode(text);
    if (!bytes) {
        return Err<DecodedDrawing>("decodeDrawingLink: bad link text", bytes);
    }
    auto decoded = decodeDrawing(*bytes);
    if (!decoded) {
        return Err<DecodedDrawing>("decodeDrawingLink: decode failed", decoded);
    }
    return decoded;
}

Result<std::vector<uint8_t>> buildShareImage(const Drawing& drawing) {
    auto encoded = encodeDrawing(drawing);
    if (!encoded) {
        return Err<std::vector<uint8_t>>("buildShareImage: encode failed", encoded);
    }
    return buildWebpContainer(*encoded, drawing.mapName);
}

Result<std::optional<DecodedDrawing>> importDrawingBlob(const std::vector<uint8_t>& bytes) {
    if (!isWebp(bytes)) {
        auto decoded = decodeDrawing(bytes);
        if (!decoded) {
            return Err<std::optional<DecodedDrawing>>("importDrawingBlob: decode failed", decoded);
        }
        return Ok(std::optional<DecodedDrawing>(std::move(*decoded)));
    }

    auto extracted = extractFromWebp(bytes);
    if (!extracted) {
        return Err<std::optional<DecodedDrawing>>("importDrawingBlob: bad container", extracted);
    }
    if (!extracted->drawing) {
        yinfo("importDrawingBlob: image carries no drawing");
        return Ok(std::optional<DecodedDrawing>());
    }

    auto decoded = decodeDrawing(*extracted->drawing);
    if (!decoded) {
        return Err<std::optional<DecodedDrawing>>("importDrawingBlob: decode failed", decoded);
    }
    DecodedDrawing drawing = std::move(*decoded);
    if (drawing.mapName.empty() && extracted->mapName) {
        drawing.mapName = *extracted->mapName;
    }
    drawing.truncated = drawing.truncated || extracted->truncated;
    return Ok(std::optional<DecodedDrawing>(std::move(drawing)));
}

//=============================================================================
// Input detection
//=============================================================================

InputFormat detectInputFormat(const std::vector<uint8_t>& bytes) {
    if (isWebp(bytes)) return InputFormat::Webp;
    auto text = trimWhitespace(asText(bytes));
    if (!text.empty() && std::all_of(text.begin(), text.end(), isLinkChar)) {
        return InputFormat::LinkText;
    }
    return InputFormat::Binary;
}

Result<std::vector<uint8_t>> loadCodecBytes(const std::vector<uint8_t>& input) {
    switch (detectInputFormat(input)) {
        case InputFormat::Webp: {
            auto extracted = extractFromWebp(input);
            if (!extracted) {
                return Err<std::vector<uint8_t>>("loadCodecBytes: bad WebP container", extracted);
            }
            if (!extracted->drawing) {
                return Err<std::vector<uint8_t>>("loadCodecBytes: image carries no drawing");
            }
            return Ok(std::move(*extracted->drawing));
        }
        case InputFormat::LinkText: {
            auto bytes = base64UrlDecode(trimWhitespace(asText(input)));
            if (!bytes) {
                return Err<std::vector<uint8_t>>("loadCodecBytes: bad link text", bytes);
            }
            ydebug("loadCodecBytes: link text of {} bytes", bytes->size());
            return bytes;
        }
        case InputFormat::Binary:
            break;
    }
    return Ok(input);
}

} // namespace mapink
