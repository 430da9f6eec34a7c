#include <mapink/riff.h>
#include <mapink/webp-container.h>
#include <ytrace/ytrace.hpp>

#include <array>
#include <cstring>

namespace mapink {

namespace {

// Keyframe of a single lossy pixel: frame tag, start code, 1x1, partitions
constexpr std::array<uint8_t, 22> VP8_1X1_FRAME = {
    0x30, 0x01, 0x00, 0x9d, 0x01, 0x2a, 0x01, 0x00, 0x01, 0x00, 0x0e,
    0xc0, 0xfe, 0x25, 0xa4, 0x00, 0x03, 0x70, 0x00, 0x00, 0x00, 0x00,
};

bool isImageChunk(const std::string& fourcc) {
    return fourcc == "VP8 " || fourcc == "VP8L" || fourcc == "VP8X";
}

std::vector<uint8_t> riffHeader() {
    std::vector<uint8_t> out = {'R', 'I', 'F', 'F', 0, 0, 0, 0};
    out.insert(out.end(), FORM_WEBP, FORM_WEBP + 4);
    return out;
}

void appendDrawingChunks(std::vector<uint8_t>& out, const std::vector<uint8_t>& drawing,
                         std::string_view mapName) {
    appendChunk(out, FOURCC_DRAWING, drawing);
    appendChunk(out, FOURCC_MAP_NAME, reinterpret_cast<const uint8_t*>(mapName.data()),
                mapName.size());
    patchRiffSize(out);
}

} // namespace

bool isWebp(const std::vector<uint8_t>& bytes) {
    return isRiff(bytes.data(), bytes.size()) && std::memcmp(bytes.data() + 8, FORM_WEBP, 4) == 0;
}

Result<std::vector<uint8_t>> buildWebpContainer(const std::vector<uint8_t>& drawing,
                                                std::string_view mapName) {
    if (drawing.empty()) {
        return Err<std::vector<uint8_t>>("buildWebpContainer: empty drawing buffer");
    }

    auto out = riffHeader();
    appendChunk(out, "VP8 ", VP8_1X1_FRAME.data(), VP8_1X1_FRAME.size());
    appendDrawingChunks(out, drawing, mapName);

    ydebug("buildWebpContainer: {} drawing bytes, {} total", drawing.size(), out.size());
    return Ok(std::move(out));
}

Result<std::vector<uint8_t>> embedInWebp(const std::vector<uint8_t>& webp,
                                         const std::vector<uint8_t>& drawing,
                                         std::string_view mapName) {
    if (drawing.empty()) {
        return Err<std::vector<uint8_t>>("embedInWebp: empty drawing buffer");
    }
    if (!isWebp(webp)) {
        return Err<std::vector<uint8_t>>("embedInWebp: input is not a WebP file");
    }
    auto riff = parseRiff(webp);
    if (!riff) {
        return Err<std::vector<uint8_t>>("embedInWebp: cannot parse input", riff);
    }

    auto out = riffHeader();
    bool hasImage = false;
    for (const auto& chunk : riff->chunks) {
        if (chunk.fourcc == FOURCC_DRAWING || chunk.fourcc == FOURCC_MAP_NAME) {
            ydebug("embedInWebp: replacing existing {} chunk", chunk.fourcc);
            continue;
        }
        if (chunk.truncated) {
            return Err<std::vector<uint8_t>>("embedInWebp: chunk " + chunk.fourcc +
                                             " is truncated");
        }
        hasImage = hasImage || isImageChunk(chunk.fourcc);
        appendChunk(out, chunk.fourcc, chunk.data, chunk.size);
    }
    if (!hasImage) {
        return Err<std::vector<uint8_t>>("embedInWebp: input has no VP8, VP8L or VP8X chunk");
    }

    appendDrawingChunks(out, drawing, mapName);
    yinfo("embedInWebp: {} byte image, {} byte drawing, {} bytes out",
          webp.size(), drawing.size(), out.size());
    return Ok(std::move(out));
}

Result<ExtractedDrawing> extractFromWebp(const std::vector<uint8_t>& bytes) {
    if (!isWebp(bytes)) {
        return Err<ExtractedDrawing>("extractFromWebp: not a RIFF/WEBP file");
    }
    auto riff = parseRiff(bytes);
    if (!riff) {
        return Err<ExtractedDrawing>("extractFromWebp: cannot parse container", riff);
    }

    ExtractedDrawing result;
    if (auto chunk = riff->find(FOURCC_DRAWING)) {
        result.drawing = chunk->bytes();
        result.truncated = result.truncated || chunk->truncated;
    }
    if (auto chunk = riff->find(FOURCC_MAP_NAME)) {
        result.mapName = std::string(reinterpret_cast<const char*>(chunk->data), chunk->size);
        result.truncated = result.truncated || chunk->truncated;
    }

    if (!result.drawing) {
        ydebug("extractFromWebp: no {} chunk", FOURCC_DRAWING);
    } else if (result.truncated) {
        ywarn("extractFromWebp: embedded drawing is cut short");
    }
    return Ok(std::move(result));
}

} // namespace mapink
