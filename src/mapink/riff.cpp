#include "byte-io.h"
#include <mapink/riff.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstring>

namespace mapink {

const RiffChunk* RiffFile::find(std::string_view fourcc) const {
    for (const auto& chunk : chunks) {
        if (chunk.fourcc == fourcc) return &chunk;
    }
    return nullptr;
}

void appendChunk(std::vector<uint8_t>& out, std::string_view fourcc,
                 const uint8_t* data, size_t size) {
    char tag[4] = {' ', ' ', ' ', ' '};
    std::memcpy(tag, fourcc.data(), std::min<size_t>(fourcc.size(), 4));

    ByteWriter writer;
    writer.appendBytes(tag, 4);
    writer.appendU32(static_cast<uint32_t>(size));
    auto header = writer.take();
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), data, data + size);
    if (size % 2 != 0) {
        out.push_back(0);
    }
}

void appendChunk(std::vector<uint8_t>& out, std::string_view fourcc,
                 const std::vector<uint8_t>& data) {
    appendChunk(out, fourcc, data.data(), data.size());
}

bool isRiff(const uint8_t* data, size_t size) {
    return size >= RIFF_HEADER_SIZE && std::memcmp(data, "RIFF", 4) == 0;
}

void patchRiffSize(std::vector<uint8_t>& file) {
    if (file.size() < RIFF_HEADER_SIZE) return;
    auto size = static_cast<uint32_t>(file.size() - 8);
    file[4] = static_cast<uint8_t>(size & 0xFF);
    file[5] = static_cast<uint8_t>((size >> 8) & 0xFF);
    file[6] = static_cast<uint8_t>((size >> 16) & 0xFF);
    file[7] = static_cast<uint8_t>((size >> 24) & 0xFF);
}

Result<RiffFile> parseRiff(const std::vector<uint8_t>& bytes) {
    if (!isRiff(bytes.data(), bytes.size())) {
        return Err<RiffFile>("parseRiff: not a RIFF file");
    }

    RiffFile file;
    ByteCursor cursor(bytes.data(), bytes.size());
    std::string riffTag;
    if (!cursor.readString(4, riffTag) || !cursor.readU32(file.declaredSize) ||
        !cursor.readString(4, file.formType)) {
        return Err<RiffFile>("parseRiff: truncated RIFF header");
    }

    // Scans to the end of the buffer, not the declared size
    while (cursor.remaining() >= CHUNK_HEADER_SIZE) {
        RiffChunk chunk;
        chunk.offset = cursor.position();
        if (!cursor.readString(4, chunk.fourcc) || !cursor.readU32(chunk.declaredSize)) {
            break;
        }

        size_t available = cursor.remaining();
        chunk.size = std::min<size_t>(chunk.declaredSize, available);
        chunk.truncated = chunk.size < chunk.declaredSize;
        if (!cursor.readBytes(chunk.size, chunk.data)) {
            break;
        }
        if (chunk.truncated) {
            ywarn("parseRiff: chunk {} declares {} bytes, {} present",
                  chunk.fourcc, chunk.declaredSize, chunk.size);
            file.chunks.push_back(std::move(chunk));
            break;
        }

        bool padded = chunk.declaredSize % 2 != 0;
        file.chunks.push_back(std::move(chunk));
        if (padded) {
            uint8_t pad;
            if (!cursor.readU8(pad)) break;
        }
    }

    ydebug("parseRiff: form {} with {} chunks", file.formType, file.chunks.size());
    return Ok(std::move(file));
}

} // namespace mapink
