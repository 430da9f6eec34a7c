#pragma once

#include <mapink/result.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

//=============================================================================
// RIFF chunk layer
//
// File: "RIFF" size:4 LE formType:4, then chunks
// Chunk: fourcc:4 size:4 LE data, plus one pad byte when size is odd
//=============================================================================

static constexpr size_t RIFF_HEADER_SIZE = 12;
static constexpr size_t CHUNK_HEADER_SIZE = 8;

struct RiffChunk {
    std::string fourcc;
    const uint8_t* data = nullptr;
    // Bytes present; less than declaredSize when truncated
    size_t size = 0;
    uint32_t declaredSize = 0;
    size_t offset = 0;
    bool truncated = false;

    std::vector<uint8_t> bytes() const { return std::vector<uint8_t>(data, data + size); }
};

struct RiffFile {
    std::string formType;
    uint32_t declaredSize = 0;
    std::vector<RiffChunk> chunks;

    const RiffChunk* find(std::string_view fourcc) const;
};

// Appends one chunk (header, data, pad)
void appendChunk(std::vector<uint8_t>& out, std::string_view fourcc,
                 const uint8_t* data, size_t size);
void appendChunk(std::vector<uint8_t>& out, std::string_view fourcc,
                 const std::vector<uint8_t>& data);

// Chunk views point into bytes, which must outlive the result
Result<RiffFile> parseRiff(const std::vector<uint8_t>& bytes);

bool isRiff(const uint8_t* data, size_t size);

// Rewrites the size field from the buffer length
void patchRiffSize(std::vector<uint8_t>& file);

} // namespace mapink
