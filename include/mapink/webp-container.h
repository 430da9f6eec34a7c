#pragma once

#include <mapink/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mapink {

//=============================================================================
// WebP container carrying a drawing
//
// Private chunks after the image data:
//   NOIT  encoded drawing buffer
//   NMAP  map name, UTF-8
// Image viewers skip chunks they do not know.
//=============================================================================

static constexpr const char* FOURCC_DRAWING = "NOIT";
static constexpr const char* FOURCC_MAP_NAME = "NMAP";
static constexpr const char* FORM_WEBP = "WEBP";

struct ExtractedDrawing {
    // Absent when the image carries no drawing
    std::optional<std::vector<uint8_t>> drawing;
    std::optional<std::string> mapName;
    // A private chunk ran past the end of the file
    bool truncated = false;
};

// RIFF/WEBP with a built-in 1x1 lossy frame followed by NOIT and NMAP
Result<std::vector<uint8_t>> buildWebpContainer(const std::vector<uint8_t>& drawing,
                                                std::string_view mapName);

// Keeps the image chunks of webp, replaces any earlier NOIT/NMAP
Result<std::vector<uint8_t>> embedInWebp(const std::vector<uint8_t>& webp,
                                         const std::vector<uint8_t>& drawing,
                                         std::string_view mapName);

Result<ExtractedDrawing> extractFromWebp(const std::vector<uint8_t>& bytes);

bool isWebp(const std::vector<uint8_t>& bytes);

} // namespace mapink
