#pragma once

#include <mapink/shape.h>
#include <array>
#include <cstdint>

namespace mapink {

//=============================================================================
// Quantization tables shared by encoder and decoder
//=============================================================================

static constexpr uint8_t COLOR_ESCAPE = 7;
static constexpr uint8_t ESCAPE_MODE_DEFAULT = 0;
static constexpr uint8_t ESCAPE_MODE_RGB = 1;

static constexpr std::array<Rgb, 8> COLOR_PALETTE = {{
    {0xFF, 0xFF, 0xFF}, // white
    {0xEF, 0x44, 0x44}, // red
    {0xF9, 0x73, 0x16}, // orange
    {0xEA, 0xB3, 0x08}, // yellow
    {0x22, 0xC5, 0x5E}, // green
    {0x06, 0xB6, 0xD4}, // cyan
    {0x3B, 0x82, 0xF6}, // blue
    {0x8B, 0x5C, 0xF6}, // violet, reached through the escape
}};

static constexpr std::array<float, 4> STROKE_WIDTHS = {2.0f, 5.0f, 10.0f, 15.0f};
static constexpr std::array<float, 4> FONT_SIZES = {12.0f, 16.0f, 24.0f, 32.0f};
static constexpr std::array<float, 4> FILL_ALPHAS = {0.25f, 0.5f, 0.75f, 1.0f};

static constexpr float DEFAULT_STROKE_WIDTH = 5.0f;
static constexpr float DEFAULT_FONT_SIZE = 16.0f;

// Nearest entry, ties resolve to the lower index
uint8_t nearestStrokeIndex(float width);
uint8_t nearestFontSizeIndex(float size);

// How a color lands in a shape header
struct ColorCode {
    uint8_t index = 0;         // 0..7
    uint8_t escapeMode = 0;    // valid when index == COLOR_ESCAPE
    Rgb rgb;                   // valid when escapeMode == ESCAPE_MODE_RGB
};

ColorCode encodeColor(const Rgb& color);

} // namespace mapink
