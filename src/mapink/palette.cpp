#include <mapink/palette.h>

#include <cmath>

namespace mapink {

namespace {

template<size_t N>
uint8_t nearestIndex(const std::array<float, N>& table, float value) {
    uint8_t best = 0;
    float bestDist = std::fabs(table[0] - value);
    for (size_t i = 1; i < N; i++) {
        float dist = std::fabs(table[i] - value);
        if (dist < bestDist) {
            bestDist = dist;
            best = static_cast<uint8_t>(i);
        }
    }
    return best;
}

} // namespace

uint8_t nearestStrokeIndex(float width) {
    return nearestIndex(STROKE_WIDTHS, width);
}

uint8_t nearestFontSizeIndex(float size) {
    return nearestIndex(FONT_SIZES, size);
}

ColorCode encodeColor(const Rgb& color) {
    for (uint8_t i = 0; i < COLOR_ESCAPE; i++) {
        if (COLOR_PALETTE[i] == color) {
            return {i, 0, {}};
        }
    }
    if (COLOR_PALETTE[COLOR_ESCAPE] == color) {
        return {COLOR_ESCAPE, ESCAPE_MODE_DEFAULT, {}};
    }
    return {COLOR_ESCAPE, ESCAPE_MODE_RGB, color};
}

} // namespace mapink
