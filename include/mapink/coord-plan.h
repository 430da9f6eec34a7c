#pragma once

#include <mapink/result.hpp>
#include <mapink/shape.h>
#include <cstdint>
#include <vector>

namespace mapink {

//=============================================================================
// CoordPlan: coordinate class and origin chosen for one drawing
//
// Class 0 stores coordinates as u8, class 1 as u16 LE, class 2 as i32 LE,
// all relative to (xOrigin, yOrigin).
//=============================================================================
struct CoordPlan {
    int32_t xOrigin = 0;
    int32_t yOrigin = 0;
    uint8_t coordClass = 0;
    uint8_t scale = 1;
    int64_t span = 1;

    size_t coordBytes() const { return coordBytesForClass(coordClass); }

    static size_t coordBytesForClass(uint8_t coordClass) {
        return coordClass == 0 ? 1 : coordClass == 1 ? 2 : 4;
    }
};

static constexpr int64_t CLASS0_MAX_SPAN = 0xFF;
static constexpr int64_t CLASS1_MAX_SPAN = 0xFFFF;

// Fails when a shape is too short for its type or the bounds leave int32
Result<CoordPlan> planCoordinates(const std::vector<Shape>& shapes);

} // namespace mapink
