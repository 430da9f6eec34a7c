#pragma once

#include <mapink/result.hpp>
#include <mapink/shape.h>
#include <string>

namespace mapink {

// Document layout:
//
//   map: regular-main-branch
//   stroke-width: 5
//   shapes:
//     - type: polygon
//       pos: [0, 0, 100, 0, 100, 100]
//       color: "#22c55e"
//       filled: true
//     - type: text
//       pos: [50, 50]
//       text: Boss
//       font-size: 24
// Values used where the document leaves a field out
struct DrawingDefaults {
    std::string mapName;
    float strokeWidth = 5.0f;
    float fontSize = 16.0f;
};

Result<Drawing> parseDrawingYaml(const std::string& yaml,
                                 const DrawingDefaults& defaults = {});

std::string drawingToYaml(const Drawing& drawing);
std::string drawingToYaml(const DecodedDrawing& drawing);

} // namespace mapink
