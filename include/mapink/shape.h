#pragma once

#include <mapink/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mapink {

//=============================================================================
// ShapeType: closed set of drawable primitives
//
// Enumerator values are the 4-bit wire type codes.
//=============================================================================
enum class ShapeType : uint8_t {
    Point = 0,
    Circle = 1,
    Line = 2,
    ArrowLine = 3,
    Rect = 4,
    Ellipse = 5,
    Path = 6,
    ClosedPath = 7,
    Polygon = 8,
    Text = 9,
};

// "point", "arrow_line", ...
const char* shapeTypeName(ShapeType type);
std::optional<ShapeType> shapeTypeFromName(std::string_view name);
std::optional<ShapeType> shapeTypeFromCode(uint8_t code);

bool isPolyline(ShapeType type);

// Minimum number of pos values the type needs (polylines: 0, must be even)
size_t shapeArity(ShapeType type);

//=============================================================================
// Rgb
//=============================================================================
struct Rgb {
    uint8_t r = 0xFF;
    uint8_t g = 0xFF;
    uint8_t b = 0xFF;

    bool operator==(const Rgb&) const = default;

    // Accepts "#rrggbb", "rrggbb", "#rgb" (case-insensitive)
    static std::optional<Rgb> parse(std::string_view hex);

    // Always lower-case "#rrggbb"
    std::string hex() const;
};

//=============================================================================
// Style: tagged per shape type
//
// Text shapes carry a font size and their string; every other shape carries
// a stroke width. An unset width falls back to the drawing's default.
//=============================================================================
struct StrokeStyle {
    std::optional<float> width;

    bool operator==(const StrokeStyle&) const = default;
};

struct TextStyle {
    float fontSize = 16.0f;
    std::string text;

    bool operator==(const TextStyle&) const = default;
};

using ShapeStyle = std::variant<StrokeStyle, TextStyle>;

//=============================================================================
// Shape
//=============================================================================
struct Shape {
    std::string id;
    ShapeType type = ShapeType::Point;
    // point: x,y  circle: cx,cy,r  line: x1,y1,x2,y2  rect/ellipse: x,y,w,h
    // polylines: x0,y0,x1,y1,...  text: x,y
    std::vector<double> pos;
    Rgb color;
    bool filled = false;
    std::optional<float> fillAlpha;
    ShapeStyle style;

    const StrokeStyle* stroke() const { return std::get_if<StrokeStyle>(&style); }
    const TextStyle* textStyle() const { return std::get_if<TextStyle>(&style); }

    static Shape point(double x, double y, Rgb color = {});
    static Shape circle(double cx, double cy, double r, Rgb color = {});
    static Shape line(double x1, double y1, double x2, double y2, Rgb color = {});
    static Shape rect(double x, double y, double w, double h, Rgb color = {});
    static Shape polyline(ShapeType type, std::vector<double> pos, Rgb color = {});
    static Shape text(double x, double y, std::string text,
                      float fontSize = 16.0f, Rgb color = {});
};

// Random UUID v4 text, one per call
std::string newShapeId();

//=============================================================================
// Drawing: what gets encoded
//=============================================================================
struct Drawing {
    std::vector<Shape> shapes;
    std::string mapName;
    float strokeWidth = 5.0f;
};

//=============================================================================
// DecodedDrawing: what the decoder recovers
//=============================================================================
struct DecodedDrawing {
    std::vector<Shape> shapes;
    std::string mapName;
    float strokeWidth = 5.0f;
    uint8_t version = 0;
    // Buffer ended (or became unreadable) before every declared shape was read
    bool truncated = false;
    uint32_t declaredShapeCount = 0;
};

} // namespace mapink
