#include <mapink/shape.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <random>

namespace mapink {

namespace {

struct TypeEntry {
    ShapeType type;
    const char* name;
    size_t arity;
};

constexpr std::array<TypeEntry, 10> TYPE_TABLE = {{
    {ShapeType::Point, "point", 2},
    {ShapeType::Circle, "circle", 3},
    {ShapeType::Line, "line", 4},
    {ShapeType::ArrowLine, "arrow_line", 4},
    {ShapeType::Rect, "rect", 4},
    {ShapeType::Ellipse, "ellipse", 4},
    {ShapeType::Path, "path", 0},
    {ShapeType::ClosedPath, "closed_path", 0},
    {ShapeType::Polygon, "polygon", 0},
    {ShapeType::Text, "text", 2},
}};

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

//=============================================================================
// ShapeType
//=============================================================================

const char* shapeTypeName(ShapeType type) {
    auto code = static_cast<size_t>(type);
    return code < TYPE_TABLE.size() ? TYPE_TABLE[code].name : "unknown";
}

std::optional<ShapeType> shapeTypeFromName(std::string_view name) {
    for (const auto& entry : TYPE_TABLE) {
        if (name == entry.name) return entry.type;
    }
    return std::nullopt;
}

std::optional<ShapeType> shapeTypeFromCode(uint8_t code) {
    if (code >= TYPE_TABLE.size()) return std::nullopt;
    return TYPE_TABLE[code].type;
}

bool isPolyline(ShapeType type) {
    return type == ShapeType::Path || type == ShapeType::ClosedPath ||
           type == ShapeType::Polygon;
}

size_t shapeArity(ShapeType type) {
    auto code = static_cast<size_t>(type);
    return code < TYPE_TABLE.size() ? TYPE_TABLE[code].arity : 0;
}

//=============================================================================
// Rgb
//=============================================================================

std::optional<Rgb> Rgb::parse(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') hex.remove_prefix(1);

    std::string expanded;
    if (hex.size() == 3) {
        expanded = {hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
        hex = expanded;
    }
    if (hex.size() != 6) return std::nullopt;

    uint8_t channels[3];
    for (size_t i = 0; i < 3; i++) {
        int hi = hexDigit(hex[i * 2]);
        int lo = hexDigit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Rgb{channels[0], channels[1], channels[2]};
}

std::string Rgb::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

//=============================================================================
// Shape constructors
//=============================================================================

Shape Shape::point(double x, double y, Rgb color) {
    Shape s;
    s.type = ShapeType::Point;
    s.pos = {x, y};
    s.color = color;
    return s;
}

Shape Shape::circle(double cx, double cy, double r, Rgb color) {
    Shape s;
    s.type = ShapeType::Circle;
    s.pos = {cx, cy, r};
    s.color = color;
    return s;
}

Shape Shape::line(double x1, double y1, double x2, double y2, Rgb color) {
    Shape s;
    s.type = ShapeType::Line;
    s.pos = {x1, y1, x2, y2};
    s.color = color;
    return s;
}

Shape Shape::rect(double x, double y, double w, double h, Rgb color) {
    Shape s;
    s.type = ShapeType::Rect;
    s.pos = {x, y, w, h};
    s.color = color;
    return s;
}

Shape Shape::polyline(ShapeType type, std::vector<double> pos, Rgb color) {
    Shape s;
    s.type = type;
    s.pos = std::move(pos);
    s.color = color;
    return s;
}

Shape Shape::text(double x, double y, std::string text, float fontSize, Rgb color) {
    Shape s;
    s.type = ShapeType::Text;
    s.pos = {x, y};
    s.color = color;
    s.style = TextStyle{fontSize, std::move(text)};
    return s;
}

//=============================================================================
// Identifiers
//=============================================================================

std::string newShapeId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    uint64_t hi = engine();
    uint64_t lo = engine();
    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(hi >> 32),
                  static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                  static_cast<uint32_t>(hi & 0xFFFF),
                  static_cast<uint32_t>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return buf;
}

} // namespace mapink
