#include <mapink/coord-plan.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace mapink {

namespace {

struct Bounds {
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool empty = true;

    void add(double x, double y) {
        minX = std::min(minX, x);
        minY = std::min(minY, y);
        maxX = std::max(maxX, x);
        maxY = std::max(maxY, y);
        empty = false;
    }
};

// Every absolute coordinate the encoder writes for the shape
void addShape(Bounds& b, const Shape& shape) {
    const auto& p = shape.pos;
    switch (shape.type) {
        case ShapeType::Circle:
            b.add(p[0], p[1]);
            b.add(p[0] + p[2], p[1]);
            break;
        case ShapeType::Rect:
        case ShapeType::Ellipse:
            b.add(p[0], p[1]);
            b.add(p[0] + p[2], p[1] + p[3]);
            break;
        case ShapeType::Line:
        case ShapeType::ArrowLine:
            b.add(p[0], p[1]);
            b.add(p[2], p[3]);
            break;
        case ShapeType::Path:
        case ShapeType::ClosedPath:
        case ShapeType::Polygon:
            for (size_t i = 0; i + 1 < p.size(); i += 2) {
                b.add(p[i], p[i + 1]);
            }
            break;
        case ShapeType::Point:
        case ShapeType::Text:
            b.add(p[0], p[1]);
            break;
    }
}

bool fitsInt32(double v) {
    return std::isfinite(v) &&
           v >= static_cast<double>(std::numeric_limits<int32_t>::min()) &&
           v <= static_cast<double>(std::numeric_limits<int32_t>::max());
}

} // namespace

Result<CoordPlan> planCoordinates(const std::vector<Shape>& shapes) {
    Bounds bounds;
    for (size_t i = 0; i < shapes.size(); i++) {
        const auto& shape = shapes[i];
        if (shape.pos.size() < shapeArity(shape.type)) {
            return Err<CoordPlan>("planCoordinates: shape " + std::to_string(i) + " (" +
                                  shapeTypeName(shape.type) + ") has too few coordinates");
        }
        addShape(bounds, shape);
    }

    CoordPlan plan;
    if (bounds.empty) {
        return Ok(plan);
    }

    double xMin = std::floor(bounds.minX);
    double yMin = std::floor(bounds.minY);
    double xMax = std::ceil(bounds.maxX);
    double yMax = std::ceil(bounds.maxY);

    if (!fitsInt32(xMin) || !fitsInt32(yMin) || !fitsInt32(xMax) || !fitsInt32(yMax)) {
        return Err<CoordPlan>("planCoordinates: coordinates outside int32 range");
    }

    plan.xOrigin = static_cast<int32_t>(xMin);
    plan.yOrigin = static_cast<int32_t>(yMin);

    int64_t spanX = static_cast<int64_t>(xMax) - plan.xOrigin;
    int64_t spanY = static_cast<int64_t>(yMax) - plan.yOrigin;
    plan.span = std::max<int64_t>({spanX, spanY, 1});

    if (plan.span <= CLASS0_MAX_SPAN) {
        plan.coordClass = 0;
    } else if (plan.span <= CLASS1_MAX_SPAN) {
        plan.coordClass = 1;
    } else if (plan.span <= std::numeric_limits<int32_t>::max()) {
        plan.coordClass = 2;
    } else {
        return Err<CoordPlan>("planCoordinates: span " + std::to_string(plan.span) +
                              " does not fit 32-bit offsets");
    }

    ydebug("planCoordinates: origin=({}, {}) span={} class={}",
           plan.xOrigin, plan.yOrigin, plan.span, plan.coordClass);
    return Ok(plan);
}

} // namespace mapink
