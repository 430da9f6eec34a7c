#include <mapink/palette.h>
#include <mapink/shape-yaml.h>
#include <yaml-cpp/yaml.h>
#include <ytrace/ytrace.hpp>

namespace mapink {

namespace {

//=============================================================================
// Helpers
//=============================================================================

Rgb parseColor(const YAML::Node& node) {
    if (!node) return COLOR_PALETTE[0];
    auto str = node.as<std::string>();
    if (auto rgb = Rgb::parse(str)) return *rgb;
    ywarn("parseDrawingYaml: invalid color '{}', using white", str);
    return COLOR_PALETTE[0];
}

Result<Shape> parseShape(const YAML::Node& item, size_t index, float defaultFontSize) {
    auto where = "shape " + std::to_string(index);
    if (!item.IsMap()) {
        return Err<Shape>(where + ": expected a mapping");
    }
    if (!item["type"]) {
        return Err<Shape>(where + ": missing type");
    }
    auto typeName = item["type"].as<std::string>();
    auto type = shapeTypeFromName(typeName);
    if (!type) {
        return Err<Shape>(where + ": unknown type '" + typeName + "'");
    }
    if (!item["pos"] || !item["pos"].IsSequence()) {
        return Err<Shape>(where + ": missing pos sequence");
    }

    Shape shape;
    shape.type = *type;
    shape.id = item["id"] ? item["id"].as<std::string>() : newShapeId();
    for (const auto& v : item["pos"]) {
        shape.pos.push_back(v.as<double>());
    }
    shape.color = parseColor(item["color"]);
    if (item["filled"]) shape.filled = item["filled"].as<bool>();
    if (item["fill-alpha"]) shape.fillAlpha = item["fill-alpha"].as<float>();

    if (shape.type == ShapeType::Text) {
        TextStyle style;
        style.fontSize = defaultFontSize;
        if (item["font-size"]) style.fontSize = item["font-size"].as<float>();
        if (item["text"]) style.text = item["text"].as<std::string>();
        shape.style = std::move(style);
    } else {
        StrokeStyle style;
        if (item["stroke-width"]) style.width = item["stroke-width"].as<float>();
        shape.style = style;
    }

    ydebug("parseDrawingYaml: {} {} with {} coordinates",
           where, typeName, shape.pos.size());
    return Ok(std::move(shape));
}

void emitShape(YAML::Emitter& out, const Shape& shape) {
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << shapeTypeName(shape.type);
    out << YAML::Key << "pos" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (double v : shape.pos) out << v;
    out << YAML::EndSeq;
    out << YAML::Key << "color" << YAML::Value << YAML::DoubleQuoted << shape.color.hex();
    if (shape.filled) out << YAML::Key << "filled" << YAML::Value << true;
    if (shape.fillAlpha) out << YAML::Key << "fill-alpha" << YAML::Value << *shape.fillAlpha;

    if (auto text = shape.textStyle()) {
        out << YAML::Key << "font-size" << YAML::Value << text->fontSize;
        out << YAML::Key << "text" << YAML::Value << text->text;
    } else if (auto stroke = shape.stroke(); stroke && stroke->width) {
        out << YAML::Key << "stroke-width" << YAML::Value << *stroke->width;
    }
    if (!shape.id.empty()) out << YAML::Key << "id" << YAML::Value << shape.id;
    out << YAML::EndMap;
}

std::string emitDrawing(const std::string& mapName, float strokeWidth,
                        const std::vector<Shape>& shapes) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "map" << YAML::Value << mapName;
    out << YAML::Key << "stroke-width" << YAML::Value << strokeWidth;
    out << YAML::Key << "shapes" << YAML::Value << YAML::BeginSeq;
    for (const auto& shape : shapes) emitShape(out, shape);
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

} // namespace

//=============================================================================
// parseDrawingYaml
//=============================================================================

Result<Drawing> parseDrawingYaml(const std::string& yaml, const DrawingDefaults& defaults) {
    Drawing drawing;
    drawing.mapName = defaults.mapName;
    drawing.strokeWidth = defaults.strokeWidth;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            return Err<Drawing>("parseDrawingYaml: document is not a mapping");
        }
        if (root["map"]) drawing.mapName = root["map"].as<std::string>();
        if (root["stroke-width"]) drawing.strokeWidth = root["stroke-width"].as<float>();

        auto shapes = root["shapes"];
        if (!shapes || !shapes.IsSequence()) {
            return Err<Drawing>("parseDrawingYaml: missing shapes sequence");
        }
        size_t index = 0;
        for (const auto& item : shapes) {
            auto shape = parseShape(item, index++, defaults.fontSize);
            if (!shape) {
                return Err<Drawing>("parseDrawingYaml", shape);
            }
            drawing.shapes.push_back(std::move(*shape));
        }
    } catch (const YAML::Exception& e) {
        return Err<Drawing>("parseDrawingYaml: " + std::string(e.what()));
    }

    yinfo("parseDrawingYaml: {} shapes for map '{}'", drawing.shapes.size(), drawing.mapName);
    return Ok(std::move(drawing));
}

//=============================================================================
// drawingToYaml
//=============================================================================

std::string drawingToYaml(const Drawing& drawing) {
    return emitDrawing(drawing.mapName, drawing.strokeWidth, drawing.shapes);
}

std::string drawingToYaml(const DecodedDrawing& drawing) {
    return emitDrawing(drawing.mapName, drawing.strokeWidth, drawing.shapes);
}

} // namespace mapink
