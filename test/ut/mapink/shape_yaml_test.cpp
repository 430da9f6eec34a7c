//=============================================================================
// YAML drawing interchange tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <mapink/drawing-codec.h>
#include <mapink/palette.h>
#include <mapink/shape-yaml.h>

#include <string>

using namespace boost::ut;
using namespace mapink;

namespace {

const char* SAMPLE_YAML = R"(
map: regular-main-branch
stroke-width: 10
shapes:
  - type: polygon
    pos: [0, 0, 100, 0, 100, 100]
    color: "#22c55e"
    filled: true
    fill-alpha: 0.5
  - type: arrow_line
    pos: [5, 5, 50, 60]
    color: "#F00"
    stroke-width: 2
  - type: text
    pos: [50, 50]
    text: Boss room
    font-size: 24
    id: label-1
)";

} // namespace

suite shape_yaml_tests = [] {
    "parses a drawing document"_test = [] {
        auto drawing = parseDrawingYaml(SAMPLE_YAML);
        expect(drawing.has_value() >> fatal);
        expect(drawing->mapName == "regular-main-branch");
        expect(drawing->strokeWidth == 10.0f);
        expect((drawing->shapes.size() == 3u) >> fatal);

        const auto& zone = drawing->shapes[0];
        expect(zone.type == ShapeType::Polygon);
        expect(zone.pos.size() == 6u);
        expect(zone.color == COLOR_PALETTE[4]);
        expect(zone.filled);
        expect(*zone.fillAlpha == 0.5f);
        expect(!zone.stroke()->width.has_value());

        const auto& arrow = drawing->shapes[1];
        expect(arrow.type == ShapeType::ArrowLine);
        expect(arrow.color == Rgb{0xFF, 0x00, 0x00});
        expect(*arrow.stroke()->width == 2.0f);

        const auto& label = drawing->shapes[2];
        expect(label.textStyle()->text == "Boss room");
        expect(label.textStyle()->fontSize == 24.0f);
        expect(label.id == "label-1");
    };

    "missing fields use the defaults"_test = [] {
        DrawingDefaults defaults;
        defaults.mapName = "fallback";
        defaults.strokeWidth = 15.0f;
        defaults.fontSize = 32.0f;
        auto drawing = parseDrawingYaml(
            "shapes:\n  - {type: text, pos: [1, 2]}\n  - {type: point, pos: [3, 4]}\n", defaults);
        expect(drawing.has_value() >> fatal);
        expect(drawing->mapName == "fallback");
        expect(drawing->strokeWidth == 15.0f);
        expect(drawing->shapes[0].textStyle()->fontSize == 32.0f);
        expect(drawing->shapes[1].color == COLOR_PALETTE[0]);
        expect(!drawing->shapes[1].id.empty());
    };

    "invalid color falls back to white"_test = [] {
        auto drawing = parseDrawingYaml("shapes:\n  - {type: point, pos: [0, 0], color: chartreuse}\n");
        expect(drawing.has_value() >> fatal);
        expect(drawing->shapes[0].color == COLOR_PALETTE[0]);
    };

    "unknown type fails"_test = [] {
        auto drawing = parseDrawingYaml("shapes:\n  - {type: hexagon, pos: [0, 0]}\n");
        expect(!drawing.has_value());
        expect(drawing.error().to_string().find("hexagon") != std::string::npos);
    };

    "missing pos fails"_test = [] {
        expect(!parseDrawingYaml("shapes:\n  - {type: point}\n").has_value());
    };

    "syntax errors fail"_test = [] {
        expect(!parseDrawingYaml("shapes: [\n  - {type: point").has_value());
        expect(!parseDrawingYaml("- just a list").has_value());
        expect(!parseDrawingYaml("map: x\n").has_value());
    };

    "written yaml parses back to the same shapes"_test = [] {
        auto drawing = parseDrawingYaml(SAMPLE_YAML);
        expect(drawing.has_value() >> fatal);

        auto again = parseDrawingYaml(drawingToYaml(*drawing));
        expect(again.has_value() >> fatal);
        expect(again->mapName == drawing->mapName);
        expect((again->shapes.size() == drawing->shapes.size()) >> fatal);
        for (size_t i = 0; i < drawing->shapes.size(); i++) {
            const auto& a = drawing->shapes[i];
            const auto& b = again->shapes[i];
            expect(a.type == b.type);
            expect(a.pos == b.pos);
            expect(a.color == b.color);
            expect(a.filled == b.filled);
            expect(a.fillAlpha == b.fillAlpha);
            expect(a.style == b.style);
            expect(a.id == b.id);
        }
    };

    "decoded drawings write as yaml"_test = [] {
        auto drawing = parseDrawingYaml(SAMPLE_YAML);
        expect(drawing.has_value() >> fatal);
        auto decoded = decodeDrawing(*encodeDrawing(*drawing));
        expect(decoded.has_value() >> fatal);

        auto yaml = drawingToYaml(*decoded);
        expect(yaml.find("arrow_line") != std::string::npos);
        auto again = parseDrawingYaml(yaml);
        expect(again.has_value() >> fatal);
        expect(again->shapes.size() == decoded->shapes.size());
        expect(again->shapes[2].textStyle()->text == "Boss room");
    };
};
