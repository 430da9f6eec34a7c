//=============================================================================
// Quantization table tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <mapink/palette.h>
#include <mapink/shape.h>

using namespace boost::ut;
using namespace mapink;

suite palette_tests = [] {
    "palette colors use their index"_test = [] {
        auto code = encodeColor(*Rgb::parse("#ef4444"));
        expect(code.index == 1);

        code = encodeColor(*Rgb::parse("#3B82F6"));
        expect(code.index == 6);
    };

    "violet goes through the escape default"_test = [] {
        auto code = encodeColor(*Rgb::parse("#8b5cf6"));
        expect(code.index == COLOR_ESCAPE);
        expect(code.escapeMode == ESCAPE_MODE_DEFAULT);
    };

    "other colors go through the escape rgb"_test = [] {
        auto code = encodeColor(Rgb{0x12, 0x34, 0x56});
        expect(code.index == COLOR_ESCAPE);
        expect(code.escapeMode == ESCAPE_MODE_RGB);
        expect(code.rgb == Rgb{0x12, 0x34, 0x56});
    };

    "stroke width snaps to nearest"_test = [] {
        expect(nearestStrokeIndex(7.0f) == 1);
        expect(nearestStrokeIndex(1.0f) == 0);
        expect(nearestStrokeIndex(12.0f) == 2);
        expect(nearestStrokeIndex(100.0f) == 3);
    };

    "ties go to the lower index"_test = [] {
        expect(nearestStrokeIndex(3.5f) == 0);
        expect(nearestStrokeIndex(12.5f) == 2);
        expect(nearestFontSizeIndex(14.0f) == 0);
        expect(nearestFontSizeIndex(20.0f) == 1);
    };

    "font sizes snap to nearest"_test = [] {
        expect(nearestFontSizeIndex(16.0f) == 1);
        expect(nearestFontSizeIndex(30.0f) == 3);
    };
};

suite shape_model_tests = [] {
    "color parse accepts long and short forms"_test = [] {
        expect(Rgb::parse("#ffffff").has_value());
        expect(Rgb::parse("22C55E") == Rgb{0x22, 0xC5, 0x5E});
        expect(Rgb::parse("#f00") == Rgb{0xFF, 0x00, 0x00});
    };

    "color parse rejects garbage"_test = [] {
        expect(!Rgb::parse("").has_value());
        expect(!Rgb::parse("#12345").has_value());
        expect(!Rgb::parse("#gggggg").has_value());
        expect(!Rgb::parse("red").has_value());
    };

    "color formats as lower case hex"_test = [] {
        expect(Rgb{0xEF, 0x44, 0x44}.hex() == std::string("#ef4444"));
    };

    "type names map both ways"_test = [] {
        expect(shapeTypeFromName("arrow_line") == ShapeType::ArrowLine);
        expect(std::string(shapeTypeName(ShapeType::ClosedPath)) == "closed_path");
        expect(!shapeTypeFromName("hexagon").has_value());
        expect(shapeTypeFromCode(9) == ShapeType::Text);
        expect(!shapeTypeFromCode(10).has_value());
    };

    "shape ids are uuid v4"_test = [] {
        auto a = newShapeId();
        auto b = newShapeId();
        expect(a.size() == 36u);
        expect(a[14] == '4');
        expect(a[19] == '8' || a[19] == '9' || a[19] == 'a' || a[19] == 'b');
        expect(a != b);
    };
};
