//=============================================================================
// RIFF layer and WebP container tests
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

#include <mapink/drawing-codec.h>
#include <mapink/riff.h>
#include <mapink/webp-container.h>

#include <cstring>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace mapink;

namespace {

uint32_t readU32(const std::vector<uint8_t>& b, size_t offset) {
    uint32_t v;
    std::memcpy(&v, b.data() + offset, 4);
    return v;
}

std::vector<uint8_t> sampleDrawing() {
    Drawing d;
    d.shapes = {Shape::point(1, 2), Shape::line(0, 0, 40, 50)};
    d.mapName = "regular-main-branch";
    return *encodeDrawing(d);
}

// RIFF/WEBP holding only the given chunks
std::vector<uint8_t> bareWebp(const std::vector<std::pair<std::string, std::vector<uint8_t>>>& chunks) {
    std::vector<uint8_t> out = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'};
    for (const auto& [fourcc, data] : chunks) {
        appendChunk(out, fourcc, data);
    }
    patchRiffSize(out);
    return out;
}

size_t countChunks(const RiffFile& file, const std::string& fourcc) {
    return static_cast<size_t>(std::count_if(file.chunks.begin(), file.chunks.end(),
                                             [&](const RiffChunk& c) { return c.fourcc == fourcc; }));
}

} // namespace

suite riff_tests = [] {
    "odd chunks get a pad byte"_test = [] {
        std::vector<uint8_t> out;
        appendChunk(out, "ABCD", std::vector<uint8_t>{1, 2, 3});
        expect(out.size() == 12u);
        expect(readU32(out, 4) == 3u);
        expect(out.back() == 0);
    };

    "parse honors pad bytes"_test = [] {
        auto file = bareWebp({{"AAAA", {1, 2, 3}}, {"BBBB", {4, 5}}});
        auto riff = parseRiff(file);
        expect(riff.has_value() >> fatal);
        expect(riff->formType == "WEBP");
        expect((riff->chunks.size() == 2u) >> fatal);
        expect(riff->chunks[1].fourcc == "BBBB");
        expect(riff->chunks[1].bytes() == std::vector<uint8_t>{4, 5});
    };

    "chunk running past the end is flagged"_test = [] {
        auto file = bareWebp({{"AAAA", {1, 2, 3, 4, 5, 6}}});
        file.resize(file.size() - 2);
        auto riff = parseRiff(file);
        expect(riff.has_value() >> fatal);
        expect((riff->chunks.size() == 1u) >> fatal);
        expect(riff->chunks[0].truncated);
        expect(riff->chunks[0].size == 4u);
        expect(riff->chunks[0].declaredSize == 6u);
    };

    "tags match case sensitively"_test = [] {
        auto riff = parseRiff(bareWebp({{"noit", {1}}}));
        expect(riff.has_value() >> fatal);
        expect(riff->find("NOIT") == nullptr);
        expect(riff->find("noit") != nullptr);
    };

    "non riff input fails"_test = [] {
        expect(!parseRiff(std::vector<uint8_t>{'R', 'I', 'F'}).has_value());
        expect(!parseRiff(std::vector<uint8_t>(16, 0)).has_value());
    };

    "riff and webp detection"_test = [] {
        auto webp = bareWebp({{"VP8 ", {0x30, 0x01, 0x00}}});
        expect(isRiff(webp.data(), webp.size()));
        expect(isWebp(webp));

        auto avi = webp;
        std::memcpy(avi.data() + 8, "AVI ", 4);
        expect(isRiff(avi.data(), avi.size()));
        expect(!isWebp(avi));

        std::vector<uint8_t> raw = {0x01, 0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        expect(!isRiff(raw.data(), raw.size()));
        expect(!isWebp(raw));
    };
};

suite webp_container_tests = [] {
    "built container is a well formed webp"_test = [] {
        auto drawing = sampleDrawing();
        auto webp = buildWebpContainer(drawing, "regular-main-branch");
        expect(webp.has_value() >> fatal);

        const auto& b = *webp;
        expect(std::memcmp(b.data(), "RIFF", 4) == 0);
        expect(std::memcmp(b.data() + 8, "WEBP", 4) == 0);
        expect(std::memcmp(b.data() + 12, "VP8 ", 4) == 0);
        expect(readU32(b, 4) == b.size() - 8);
        expect(b.size() % 2 == 0u);

        auto riff = parseRiff(b);
        expect(riff.has_value() >> fatal);
        expect((riff->chunks.size() == 3u) >> fatal);
        expect(riff->chunks[1].fourcc == "NOIT");
        expect(riff->chunks[2].fourcc == "NMAP");
    };

    "extract returns the exact drawing bytes"_test = [] {
        auto drawing = sampleDrawing();
        auto webp = buildWebpContainer(drawing, "regular-main-branch");
        expect(webp.has_value() >> fatal);

        auto extracted = extractFromWebp(*webp);
        expect(extracted.has_value() >> fatal);
        expect(extracted->drawing.has_value() >> fatal);
        expect(*extracted->drawing == drawing);
        expect(extracted->mapName == std::string("regular-main-branch"));
        expect(!extracted->truncated);
    };

    "odd sized drawing survives padding"_test = [] {
        std::vector<uint8_t> drawing = {1, 2, 3};
        auto webp = buildWebpContainer(drawing, "abc");
        expect(webp.has_value() >> fatal);
        auto extracted = extractFromWebp(*webp);
        expect(extracted.has_value() >> fatal);
        expect(*extracted->drawing == drawing);
        expect(*extracted->mapName == "abc");
    };

    "webp without drawing extracts nothing"_test = [] {
        auto extracted = extractFromWebp(bareWebp({{"VP8 ", {0x30, 0x01, 0x00}}}));
        expect(extracted.has_value() >> fatal);
        expect(!extracted->drawing.has_value());
        expect(!extracted->mapName.has_value());
    };

    "non webp input fails extraction"_test = [] {
        expect(!extractFromWebp(sampleDrawing()).has_value());
        std::vector<uint8_t> wave = {'R', 'I', 'F', 'F', 4, 0, 0, 0, 'W', 'A', 'V', 'E'};
        expect(!extractFromWebp(wave).has_value());
    };

    "cut short drawing chunk is flagged"_test = [] {
        auto drawing = sampleDrawing();
        auto webp = *buildWebpContainer(drawing, "");
        auto riff = *parseRiff(webp);
        const auto* noit = riff.find(FOURCC_DRAWING);
        expect((noit != nullptr) >> fatal);
        webp.resize(noit->offset + CHUNK_HEADER_SIZE + 5);

        auto extracted = extractFromWebp(webp);
        expect(extracted.has_value() >> fatal);
        expect(extracted->truncated);
        expect(extracted->drawing->size() == 5u);
    };

    "embedding keeps image chunks"_test = [] {
        std::vector<uint8_t> pixels(101, 0x42);
        auto image = bareWebp({{"VP8X", std::vector<uint8_t>(10, 0)}, {"VP8L", pixels}, {"EXIF", {9}}});
        auto drawing = sampleDrawing();

        auto embedded = embedInWebp(image, drawing, "map-a");
        expect(embedded.has_value() >> fatal);
        expect(readU32(*embedded, 4) == embedded->size() - 8);

        auto riff = parseRiff(*embedded);
        expect(riff.has_value() >> fatal);
        expect(riff->find("VP8L")->bytes() == pixels);
        expect(riff->find("EXIF") != nullptr);

        auto extracted = extractFromWebp(*embedded);
        expect(extracted.has_value() >> fatal);
        expect(*extracted->drawing == drawing);
        expect(*extracted->mapName == "map-a");
    };

    "embedding replaces an earlier drawing"_test = [] {
        auto first = *buildWebpContainer(std::vector<uint8_t>{1, 2}, "old");
        auto drawing = sampleDrawing();

        auto embedded = embedInWebp(first, drawing, "new");
        expect(embedded.has_value() >> fatal);
        auto riff = parseRiff(*embedded);
        expect(riff.has_value() >> fatal);
        expect(countChunks(*riff, "NOIT") == 1u);
        expect(countChunks(*riff, "NMAP") == 1u);

        auto extracted = extractFromWebp(*embedded);
        expect(*extracted->drawing == drawing);
        expect(*extracted->mapName == "new");
    };

    "embedding needs an image chunk"_test = [] {
        auto noImage = bareWebp({{"EXIF", {1, 2}}});
        expect(!embedInWebp(noImage, sampleDrawing(), "m").has_value());
        expect(!embedInWebp(sampleDrawing(), sampleDrawing(), "m").has_value());
    };

    "empty drawing is rejected"_test = [] {
        expect(!buildWebpContainer({}, "m").has_value());
    };
};
