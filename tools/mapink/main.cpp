// mapink: encode, decode, inspect and embed shareable map drawings
//
// Drawings are edited as YAML and shared as base64url link text, raw codec
// buffers or WebP images carrying the buffer in a private chunk.

#include <mapink/config.h>
#include <mapink/drawing-codec.h>
#include <mapink/riff.h>
#include <mapink/shape-yaml.h>
#include <mapink/share.h>
#include <mapink/webp-container.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <args.hxx>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace mapink;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PROCESSING = 2;

//=============================================================================
// File helpers
//=============================================================================

Result<std::vector<uint8_t>> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::vector<uint8_t>>("cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return Ok(std::move(bytes));
}

Result<void> writeOutput(const std::string& path, const uint8_t* data, size_t size) {
    if (path.empty() || path == "-") {
        std::cout.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        std::cout.flush();
        return Ok();
    }
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return Err("cannot open " + path + " for writing");
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file) {
        return Err("failed writing " + path);
    }
    yinfo("wrote {} bytes to {}", size, path);
    return Ok();
}

Result<void> writeOutput(const std::string& path, const std::string& text) {
    return writeOutput(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<void> writeOutput(const std::string& path, const std::vector<uint8_t>& bytes) {
    return writeOutput(path, bytes.data(), bytes.size());
}

//=============================================================================
// Logging
//=============================================================================

void setupLogging(const Config& config, bool verbose) {
    auto logFile = config.logFile();
    std::shared_ptr<spdlog::logger> logger;
    if (!logFile.empty()) {
        logger = spdlog::basic_logger_mt("mapink", logFile, true);
    } else {
        logger = spdlog::stderr_color_mt("mapink");
    }
    spdlog::set_default_logger(logger);

    auto level = spdlog::level::from_str(config.logLevel());
    if (verbose) {
        yenable_all();
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

//=============================================================================
// Commands
//=============================================================================

struct EncodeOptions {
    std::string input;
    std::string output;
    std::string format = "bin";
    std::optional<std::string> mapName;
    std::optional<float> strokeWidth;
};

Result<Drawing> loadDrawing(const Config& config, const std::string& path,
                            const std::optional<std::string>& mapName,
                            const std::optional<float>& strokeWidth) {
    auto bytes = readFile(path);
    if (!bytes) {
        return Err<Drawing>("cannot read drawing", bytes);
    }

    DrawingDefaults defaults;
    defaults.mapName = config.mapName();
    defaults.strokeWidth = config.strokeWidth();
    defaults.fontSize = config.fontSize();

    auto drawing = parseDrawingYaml(std::string(bytes->begin(), bytes->end()), defaults);
    if (!drawing) {
        return Err<Drawing>("cannot parse " + path, drawing);
    }
    if (mapName) drawing->mapName = *mapName;
    if (strokeWidth) drawing->strokeWidth = *strokeWidth;
    return drawing;
}

int cmdEncode(const Config& config, const EncodeOptions& opts) {
    auto drawing = loadDrawing(config, opts.input, opts.mapName, opts.strokeWidth);
    if (!drawing) {
        std::cerr << "Error: " << error_msg(drawing) << "\n";
        return EXIT_PROCESSING;
    }

    Result<void> written;
    if (opts.format == "link") {
        auto link = encodeDrawingLink(*drawing);
        if (!link) {
            std::cerr << "Error: " << error_msg(link) << "\n";
            return EXIT_PROCESSING;
        }
        written = writeOutput(opts.output, *link + "\n");
    } else if (opts.format == "webp") {
        auto image = buildShareImage(*drawing);
        if (!image) {
            std::cerr << "Error: " << error_msg(image) << "\n";
            return EXIT_PROCESSING;
        }
        written = writeOutput(opts.output, *image);
    } else {
        auto encoded = encodeDrawing(*drawing);
        if (!encoded) {
            std::cerr << "Error: " << error_msg(encoded) << "\n";
            return EXIT_PROCESSING;
        }
        written = writeOutput(opts.output, *encoded);
    }

    if (!written) {
        std::cerr << "Error: " << error_msg(written) << "\n";
        return EXIT_PROCESSING;
    }
    return 0;
}

int cmdDecode(const std::string& input, const std::string& output) {
    auto bytes = readFile(input);
    if (!bytes) {
        std::cerr << "Error: " << error_msg(bytes) << "\n";
        return EXIT_PROCESSING;
    }

    std::optional<DecodedDrawing> drawing;
    if (detectInputFormat(*bytes) == InputFormat::LinkText) {
        auto codec = loadCodecBytes(*bytes);
        if (!codec) {
            std::cerr << "Error: " << error_msg(codec) << "\n";
            return EXIT_PROCESSING;
        }
        auto decoded = decodeDrawing(*codec);
        if (!decoded) {
            std::cerr << "Error: " << error_msg(decoded) << "\n";
            return EXIT_PROCESSING;
        }
        drawing = std::move(*decoded);
    } else {
        auto imported = importDrawingBlob(*bytes);
        if (!imported) {
            std::cerr << "Error: " << error_msg(imported) << "\n";
            return EXIT_PROCESSING;
        }
        if (!*imported) {
            std::cerr << "Error: " << input << " carries no drawing\n";
            return EXIT_PROCESSING;
        }
        drawing = std::move(**imported);
    }

    if (drawing->truncated) {
        std::cerr << "Warning: drawing is truncated, recovered " << drawing->shapes.size()
                  << " of " << drawing->declaredShapeCount << " shapes\n";
    }
    if (auto res = writeOutput(output, drawingToYaml(*drawing)); !res) {
        std::cerr << "Error: " << error_msg(res) << "\n";
        return EXIT_PROCESSING;
    }
    return 0;
}

int cmdInspect(const std::string& input) {
    auto bytes = readFile(input);
    if (!bytes) {
        std::cerr << "Error: " << error_msg(bytes) << "\n";
        return EXIT_PROCESSING;
    }

    if (isWebp(*bytes)) {
        auto riff = parseRiff(*bytes);
        if (!riff) {
            std::cerr << "Error: " << error_msg(riff) << "\n";
            return EXIT_PROCESSING;
        }
        std::cout << "container: RIFF/" << riff->formType << " (" << bytes->size() << " bytes)\n";
        for (const auto& chunk : riff->chunks) {
            std::cout << "  chunk '" << chunk.fourcc << "' " << chunk.declaredSize << " bytes"
                      << (chunk.truncated ? " (truncated)" : "") << "\n";
        }
    }

    auto codec = loadCodecBytes(*bytes);
    if (!codec) {
        std::cerr << "Error: " << error_msg(codec) << "\n";
        return EXIT_PROCESSING;
    }
    auto header = readDrawingHeader(*codec);
    if (!header) {
        std::cerr << "Error: " << error_msg(header) << "\n";
        return EXIT_PROCESSING;
    }
    auto decoded = decodeDrawing(*codec);
    if (!decoded) {
        std::cerr << "Error: " << error_msg(decoded) << "\n";
        return EXIT_PROCESSING;
    }

    std::cout << "version: " << static_cast<int>(header->version) << "\n";
    std::cout << "coordinate class: " << static_cast<int>(header->coordClass) << "\n";
    std::cout << "origin: " << header->xOrigin << ", " << header->yOrigin << "\n";
    std::cout << "map: " << header->mapName << "\n";
    std::cout << "shapes: " << decoded->shapes.size() << " of " << header->shapeCount
              << (decoded->truncated ? " (truncated)" : "") << "\n";
    std::cout << "bytes: " << codec->size() << "\n";

    std::map<std::string, size_t> counts;
    for (const auto& shape : decoded->shapes) {
        counts[shapeTypeName(shape.type)]++;
    }
    for (const auto& [type, count] : counts) {
        std::cout << "  " << type << ": " << count << "\n";
    }
    return 0;
}

int cmdEmbed(const Config& config, const std::string& imagePath, const std::string& drawingPath,
             const std::string& output) {
    auto image = readFile(imagePath);
    if (!image) {
        std::cerr << "Error: " << error_msg(image) << "\n";
        return EXIT_PROCESSING;
    }
    auto drawing = loadDrawing(config, drawingPath, std::nullopt, std::nullopt);
    if (!drawing) {
        std::cerr << "Error: " << error_msg(drawing) << "\n";
        return EXIT_PROCESSING;
    }
    auto encoded = encodeDrawing(*drawing);
    if (!encoded) {
        std::cerr << "Error: " << error_msg(encoded) << "\n";
        return EXIT_PROCESSING;
    }
    auto embedded = embedInWebp(*image, *encoded, drawing->mapName);
    if (!embedded) {
        std::cerr << "Error: " << error_msg(embedded) << "\n";
        return EXIT_PROCESSING;
    }
    if (auto res = writeOutput(output, *embedded); !res) {
        std::cerr << "Error: " << error_msg(res) << "\n";
        return EXIT_PROCESSING;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    args::ArgumentParser parser("mapink - Encode and share map drawings");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "file", "Config file", {'c', "config"});
    args::Flag verbose(parser, "verbose", "Verbose output", {'v', "verbose"});

    args::Group commands(parser, "commands");
    args::Command encodeCmd(commands, "encode", "Encode a YAML drawing");
    args::Command decodeCmd(commands, "decode", "Decode a WebP, binary or link text to YAML");
    args::Command inspectCmd(commands, "inspect", "Describe an encoded drawing");
    args::Command embedCmd(commands, "embed", "Embed a drawing into an existing WebP");

    args::Positional<std::string> encodeInput(encodeCmd, "drawing", "Drawing YAML file",
                                              args::Options::Required);
    args::ValueFlag<std::string> mapFlag(encodeCmd, "name", "Map name", {"map"});
    args::ValueFlag<float> strokeFlag(encodeCmd, "width", "Default stroke width",
                                      {"stroke-width"});
    args::MapFlag<std::string, std::string> formatFlag(
        encodeCmd, "format", "Output format: bin, link or webp", {'f', "format"},
        {{"bin", "bin"}, {"link", "link"}, {"webp", "webp"}}, "bin");
    args::ValueFlag<std::string> encodeOut(encodeCmd, "file", "Output file", {'o', "output"});

    args::Positional<std::string> decodeInput(decodeCmd, "input", "WebP, binary or link text",
                                              args::Options::Required);
    args::ValueFlag<std::string> decodeOut(decodeCmd, "file", "Output YAML file",
                                           {'o', "output"});

    args::Positional<std::string> inspectInput(inspectCmd, "input", "WebP, binary or link text",
                                               args::Options::Required);

    args::Positional<std::string> embedImage(embedCmd, "image", "Existing WebP image",
                                             args::Options::Required);
    args::Positional<std::string> embedDrawing(embedCmd, "drawing", "Drawing YAML file",
                                               args::Options::Required);
    args::ValueFlag<std::string> embedOut(embedCmd, "file", "Output WebP", {'o', "output"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return EXIT_USAGE;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return EXIT_USAGE;
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (mapFlag) overrides["drawing"]["map-name"] = args::get(mapFlag);
    if (strokeFlag) overrides["drawing"]["stroke-width"] = args::get(strokeFlag);

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        std::cerr << "Error: " << error_msg(config) << "\n";
        return EXIT_USAGE;
    }
    setupLogging(**config, verbose);

    if (encodeCmd) {
        EncodeOptions opts;
        opts.input = args::get(encodeInput);
        opts.output = encodeOut ? args::get(encodeOut) : "";
        opts.format = args::get(formatFlag);
        if (mapFlag) opts.mapName = args::get(mapFlag);
        if (strokeFlag) opts.strokeWidth = args::get(strokeFlag);
        return cmdEncode(**config, opts);
    }
    if (decodeCmd) {
        return cmdDecode(args::get(decodeInput), decodeOut ? args::get(decodeOut) : "");
    }
    if (inspectCmd) {
        return cmdInspect(args::get(inspectInput));
    }
    if (embedCmd) {
        return cmdEmbed(**config, args::get(embedImage), args::get(embedDrawing),
                        embedOut ? args::get(embedOut) : "");
    }

    std::cerr << parser;
    return EXIT_USAGE;
}
