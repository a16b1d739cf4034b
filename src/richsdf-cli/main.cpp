#include <richsdf/config.h>
#include <richsdf/fetch-resolver.h>
#include <richsdf/font/font-library.h>
#include <richsdf/freetype-shaper.h>
#include <richsdf/glyph-atlas.h>
#include <richsdf/markup-parser.h>
#include <richsdf/sdf-rasterizer.h>
#include <richsdf/style-sheet.h>
#include <richsdf/text-pipeline.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace richsdf;

namespace {

// Binary PGM (P5) of one atlas page, 8-bit SDF values as gray
Result<void> writePgm(const AtlasPage& page, const std::string& path) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Err("cannot open " + path + " for writing", ErrorCode::InvalidArgument);
    }
    out << "P5\n" << page.size() << " " << page.size() << "\n255\n";
    const auto& pixels = page.pixels();
    out.write(reinterpret_cast<const char*>(pixels.data()),
              static_cast<std::streamsize>(pixels.size()));
    if (!out) {
        return Err("failed writing " + path);
    }
    return Ok();
}

Result<void> run(const std::string& markup, const Config& config,
                 const std::vector<std::string>& fontPaths, MapFetchSource& source,
                 const std::string& atlasOut) {
    auto fonts = font::FontLibrary::create(config);
    if (!fonts) {
        return Err("Failed to create font library", fonts);
    }
    for (const auto& path : fontPaths) {
        if (auto id = (*fonts)->loadFile(path); !id) {
            return Err("Failed to load font " + path, id);
        }
    }
    if (!(*fonts)->defaultFont()) {
        return Err("no font loaded, pass --font or set fonts.paths", ErrorCode::Font);
    }

    auto styleSheet = StyleSheet::fromYaml(config.getNode(Config::KEY_STYLES));
    if (!styleSheet) {
        return Err("Failed to read styles", styleSheet);
    }

    auto shaper = FreetypeShaper::create(*fonts);
    if (!shaper) {
        return Err("Failed to create shaper", shaper);
    }
    auto rasterizer = SdfRasterizer::create(*fonts, SdfConfig::fromConfig(config));
    if (!rasterizer) {
        return Err("Failed to create rasterizer", rasterizer);
    }
    auto atlas = GlyphAtlas::create(AtlasConfig::fromConfig(config));
    if (!atlas) {
        return Err("Failed to create atlas", atlas);
    }
    auto pipeline = TextPipeline::create(*shaper, *rasterizer, *atlas);
    if (!pipeline) {
        return Err("Failed to create pipeline", pipeline);
    }

    MarkupParser parser(&*styleSheet);
    TextObject text(markup, parser, TextStyling::fromConfig(config));

    auto updated = (*pipeline)->update(text, source);
    if (!updated) {
        return Err("Failed to build text", updated);
    }

    const auto& mesh = text.mesh();
    const auto stats = (*atlas)->stats();
    std::string resolved;
    for (const auto& run : text.runs()) {
        resolved += run.text;
    }
    std::printf("text:      %s\n", resolved.c_str());
    std::printf("glyphs:    %zu on %zu lines\n", text.shaped().glyphs.size(),
                text.shaped().lines.size());
    std::printf("quads:     %zu (%zu vertices, %zu indices)\n", mesh.quadCount(),
                mesh.vertices.size(), mesh.indices.size());
    std::printf("size:      %.2f x %.2f\n", mesh.dimension.x, mesh.dimension.y);
    for (const auto& submesh : mesh.submeshes) {
        std::printf("submesh:   page %u, %u indices from %u\n", submesh.page,
                    submesh.indexCount, submesh.firstIndex);
    }
    for (size_t i = 0; i < (*atlas)->pageCount(); ++i) {
        const auto& page = (*atlas)->page(i);
        const double used = static_cast<double>(page.allocatedArea()) /
                            (static_cast<double>(page.size()) * page.size());
        std::printf("page %zu:    %zu glyphs, %u shelves, %.1f%% used\n", i,
                    static_cast<size_t>(page.allocatedCount()), page.shelfCount(), used * 100.0);
    }
    std::printf("atlas:     %zu entries, %llu hits, %llu misses, %llu evictions\n",
                stats.entries, static_cast<unsigned long long>(stats.hits),
                static_cast<unsigned long long>(stats.misses),
                static_cast<unsigned long long>(stats.evictions));

    if (!atlasOut.empty()) {
        if (auto res = writePgm((*atlas)->page(0), atlasOut); !res) {
            return res;
        }
        yinfo("Wrote atlas page 0 to {}", atlasOut);
    }
    return Ok();
}

} // namespace

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("richsdf-cli - build an SDF text mesh from rich-text markup",
                                "Markup: {style:text} scopes, {name} placeholders, {{ }} escapes.");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlagList<std::string> fontArgs(parser, "path", "Font file to load (repeatable)",
                                              {'f', "font"});
    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlagList<std::string> setArgs(parser, "name=value",
                                             "Placeholder value (repeatable)", {'s', "set"});
    args::ValueFlag<float> sizeArg(parser, "px", "Text size in pixels", {"size"});
    args::ValueFlag<std::string> atlasOutArg(parser, "path", "Write atlas page 0 as PGM",
                                             {"atlas-out"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> markupArg(parser, "markup", "Rich-text markup",
                                            args::Options::Required);

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::warn);

    YAML::Node cmdOverrides;
    if (sizeArg) {
        cmdOverrides["text"]["size"] = args::get(sizeArg);
    }

    auto config = Config::create(configFile ? args::get(configFile) : "", cmdOverrides);
    if (!config) {
        std::cerr << "richsdf-cli: " << error_msg(config) << std::endl;
        return 1;
    }

    MapFetchSource source;
    for (const auto& assignment : args::get(setArgs)) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos) {
            std::cerr << "richsdf-cli: --set expects name=value, got '" << assignment << "'"
                      << std::endl;
            return 1;
        }
        source.set(assignment.substr(0, eq), assignment.substr(eq + 1));
    }

    auto res = run(args::get(markupArg), **config, args::get(fontArgs), source,
                   atlasOutArg ? args::get(atlasOutArg) : "");
    if (!res) {
        std::cerr << "richsdf-cli: " << res.error().message() << std::endl;
        return res.error().isFatal() ? 2 : 1;
    }
    return 0;
}
