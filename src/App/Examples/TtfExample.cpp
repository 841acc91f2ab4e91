// Copyright (c) 2026, WH, All rights reserved.
// everything SDL3_ttf can render onto a surface, blitted onto the window surface every frame
#include "Examples.h"

#include "ConVar.h"
#include "Events.h"
#include "FramerateCapper.h"
#include "Init.h"
#include "Logging.h"
#include "TTF.h"
#include "Window.h"

#include <string>
#include <variant>
#include <vector>

namespace Examples {
namespace {  // static

using namespace sdl3bind;

constexpr Color WHITE{255, 255, 255, 255};
constexpr Color YELLOW{255, 255, 0, 255};
constexpr Color CYAN{0, 255, 255, 255};
constexpr Color MAGENTA{255, 0, 255, 255};

// ends with SDL3_ttf's reference count
class TtfLibrary {
    NOCOPY_NOMOVE(TtfLibrary)
   public:
    TtfLibrary() : m_ok(ttf::init().has_value()) {}
    ~TtfLibrary() {
        if(m_ok) ttf::quit();
    }
    [[nodiscard]] bool ok() const { return m_ok; }

   private:
    bool m_ok;
};

void logFontInfo(const ttf::Font &font) {
    debugLog("Font Family: {}", font.getFamilyName().value_or("(unknown)"));
    debugLog("Font Style: {}", font.getStyleName().value_or("(unknown)"));
    debugLog("Font is fixed width: {}", font.isFixedWidth());
    debugLog("Font is scalable: {}", font.isScalable());
    debugLog("Font height: {}", font.getHeight());
    debugLog("Font ascent: {}", font.getAscent());
    debugLog("Font descent: {}", font.getDescent());
    debugLog("Font lineskip: {}", font.getLineSkip());
    debugLog("Font faces: {}", font.getNumFaces());
    debugLog("Font kerning enabled: {}", font.getKerning());
    debugLog("Font has glyph 'A': {}", font.hasGlyph('A'));

    if(auto metrics = font.getGlyphMetrics('A')) {
        debugLog("Glyph 'A' metrics: minx={}, maxx={}, miny={}, maxy={}, advance={}", metrics->min_x, metrics->max_x,
                 metrics->min_y, metrics->max_y, metrics->advance);
    }
    if(auto kerning = font.getGlyphKerning('V', 'A')) {
        debugLog("Kerning for 'VA': {}", *kerning);
    }
}

// all the surfaces to show, top to bottom
Result<std::vector<Surface>> renderAll(ttf::Font &font, const char *fontPath) {
    std::vector<Surface> ret;
    const auto push = [&ret](Result<Surface> surface) -> Result<void> {
        if(!surface) return std::unexpected(surface.error());
        ret.push_back(std::move(*surface));
        return {};
    };

    if(auto ok = push(font.renderTextSolid("Solid Text", WHITE)); !ok) return std::unexpected(ok.error());
    if(auto ok = push(font.renderTextShaded("Shaded Text", YELLOW, {50, 50, 50, 255})); !ok)
        return std::unexpected(ok.error());
    if(auto ok = push(font.renderTextBlended("Blended Text", CYAN)); !ok) return std::unexpected(ok.error());

    font.setStyle({.bold = true, .italic = true});
    auto styled = push(font.renderTextBlended("Bold and Italic", WHITE));
    font.setStyle({});
    if(!styled) return std::unexpected(styled.error());

    if(auto ok = font.setOutline(2); !ok) return std::unexpected(ok.error());
    auto outlined = push(font.renderTextBlended("Outlined", YELLOW));
    if(auto ok = font.setOutline(0); !ok) return std::unexpected(ok.error());
    if(!outlined) return std::unexpected(outlined.error());

    auto bigFont = ttf::Font::openWithProperties({.filename = fontPath, .size = 36.f});
    if(!bigFont) return std::unexpected(bigFont.error());
    if(auto ok = push(bigFont->renderTextBlended("Font from Properties", WHITE)); !ok)
        return std::unexpected(ok.error());

    // as much as fits into 200 pixels
    constexpr std::string_view longText{"This is a very long string that we want to fit into a small space."};
    auto measured = font.measureString(longText, 200);
    if(!measured) return std::unexpected(measured.error());
    const std::string truncated = std::string{longText.substr(0, measured->measured_length)} + "...";
    if(auto ok = push(font.renderTextBlended(truncated, WHITE)); !ok) return std::unexpected(ok.error());

    constexpr std::string_view wrappedText{
        "This is a looooooooooooooooooooooooooooooooooooooooooooooooooooooooooooooooooong text that will be "
        "wrapped."};
    if(auto ok = push(font.renderTextBlendedWrapped(wrappedText, MAGENTA, 400)); !ok)
        return std::unexpected(ok.error());

    return ret;
}

}  // namespace

int runTtf(int /*argc*/, char * /*argv*/[]) {
    const std::string &fontPath = cv::font_path.getString();
    if(fontPath.empty()) {
        debugLog("no font given, run with -font_path <file.ttf>");
        return 1;
    }

    auto subsystems = Subsystem::create({.video = true, .events = true});
    if(!subsystems) return 1;

    const TtfLibrary library;
    if(!library.ok()) return 1;

    const auto compiled = ttf::Version::compiled();
    const auto linked = ttf::getVersion();
    debugLog("Using SDL_ttf {}.{}.{}, linked against {}.{}.{}", compiled.major, compiled.minor, compiled.micro,
             linked.major, linked.minor, linked.micro);
    const auto ft = ttf::getFreeTypeVersion();
    debugLog("Using FreeType {}.{}.{}", ft.major, ft.minor, ft.micro);
    const auto hb = ttf::getHarfBuzzVersion();
    debugLog("Using HarfBuzz {}.{}.{}", hb.major, hb.minor, hb.micro);
    debugLog("TTF init count: {}", ttf::wasInit());

    const Uint32 tag = ttf::stringToTag("test");
    debugLog("Tag 'test' -> {:#x} -> {}", tag, ttf::tagToString(tag));

    auto window = video::Window::create("SDL_ttf Example", cv::window_width.getInt(), cv::window_height.getInt(),
                                        {.resizable = true});
    if(!window) return 1;

    auto font = ttf::Font::open(fontPath.c_str(), 24.f);
    if(!font) return 1;
    logFontInfo(*font);

    auto surfaces = renderAll(*font, fontPath.c_str());
    if(!surfaces) return 1;

    const auto fps = static_cast<uint32_t>(cv::fps_max.getInt());
    FramerateCapper<float> capper{FramerateCapper<float>::Limited{fps > 0 ? fps : 60}};

    bool quit = false;
    while(!quit) {
        capper.delay();

        while(auto event = events::poll()) {
            if(std::holds_alternative<events::Quit>(*event) || std::holds_alternative<events::Terminating>(*event))
                quit = true;
            else if(const auto *key = std::get_if<events::KeyDown>(&*event); key && key->key == SDLK_ESCAPE)
                quit = true;
        }

        // the window surface gets recreated on resize, so fetch it every frame
        auto target = window->getSurface();
        if(!target) return 1;
        if(!target->clear({20.f / 255.f, 20.f / 255.f, 40.f / 255.f, 1.f})) return 1;

        int y = 10;
        for(const auto &surface : *surfaces) {
            const Rect dst{10, y, surface.getWidth(), surface.getHeight()};
            if(!blit(surface, std::nullopt, *target, dst)) return 1;
            y += surface.getHeight() + 5;
        }

        if(!window->updateSurface()) return 1;
    }

    return 0;
}

}  // namespace Examples
