// Copyright (c) 2026, WH, All rights reserved.
#include "TTF.h"

#include "Properties.h"

#include <SDL3/SDL_version.h>

#include <array>

namespace sdl3bind::ttf {
namespace {  // static

Result<Surface> adopt(SDL_Surface *surface) noexcept {
    auto ret = errors::wrapCallPtr(surface);
    if(!ret) return std::unexpected(ret.error());
    return Surface{*ret};
}

std::optional<std::string_view> optionalString(const char *str) noexcept {
    if(str == nullptr) return std::nullopt;
    return std::string_view{str};
}

}  // namespace

Result<void> init() noexcept { return errors::wrapCallBool(TTF_Init()); }

void quit() noexcept { TTF_Quit(); }

int wasInit() noexcept { return TTF_WasInit(); }

Version getVersion() noexcept {
    const int version = TTF_Version();
    return {SDL_VERSIONNUM_MAJOR(version), SDL_VERSIONNUM_MINOR(version), SDL_VERSIONNUM_MICRO(version)};
}

Version getFreeTypeVersion() noexcept {
    Version ret;
    TTF_GetFreeTypeVersion(&ret.major, &ret.minor, &ret.micro);
    return ret;
}

Version getHarfBuzzVersion() noexcept {
    Version ret;
    TTF_GetHarfBuzzVersion(&ret.major, &ret.minor, &ret.micro);
    return ret;
}

Uint32 stringToTag(const char *string) noexcept { return TTF_StringToTag(string); }

std::string tagToString(Uint32 tag) {
    // 4 characters + terminator
    std::array<char, 5> buf{};
    TTF_TagToString(tag, buf.data(), buf.size());
    return std::string{buf.data()};
}

Result<Font> Font::open(const char *path, float pointSize) noexcept {
    auto font = errors::wrapCallPtr(TTF_OpenFont(path, pointSize));
    if(!font) return std::unexpected(font.error());
    return Font{*font};
}

Result<Font> Font::openWithProperties(const CreateProperties &props) noexcept {
    auto group = properties::Group::create();
    if(!group) return std::unexpected(group.error());
    if(auto ok = group->set(TTF_PROP_FONT_CREATE_FILENAME_STRING, props.filename); !ok)
        return std::unexpected(ok.error());
    if(auto ok = group->set(TTF_PROP_FONT_CREATE_SIZE_FLOAT, props.size); !ok) return std::unexpected(ok.error());

    auto font = errors::wrapCallPtr(TTF_OpenFontWithProperties(group->id()));
    if(!font) return std::unexpected(font.error());
    return Font{*font};
}

std::optional<std::string_view> Font::getFamilyName() const noexcept {
    return optionalString(TTF_GetFontFamilyName(get()));
}

std::optional<std::string_view> Font::getStyleName() const noexcept {
    return optionalString(TTF_GetFontStyleName(get()));
}

bool Font::isFixedWidth() const noexcept { return TTF_FontIsFixedWidth(get()); }
bool Font::isScalable() const noexcept { return TTF_FontIsScalable(get()); }

int Font::getHeight() const noexcept { return TTF_GetFontHeight(get()); }
int Font::getAscent() const noexcept { return TTF_GetFontAscent(get()); }
int Font::getDescent() const noexcept { return TTF_GetFontDescent(get()); }
int Font::getLineSkip() const noexcept { return TTF_GetFontLineSkip(get()); }
int Font::getNumFaces() const noexcept { return TTF_GetNumFontFaces(get()); }

bool Font::getKerning() const noexcept { return TTF_GetFontKerning(get()); }
void Font::setKerning(bool enabled) const noexcept { TTF_SetFontKerning(get(), enabled); }

bool Font::hasGlyph(Uint32 codepoint) const noexcept { return TTF_FontHasGlyph(get(), codepoint); }

Result<GlyphMetrics> Font::getGlyphMetrics(Uint32 codepoint) const noexcept {
    GlyphMetrics ret;
    if(auto ok = errors::wrapCallBool(TTF_GetGlyphMetrics(get(), codepoint, &ret.min_x, &ret.max_x, &ret.min_y,
                                                          &ret.max_y, &ret.advance));
       !ok)
        return std::unexpected(ok.error());
    return ret;
}

Result<int> Font::getGlyphKerning(Uint32 previous, Uint32 codepoint) const noexcept {
    int kerning = 0;
    if(auto ok = errors::wrapCallBool(TTF_GetGlyphKerning(get(), previous, codepoint, &kerning)); !ok)
        return std::unexpected(ok.error());
    return kerning;
}

FontStyleFlags Font::getStyle() const noexcept { return FontStyleFlags::fromNative(TTF_GetFontStyle(get())); }
void Font::setStyle(FontStyleFlags style) const noexcept { TTF_SetFontStyle(get(), style.toNative()); }

int Font::getOutline() const noexcept { return TTF_GetFontOutline(get()); }
Result<void> Font::setOutline(int outline) const noexcept {
    return errors::wrapCallBool(TTF_SetFontOutline(get(), outline));
}

Result<float> Font::getSize() const noexcept { return errors::wrapCall(TTF_GetFontSize(get()), 0.f); }
Result<void> Font::setSize(float pointSize) const noexcept {
    return errors::wrapCallBool(TTF_SetFontSize(get(), pointSize));
}

std::optional<Hinting> Font::getHinting() const noexcept { return fromNative<Hinting>(TTF_GetFontHinting(get())); }
void Font::setHinting(Hinting hinting) const noexcept { TTF_SetFontHinting(get(), toNative(hinting)); }

std::optional<HorizontalAlignment> Font::getWrapAlignment() const noexcept {
    return fromNative<HorizontalAlignment>(TTF_GetFontWrapAlignment(get()));
}
void Font::setWrapAlignment(HorizontalAlignment alignment) const noexcept {
    TTF_SetFontWrapAlignment(get(), toNative(alignment));
}

std::optional<Direction> Font::getDirection() const noexcept {
    return fromNative<Direction>(TTF_GetFontDirection(get()));
}
Result<void> Font::setDirection(Direction direction) const noexcept {
    return errors::wrapCallBool(TTF_SetFontDirection(get(), toNative(direction)));
}

Result<Surface> Font::renderTextSolid(std::string_view text, Color fg) const noexcept {
    return adopt(TTF_RenderText_Solid(get(), text.data(), text.size(), sdl3bind::toNative(fg)));
}

Result<Surface> Font::renderTextShaded(std::string_view text, Color fg, Color bg) const noexcept {
    return adopt(
        TTF_RenderText_Shaded(get(), text.data(), text.size(), sdl3bind::toNative(fg), sdl3bind::toNative(bg)));
}

Result<Surface> Font::renderTextBlended(std::string_view text, Color fg) const noexcept {
    return adopt(TTF_RenderText_Blended(get(), text.data(), text.size(), sdl3bind::toNative(fg)));
}

Result<Surface> Font::renderTextBlendedWrapped(std::string_view text, Color fg, int wrapWidth) const noexcept {
    return adopt(TTF_RenderText_Blended_Wrapped(get(), text.data(), text.size(), sdl3bind::toNative(fg), wrapWidth));
}

Result<Measurement> Font::measureString(std::string_view text, int maxWidth) const noexcept {
    Measurement ret;
    if(auto ok = errors::wrapCallBool(TTF_MeasureString(get(), text.data(), text.size(), maxWidth,
                                                        &ret.measured_width, &ret.measured_length));
       !ok)
        return std::unexpected(ok.error());
    return ret;
}

}  // namespace sdl3bind::ttf
