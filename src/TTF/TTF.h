// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_TTF_H
#define SDL3BIND_TTF_H

#include "Errors.h"
#include "Handle.h"
#include "PixelsApi.h"
#include "Surface.h"
#include "TTFApi.h"

#include <SDL3_ttf/SDL_ttf.h>

#include <optional>
#include <string>
#include <string_view>

// SDL3_ttf: font loading, metrics and text rendering to surfaces
namespace sdl3bind::ttf {

// reference counted by SDL3_ttf, every init() needs its quit()
Result<void> init() noexcept;
void quit() noexcept;
// how many times init() was called without a matching quit()
[[nodiscard]] int wasInit() noexcept;

struct Version {
    int major{0};
    int minor{0};
    int micro{0};

    [[nodiscard]] static constexpr Version compiled() noexcept {
        return {SDL_TTF_MAJOR_VERSION, SDL_TTF_MINOR_VERSION, SDL_TTF_MICRO_VERSION};
    }

    bool operator==(const Version &) const = default;
};

// the version of the linked library
[[nodiscard]] Version getVersion() noexcept;
[[nodiscard]] Version getFreeTypeVersion() noexcept;
// all zeroes if built without HarfBuzz
[[nodiscard]] Version getHarfBuzzVersion() noexcept;

// OpenType tags, e.g. "kern" <-> 0x6b65726e
[[nodiscard]] Uint32 stringToTag(const char *string) noexcept;
[[nodiscard]] std::string tagToString(Uint32 tag);

struct GlyphMetrics {
    int min_x{0};
    int max_x{0};
    int min_y{0};
    int max_y{0};
    int advance{0};
    bool operator==(const GlyphMetrics &) const = default;
};

struct Measurement {
    // pixels
    int measured_width{0};
    // bytes of the input that fit
    size_t measured_length{0};
    bool operator==(const Measurement &) const = default;
};

class Font {
    NOCOPY(Font)
   public:
    struct CreateProperties {
        std::string filename;
        float size{12.f};
    };

    [[nodiscard]] static Result<Font> open(const char *path, float pointSize) noexcept;
    [[nodiscard]] static Result<Font> openWithProperties(const CreateProperties &props) noexcept;

    Font(Font &&) noexcept = default;
    Font &operator=(Font &&) noexcept = default;
    ~Font() = default;

    [[nodiscard]] TTF_Font *get() const noexcept { return m_font.get(); }

    [[nodiscard]] std::optional<std::string_view> getFamilyName() const noexcept;
    [[nodiscard]] std::optional<std::string_view> getStyleName() const noexcept;

    [[nodiscard]] bool isFixedWidth() const noexcept;
    [[nodiscard]] bool isScalable() const noexcept;

    [[nodiscard]] int getHeight() const noexcept;
    [[nodiscard]] int getAscent() const noexcept;
    [[nodiscard]] int getDescent() const noexcept;
    [[nodiscard]] int getLineSkip() const noexcept;
    [[nodiscard]] int getNumFaces() const noexcept;

    [[nodiscard]] bool getKerning() const noexcept;
    void setKerning(bool enabled) const noexcept;

    [[nodiscard]] bool hasGlyph(Uint32 codepoint) const noexcept;
    [[nodiscard]] Result<GlyphMetrics> getGlyphMetrics(Uint32 codepoint) const noexcept;
    [[nodiscard]] Result<int> getGlyphKerning(Uint32 previous, Uint32 codepoint) const noexcept;

    [[nodiscard]] FontStyleFlags getStyle() const noexcept;
    void setStyle(FontStyleFlags style) const noexcept;

    [[nodiscard]] int getOutline() const noexcept;
    Result<void> setOutline(int outline) const noexcept;

    [[nodiscard]] Result<float> getSize() const noexcept;
    Result<void> setSize(float pointSize) const noexcept;

    [[nodiscard]] std::optional<Hinting> getHinting() const noexcept;
    void setHinting(Hinting hinting) const noexcept;

    [[nodiscard]] std::optional<HorizontalAlignment> getWrapAlignment() const noexcept;
    void setWrapAlignment(HorizontalAlignment alignment) const noexcept;

    [[nodiscard]] std::optional<Direction> getDirection() const noexcept;
    Result<void> setDirection(Direction direction) const noexcept;

    // UTF-8 text, one line; solid: 8-bit palettized without antialiasing, shaded: antialiased onto bg,
    // blended: antialiased ARGB
    [[nodiscard]] Result<Surface> renderTextSolid(std::string_view text, Color fg) const noexcept;
    [[nodiscard]] Result<Surface> renderTextShaded(std::string_view text, Color fg, Color bg) const noexcept;
    [[nodiscard]] Result<Surface> renderTextBlended(std::string_view text, Color fg) const noexcept;
    // wraps on newlines and at wrapWidth pixels (0 = newlines only)
    [[nodiscard]] Result<Surface> renderTextBlendedWrapped(std::string_view text, Color fg,
                                                           int wrapWidth) const noexcept;

    // how much of text fits into maxWidth pixels (0 = no limit)
    [[nodiscard]] Result<Measurement> measureString(std::string_view text, int maxWidth) const noexcept;

   private:
    explicit Font(TTF_Font *font) noexcept : m_font(font) {}

    UniquePtr<TTF_Font, TTF_CloseFont> m_font;
};

}  // namespace sdl3bind::ttf

#endif
