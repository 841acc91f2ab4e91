// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_INIT_H
#define SDL3BIND_INIT_H

#include "Errors.h"
#include "InitApi.h"

#include <SDL3/SDL_version.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace sdl3bind {

// subsystem init is reference counted by SDL, every successful init() needs a matching quit()
Result<void> init(InitFlags flags) noexcept;
void quit(InitFlags flags) noexcept;

// which of the given subsystems are currently initialized (all of them for a default InitFlags{})
[[nodiscard]] InitFlags wasInit(InitFlags flags = {}) noexcept;

// cleans up all subsystems regardless of the init count, call once before exiting
void shutdown() noexcept;

// init(flags) on construction, quit(flags) on destruction
class Subsystem {
    NOCOPY(Subsystem)
   public:
    [[nodiscard]] static Result<Subsystem> create(InitFlags flags) noexcept;

    Subsystem(Subsystem &&other) noexcept;
    Subsystem &operator=(Subsystem &&other) noexcept;
    ~Subsystem();

    [[nodiscard]] const InitFlags &flags() const noexcept { return m_flags; }

   private:
    explicit Subsystem(InitFlags flags) noexcept : m_flags(flags), m_active(true) {}

    InitFlags m_flags;
    bool m_active{false};
};

// nullptr leaves a field unset
Result<void> setAppMetadata(const char *appName, const char *appVersion, const char *appIdentifier) noexcept;

enum class AppMetadataProperty : uint8_t { name, version, identifier, creator, copyright, url, type };

Result<void> setAppMetadataProperty(AppMetadataProperty property, const char *value) noexcept;
[[nodiscard]] std::optional<std::string_view> getAppMetadataProperty(AppMetadataProperty property) noexcept;

struct Version {
    int major{0};
    int minor{0};
    int micro{0};

    // the SDL headers this was built against
    [[nodiscard]] static constexpr Version compiled() noexcept {
        return {.major = SDL_MAJOR_VERSION, .minor = SDL_MINOR_VERSION, .micro = SDL_MICRO_VERSION};
    }
    // the SDL library loaded at runtime
    [[nodiscard]] static Version get() noexcept;

    [[nodiscard]] constexpr bool atLeast(int wantMajor, int wantMinor, int wantMicro) const noexcept {
        if(major != wantMajor) return major > wantMajor;
        if(minor != wantMinor) return minor > wantMinor;
        return micro >= wantMicro;
    }

    // e.g. "release-3.2.0-0-g535d80bad", nothing for builds without revision information
    [[nodiscard]] static std::optional<std::string_view> getRevision() noexcept;

    bool operator==(const Version &) const = default;
};

enum class HintPriority : uint8_t { default_priority, normal, override_priority };

Result<void> setHint(const char *name, const char *value, HintPriority priority = HintPriority::normal) noexcept;
Result<void> resetHint(const char *name) noexcept;
// unset hints are not an error
[[nodiscard]] std::optional<std::string_view> getHint(const char *name) noexcept;

}  // namespace sdl3bind

#endif
