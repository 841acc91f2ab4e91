// Copyright (c) 2026, WH, All rights reserved.
#include "Init.h"

#include <SDL3/SDL_hints.h>
#include <SDL3/SDL_init.h>
#include <SDL3/SDL_version.h>

#include <utility>

namespace sdl3bind {
namespace {  // static

const char *metadataPropertyName(AppMetadataProperty property) noexcept {
    switch(property) {
        case AppMetadataProperty::name:
            return SDL_PROP_APP_METADATA_NAME_STRING;
        case AppMetadataProperty::version:
            return SDL_PROP_APP_METADATA_VERSION_STRING;
        case AppMetadataProperty::identifier:
            return SDL_PROP_APP_METADATA_IDENTIFIER_STRING;
        case AppMetadataProperty::creator:
            return SDL_PROP_APP_METADATA_CREATOR_STRING;
        case AppMetadataProperty::copyright:
            return SDL_PROP_APP_METADATA_COPYRIGHT_STRING;
        case AppMetadataProperty::url:
            return SDL_PROP_APP_METADATA_URL_STRING;
        case AppMetadataProperty::type:
            return SDL_PROP_APP_METADATA_TYPE_STRING;
    }
    std::unreachable();
}

SDL_HintPriority toNative(HintPriority priority) noexcept {
    switch(priority) {
        case HintPriority::default_priority:
            return SDL_HINT_DEFAULT;
        case HintPriority::normal:
            return SDL_HINT_NORMAL;
        case HintPriority::override_priority:
            return SDL_HINT_OVERRIDE;
    }
    std::unreachable();
}

}  // namespace

Result<void> init(InitFlags flags) noexcept { return errors::wrapCallBool(SDL_InitSubSystem(flags.toNative())); }

void quit(InitFlags flags) noexcept { SDL_QuitSubSystem(flags.toNative()); }

InitFlags wasInit(InitFlags flags) noexcept { return InitFlags::fromNative(SDL_WasInit(flags.toNative())); }

void shutdown() noexcept { SDL_Quit(); }

Result<Subsystem> Subsystem::create(InitFlags flags) noexcept {
    if(auto res = init(flags); !res) return std::unexpected(res.error());
    return Subsystem{flags};
}

Subsystem::Subsystem(Subsystem &&other) noexcept
    : m_flags(other.m_flags), m_active(std::exchange(other.m_active, false)) {}

Subsystem &Subsystem::operator=(Subsystem &&other) noexcept {
    if(this != &other) {
        if(m_active) quit(m_flags);
        m_flags = other.m_flags;
        m_active = std::exchange(other.m_active, false);
    }
    return *this;
}

Subsystem::~Subsystem() {
    if(m_active) quit(m_flags);
}

Result<void> setAppMetadata(const char *appName, const char *appVersion, const char *appIdentifier) noexcept {
    return errors::wrapCallBool(SDL_SetAppMetadata(appName, appVersion, appIdentifier));
}

Result<void> setAppMetadataProperty(AppMetadataProperty property, const char *value) noexcept {
    return errors::wrapCallBool(SDL_SetAppMetadataProperty(metadataPropertyName(property), value));
}

std::optional<std::string_view> getAppMetadataProperty(AppMetadataProperty property) noexcept {
    const char *value = SDL_GetAppMetadataProperty(metadataPropertyName(property));
    if(value == nullptr) return std::nullopt;
    return value;
}

Version Version::get() noexcept {
    const int v = SDL_GetVersion();
    return {.major = SDL_VERSIONNUM_MAJOR(v), .minor = SDL_VERSIONNUM_MINOR(v), .micro = SDL_VERSIONNUM_MICRO(v)};
}

std::optional<std::string_view> Version::getRevision() noexcept {
    const char *rev = SDL_GetRevision();
    if(rev == nullptr || *rev == '\0') return std::nullopt;
    return rev;
}

Result<void> setHint(const char *name, const char *value, HintPriority priority) noexcept {
    return errors::wrapCallBool(SDL_SetHintWithPriority(name, value, toNative(priority)));
}

Result<void> resetHint(const char *name) noexcept { return errors::wrapCallBool(SDL_ResetHint(name)); }

std::optional<std::string_view> getHint(const char *name) noexcept {
    const char *value = SDL_GetHint(name);
    if(value == nullptr) return std::nullopt;
    return value;
}

}  // namespace sdl3bind
