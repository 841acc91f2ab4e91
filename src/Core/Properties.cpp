// Copyright (c) 2026, WH, All rights reserved.
#include "Properties.h"

#include <type_traits>

namespace sdl3bind::properties {

Result<Group> Group::create() noexcept {
    auto id = errors::wrapCall(SDL_CreateProperties(), SDL_PropertiesID{0});
    if(!id) return std::unexpected(id.error());
    return Group{*id};
}

Result<Borrowed> Group::getGlobal() noexcept {
    auto id = errors::wrapCall(SDL_GetGlobalProperties(), SDL_PropertiesID{0});
    if(!id) return std::unexpected(id.error());
    return Borrowed{*id};
}

namespace detail {

Result<void> set(SDL_PropertiesID id, const char *name, const Value &value) noexcept {
    return std::visit(
        [&](const auto &v) -> Result<void> {
            using T = std::decay_t<decltype(v)>;
            if constexpr(std::is_same_v<T, void *>)
                return errors::wrapCallBool(SDL_SetPointerProperty(id, name, v));
            else if constexpr(std::is_same_v<T, std::string>)
                return errors::wrapCallBool(SDL_SetStringProperty(id, name, v.c_str()));
            else if constexpr(std::is_same_v<T, Sint64>)
                return errors::wrapCallBool(SDL_SetNumberProperty(id, name, v));
            else if constexpr(std::is_same_v<T, float>)
                return errors::wrapCallBool(SDL_SetFloatProperty(id, name, v));
            else
                return errors::wrapCallBool(SDL_SetBooleanProperty(id, name, v));
        },
        value);
}

std::optional<Value> get(SDL_PropertiesID id, const char *name) {
    switch(SDL_GetPropertyType(id, name)) {
        case SDL_PROPERTY_TYPE_POINTER:
            return Value{SDL_GetPointerProperty(id, name, nullptr)};
        case SDL_PROPERTY_TYPE_STRING: {
            const char *str = SDL_GetStringProperty(id, name, nullptr);
            if(str == nullptr) return std::nullopt;
            return Value{std::string{str}};
        }
        case SDL_PROPERTY_TYPE_NUMBER:
            return Value{SDL_GetNumberProperty(id, name, 0)};
        case SDL_PROPERTY_TYPE_FLOAT:
            return Value{SDL_GetFloatProperty(id, name, 0.f)};
        case SDL_PROPERTY_TYPE_BOOLEAN:
            return Value{SDL_GetBooleanProperty(id, name, false)};
        case SDL_PROPERTY_TYPE_INVALID:
        default:
            return std::nullopt;
    }
}

std::optional<Type> getType(SDL_PropertiesID id, const char *name) noexcept {
    switch(SDL_GetPropertyType(id, name)) {
        case SDL_PROPERTY_TYPE_POINTER:
            return Type::pointer;
        case SDL_PROPERTY_TYPE_STRING:
            return Type::string;
        case SDL_PROPERTY_TYPE_NUMBER:
            return Type::number;
        case SDL_PROPERTY_TYPE_FLOAT:
            return Type::floating;
        case SDL_PROPERTY_TYPE_BOOLEAN:
            return Type::boolean;
        case SDL_PROPERTY_TYPE_INVALID:
        default:
            return std::nullopt;
    }
}

bool has(SDL_PropertiesID id, const char *name) noexcept { return SDL_HasProperty(id, name); }

Result<void> clear(SDL_PropertiesID id, const char *name) noexcept {
    return errors::wrapCallBool(SDL_ClearProperty(id, name));
}

Result<void> lock(SDL_PropertiesID id) noexcept { return errors::wrapCallBool(SDL_LockProperties(id)); }

void unlock(SDL_PropertiesID id) noexcept { SDL_UnlockProperties(id); }

Result<std::vector<std::string>> names(SDL_PropertiesID id) {
    std::vector<std::string> ret;
    auto collect = [](void *userdata, SDL_PropertiesID /**/, const char *name) -> void {
        static_cast<std::vector<std::string> *>(userdata)->emplace_back(name);
    };
    if(auto res = errors::wrapCallBool(SDL_EnumerateProperties(id, collect, &ret)); !res) {
        return std::unexpected(res.error());
    }
    return ret;
}

Result<void> copy(SDL_PropertiesID src, SDL_PropertiesID dst) noexcept {
    return errors::wrapCallBool(SDL_CopyProperties(src, dst));
}

}  // namespace detail
}  // namespace sdl3bind::properties
