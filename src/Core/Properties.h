// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_PROPERTIES_H
#define SDL3BIND_PROPERTIES_H

#include "Errors.h"
#include "Handle.h"

#include <SDL3/SDL_properties.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// SDL property groups: string-keyed bags of pointer/string/number/float/bool values
namespace sdl3bind::properties {

using Value = std::variant<void *, std::string, Sint64, float, bool>;

enum class Type : uint8_t { pointer, string, number, floating, boolean };

namespace detail {
Result<void> set(SDL_PropertiesID id, const char *name, const Value &value) noexcept;
std::optional<Value> get(SDL_PropertiesID id, const char *name);
std::optional<Type> getType(SDL_PropertiesID id, const char *name) noexcept;
bool has(SDL_PropertiesID id, const char *name) noexcept;
Result<void> clear(SDL_PropertiesID id, const char *name) noexcept;
Result<void> lock(SDL_PropertiesID id) noexcept;
void unlock(SDL_PropertiesID id) noexcept;
Result<std::vector<std::string>> names(SDL_PropertiesID id);
Result<void> copy(SDL_PropertiesID src, SDL_PropertiesID dst) noexcept;
}  // namespace detail

// the operations shared by owned groups and borrowed ones, Derived provides id()
template <typename Derived>
class Accessors {
   public:
    Result<void> set(const char *name, const Value &value) const noexcept {
        return detail::set(self().id(), name, value);
    }
    [[nodiscard]] std::optional<Value> get(const char *name) const { return detail::get(self().id(), name); }

    // typed shorthands, std::nullopt if missing or of another type
    template <typename T>
    [[nodiscard]] std::optional<T> getAs(const char *name) const {
        auto value = this->get(name);
        if(!value) return std::nullopt;
        if(auto *typed = std::get_if<T>(&*value)) return std::move(*typed);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Type> getType(const char *name) const noexcept {
        return detail::getType(self().id(), name);
    }
    [[nodiscard]] bool has(const char *name) const noexcept { return detail::has(self().id(), name); }
    Result<void> clear(const char *name) const noexcept { return detail::clear(self().id(), name); }

    // held locks make the group safe to modify/read from multiple threads as one operation
    Result<void> lock() const noexcept { return detail::lock(self().id()); }
    void unlock() const noexcept { detail::unlock(self().id()); }

    [[nodiscard]] Result<std::vector<std::string>> names() const { return detail::names(self().id()); }

    template <typename Other>
    Result<void> copyTo(const Accessors<Other> &dst) const noexcept {
        return detail::copy(self().id(), static_cast<const Other &>(dst).id());
    }

   private:
    [[nodiscard]] const Derived &self() const noexcept { return static_cast<const Derived &>(*this); }
};

// not owned, e.g. the global group or groups owned by another object (windows, displays...)
class Borrowed : public Accessors<Borrowed> {
   public:
    constexpr explicit Borrowed(SDL_PropertiesID id) noexcept : m_id(id) {}
    [[nodiscard]] constexpr SDL_PropertiesID id() const noexcept { return m_id; }

   private:
    SDL_PropertiesID m_id;
};

class Group : public Accessors<Group> {
   public:
    [[nodiscard]] static Result<Group> create() noexcept;
    [[nodiscard]] static Result<Borrowed> getGlobal() noexcept;

    [[nodiscard]] SDL_PropertiesID id() const noexcept { return m_handle.get(); }
    [[nodiscard]] Borrowed borrow() const noexcept { return Borrowed{id()}; }
    [[nodiscard]] SDL_PropertiesID release() noexcept { return m_handle.release(); }

   private:
    explicit Group(SDL_PropertiesID id) noexcept : m_handle(id) {}

    UniqueId<SDL_PropertiesID, SDL_DestroyProperties> m_handle;
};

}  // namespace sdl3bind::properties

#endif
