// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_HANDLE_H
#define SDL3BIND_HANDLE_H

#include "BaseEnvironment.h"

#include <memory>
#include <utility>

// exclusive-owner wrappers for the native handle kinds
// every owner is move-only and releases its handle exactly once, on destruction or reset()

namespace sdl3bind {

// function pointer as a deleter, for std::unique_ptr over C handles
template <auto Fn>
struct FnDeleter {
    template <typename T>
    void operator()(T *p) const noexcept {
        Fn(p);
    }
};

// e.g. UniquePtr<SDL_Window, SDL_DestroyWindow>
template <typename T, auto Fn>
using UniquePtr = std::unique_ptr<T, FnDeleter<Fn>>;

// integer-identified handles (SDL_PropertiesID, SDL_AudioDeviceID), Invalid is never released
template <typename Id, auto Fn, Id Invalid = Id{0}>
class UniqueId {
    NOCOPY(UniqueId)
   public:
    constexpr UniqueId() noexcept = default;
    constexpr explicit UniqueId(Id id) noexcept : m_id(id) {}
    ~UniqueId() { reset(); }

    constexpr UniqueId(UniqueId &&other) noexcept : m_id(std::exchange(other.m_id, Invalid)) {}
    UniqueId &operator=(UniqueId &&other) noexcept {
        if(this != &other) {
            reset();
            m_id = std::exchange(other.m_id, Invalid);
        }
        return *this;
    }

    [[nodiscard]] constexpr Id get() const noexcept { return m_id; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_id != Invalid; }

    // give up ownership without releasing
    [[nodiscard]] constexpr Id release() noexcept { return std::exchange(m_id, Invalid); }

    void reset(Id id = Invalid) noexcept {
        const Id old = std::exchange(m_id, id);
        if(old != Invalid) Fn(old);
    }

   private:
    Id m_id{Invalid};
};

// handles that can only be released through the object that created them (GPU resources -> device)
// the parent must outlive the handle, nothing here checks that
template <typename Parent, typename T, auto Fn>
class ParentOwned {
    NOCOPY(ParentOwned)
   public:
    constexpr ParentOwned() noexcept = default;
    constexpr ParentOwned(Parent *parent, T *handle) noexcept : m_parent(parent), m_handle(handle) {}
    ~ParentOwned() { reset(); }

    constexpr ParentOwned(ParentOwned &&other) noexcept
        : m_parent(std::exchange(other.m_parent, nullptr)), m_handle(std::exchange(other.m_handle, nullptr)) {}
    ParentOwned &operator=(ParentOwned &&other) noexcept {
        if(this != &other) {
            reset();
            m_parent = std::exchange(other.m_parent, nullptr);
            m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
    }

    [[nodiscard]] constexpr T *get() const noexcept { return m_handle; }
    [[nodiscard]] constexpr Parent *parent() const noexcept { return m_parent; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_handle != nullptr; }

    [[nodiscard]] constexpr T *release() noexcept {
        m_parent = nullptr;
        return std::exchange(m_handle, nullptr);
    }

    void reset() noexcept {
        if(m_handle != nullptr) Fn(m_parent, m_handle);
        m_handle = nullptr;
        m_parent = nullptr;
    }

   private:
    Parent *m_parent{nullptr};
    T *m_handle{nullptr};
};

}  // namespace sdl3bind

#endif
