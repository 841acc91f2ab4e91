// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_TRAY_H
#define SDL3BIND_TRAY_H

#include "Errors.h"
#include "Handle.h"
#include "Surface.h"
#include "TrayApi.h"

#include <SDL3/SDL_tray.h>

#include <optional>
#include <string_view>
#include <vector>

// system tray icons and their (nested) menus
// menus and entries are owned by the tray, they die with it
namespace sdl3bind::tray {

class Menu;
class Tray;

class Entry {
   public:
    constexpr explicit Entry(SDL_TrayEntry *entry) noexcept : m_entry(entry) {}

    [[nodiscard]] constexpr SDL_TrayEntry *get() const noexcept { return m_entry; }

    void setLabel(const char *label) const noexcept;
    // std::nullopt for separators
    [[nodiscard]] std::optional<std::string_view> getLabel() const noexcept;

    // checkboxes only
    void setChecked(bool checked) const noexcept;
    [[nodiscard]] bool getChecked() const noexcept;

    void setEnabled(bool enabled) const noexcept;
    [[nodiscard]] bool getEnabled() const noexcept;

    // Fn gets called with userdata whenever the entry is clicked, userdata has to outlive the entry
    template <typename T, void (*Fn)(T *userdata, Entry entry)>
    void setCallback(T *userdata) const noexcept {
        SDL_SetTrayEntryCallback(
            m_entry,
            [](void *ud, SDL_TrayEntry *entry) { Fn(static_cast<T *>(ud), Entry{entry}); },
            static_cast<void *>(userdata));
    }
    void clearCallback() const noexcept;

    // simulate a click
    void click() const noexcept;
    // invalidates this entry (and its submenu)
    void remove() const noexcept;

    // the entry must have been created with EntryFlags::submenu
    [[nodiscard]] Result<Menu> createSubmenu() const noexcept;
    [[nodiscard]] std::optional<Menu> getSubmenu() const noexcept;

    [[nodiscard]] Menu getParent() const noexcept;

    bool operator==(const Entry &) const = default;

   private:
    SDL_TrayEntry *m_entry;
};

class Menu {
   public:
    constexpr explicit Menu(SDL_TrayMenu *menu) noexcept : m_menu(menu) {}

    [[nodiscard]] constexpr SDL_TrayMenu *get() const noexcept { return m_menu; }

    [[nodiscard]] std::vector<Entry> getEntries() const;

    // pos -1 appends, label std::nullopt inserts a separator
    [[nodiscard]] Result<Entry> insertAt(int pos, std::optional<const char *> label, EntryFlags flags) const noexcept;

    // only one of these is set: submenus have a parent entry, top level menus a parent tray
    [[nodiscard]] std::optional<Entry> getParentEntry() const noexcept;
    [[nodiscard]] std::optional<SDL_Tray *> getParentTray() const noexcept;

    bool operator==(const Menu &) const = default;

   private:
    SDL_TrayMenu *m_menu;
};

class Tray {
    NOCOPY(Tray)
   public:
    // no icon = platform default
    [[nodiscard]] static Result<Tray> create(std::optional<SurfaceRef> icon, const char *tooltip) noexcept;

    Tray(Tray &&) noexcept = default;
    Tray &operator=(Tray &&) noexcept = default;
    ~Tray() = default;

    [[nodiscard]] SDL_Tray *get() const noexcept { return m_tray.get(); }

    void setIcon(std::optional<SurfaceRef> icon) const noexcept;
    void setTooltip(const char *tooltip) const noexcept;

    // replaces the previous one, if any
    [[nodiscard]] Result<Menu> createMenu() const noexcept;
    [[nodiscard]] std::optional<Menu> getMenu() const noexcept;

   private:
    explicit Tray(SDL_Tray *tray) noexcept : m_tray(tray) {}

    UniquePtr<SDL_Tray, SDL_DestroyTray> m_tray;
};

// process tray events, only needed when not pumping events some other way
void update() noexcept;

}  // namespace sdl3bind::tray

#endif
