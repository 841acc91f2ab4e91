// Copyright (c) 2026, WH, All rights reserved.
#include "Tray.h"

namespace sdl3bind::tray {

void Entry::setLabel(const char *label) const noexcept { SDL_SetTrayEntryLabel(m_entry, label); }

std::optional<std::string_view> Entry::getLabel() const noexcept {
    const char *label = SDL_GetTrayEntryLabel(m_entry);
    if(label == nullptr) return std::nullopt;
    return std::string_view{label};
}

void Entry::setChecked(bool checked) const noexcept { SDL_SetTrayEntryChecked(m_entry, checked); }
bool Entry::getChecked() const noexcept { return SDL_GetTrayEntryChecked(m_entry); }

void Entry::setEnabled(bool enabled) const noexcept { SDL_SetTrayEntryEnabled(m_entry, enabled); }
bool Entry::getEnabled() const noexcept { return SDL_GetTrayEntryEnabled(m_entry); }

void Entry::clearCallback() const noexcept { SDL_SetTrayEntryCallback(m_entry, nullptr, nullptr); }

void Entry::click() const noexcept { SDL_ClickTrayEntry(m_entry); }

void Entry::remove() const noexcept { SDL_RemoveTrayEntry(m_entry); }

Result<Menu> Entry::createSubmenu() const noexcept {
    auto menu = errors::wrapCallPtr(SDL_CreateTraySubmenu(m_entry));
    if(!menu) return std::unexpected(menu.error());
    return Menu{*menu};
}

std::optional<Menu> Entry::getSubmenu() const noexcept {
    SDL_TrayMenu *menu = SDL_GetTraySubmenu(m_entry);
    if(menu == nullptr) return std::nullopt;
    return Menu{menu};
}

Menu Entry::getParent() const noexcept { return Menu{SDL_GetTrayEntryParent(m_entry)}; }

std::vector<Entry> Menu::getEntries() const {
    int count = 0;
    const SDL_TrayEntry **entries = SDL_GetTrayEntries(m_menu, &count);

    std::vector<Entry> ret;
    if(entries == nullptr) return ret;
    ret.reserve(count);
    for(int i = 0; i < count; i++) {
        // the tray api hands out const entries but every setter takes them mutable
        ret.emplace_back(const_cast<SDL_TrayEntry *>(entries[i]));
    }
    return ret;
}

Result<Entry> Menu::insertAt(int pos, std::optional<const char *> label, EntryFlags flags) const noexcept {
    auto entry = errors::wrapCallPtr(SDL_InsertTrayEntryAt(m_menu, pos, label.value_or(nullptr), flags.toNative()));
    if(!entry) return std::unexpected(entry.error());
    return Entry{*entry};
}

std::optional<Entry> Menu::getParentEntry() const noexcept {
    SDL_TrayEntry *entry = SDL_GetTrayMenuParentEntry(m_menu);
    if(entry == nullptr) return std::nullopt;
    return Entry{entry};
}

std::optional<SDL_Tray *> Menu::getParentTray() const noexcept {
    SDL_Tray *tray = SDL_GetTrayMenuParentTray(m_menu);
    if(tray == nullptr) return std::nullopt;
    return tray;
}

Result<Tray> Tray::create(std::optional<SurfaceRef> icon, const char *tooltip) noexcept {
    auto tray = errors::wrapCallPtr(SDL_CreateTray(icon ? icon->get() : nullptr, tooltip));
    if(!tray) return std::unexpected(tray.error());
    return Tray{*tray};
}

void Tray::setIcon(std::optional<SurfaceRef> icon) const noexcept {
    SDL_SetTrayIcon(get(), icon ? icon->get() : nullptr);
}

void Tray::setTooltip(const char *tooltip) const noexcept { SDL_SetTrayTooltip(get(), tooltip); }

Result<Menu> Tray::createMenu() const noexcept {
    auto menu = errors::wrapCallPtr(SDL_CreateTrayMenu(get()));
    if(!menu) return std::unexpected(menu.error());
    return Menu{*menu};
}

std::optional<Menu> Tray::getMenu() const noexcept {
    SDL_TrayMenu *menu = SDL_GetTrayMenu(get());
    if(menu == nullptr) return std::nullopt;
    return Menu{menu};
}

void update() noexcept { SDL_UpdateTrays(); }

}  // namespace sdl3bind::tray
