// Copyright (c) 2026, WH, All rights reserved.
#include "Examples.h"

#include "Events.h"
#include "Init.h"
#include "Logging.h"
#include "Surface.h"
#include "Tray.h"

#include <chrono>
#include <random>
#include <variant>

namespace Examples {
namespace {  // static

using namespace sdl3bind;

struct State {
    Surface icon;
    tray::Tray *tray{nullptr};
    std::mt19937 rng;
    bool quit{false};
};

void switchIconColor(State *state, tray::Entry entry) {
    std::uniform_real_distribution<float> channel{0.f, 1.f};
    const FColor color{channel(state->rng), channel(state->rng), channel(state->rng), 1.f};
    if(!state->icon.clear(color)) return;

    // the entry knows which tray it belongs to
    const auto owner = entry.getParent().getParentTray();
    if(owner && *owner == state->tray->get()) state->tray->setIcon(state->icon);
}

void toggleButton(State *state, tray::Entry entry) {
    const tray::Menu submenu = entry.getParent();
    const auto entries = submenu.getEntries();
    if(entries.size() < 2) return;

    const tray::Entry &button = entries[1];
    const bool enable = !button.getEnabled();
    button.setEnabled(enable);
    button.setLabel(enable ? "Enabled" : "Disabled");
    debugLog("button is now {}", button.getLabel().value_or("?"));

    if(submenu.getParentEntry()) state->tray->setTooltip("Toggled sub-menu checkbox");
}

void quitClicked(State *state, tray::Entry /*entry*/) { state->quit = true; }

}  // namespace

int runTray(int /*argc*/, char * /*argv*/[]) {
    auto videoInit = Subsystem::create({.video = true});
    if(!videoInit) return 1;

    auto icon = Surface::create(32, 32, PixelFormat::abgr8888);
    if(!icon) return 1;
    if(!icon->clear({1.f, 0.f, 1.f, 1.f})) return 1;

    State state{.icon = std::move(*icon),
                .rng = std::mt19937{static_cast<uint32_t>(
                    std::chrono::steady_clock::now().time_since_epoch().count())}};

    auto trayIcon = tray::Tray::create(state.icon, "SDL3 Tray Example");
    if(!trayIcon) return 1;
    state.tray = &*trayIcon;

    auto menu = trayIcon->createMenu();
    if(!menu) return 1;
    logIf(trayIcon->getMenu() != menu.value(), "getMenu() doesn't return the created menu");

    // checkbox, clicking it flips the checked state
    auto checkbox = menu->insertAt(-1, "Checkbox", {.checkbox = true});
    if(!checkbox) return 1;
    checkbox->setChecked(true);
    checkbox->click();
    debugLog("checkbox checked after click: {}", checkbox->getChecked());

    auto changeColor = menu->insertAt(0, "Change Color", {.button = true});
    if(!changeColor) return 1;
    changeColor->setCallback<State, switchIconColor>(&state);

    // separator
    if(!menu->insertAt(-1, std::nullopt, {.button = true})) return 1;

    auto deleteMe = menu->insertAt(-1, "DELETE ME", {.button = true});
    if(!deleteMe) return 1;
    deleteMe->remove();

    auto submenuEntry = menu->insertAt(0, "Sub Menu", {.submenu = true});
    if(!submenuEntry) return 1;
    auto submenu = submenuEntry->createSubmenu();
    if(!submenu) return 1;
    logIf(submenuEntry->getSubmenu() != submenu.value(), "getSubmenu() doesn't return the created submenu");

    auto quitButton = menu->insertAt(-1, "Quit", {.button = true});
    if(!quitButton) return 1;
    quitButton->setCallback<State, quitClicked>(&state);

    auto enableButton = submenu->insertAt(-1, "Enable Button", {.checkbox = true});
    if(!enableButton) return 1;
    enableButton->setCallback<State, toggleButton>(&state);
    if(!submenu->insertAt(-1, "Disabled", {.button = true, .disabled = true})) return 1;

    debugLog("tray menu has {} entries", menu->getEntries().size());

    while(!state.quit) {
        tray::update();
        auto event = events::waitTimeout(200);
        if(!event) continue;
        if(std::holds_alternative<events::Quit>(*event) || std::holds_alternative<events::Terminating>(*event))
            break;
    }

    return 0;
}

}  // namespace Examples
