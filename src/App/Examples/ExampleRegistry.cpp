// Copyright (c) 2026, WH, All rights reserved.
#include "Examples.h"

#include <array>

namespace Examples {

static constexpr std::array sExamples{
    ExampleDescriptor{"callbacks", "window filled with a solid color, driven by the main callbacks", runCallbacks},
    ExampleDescriptor{"message_box", "a little guessing game made of message boxes", runMessageBox},
    ExampleDescriptor{"tray", "system tray icon with a menu, a submenu and checkboxes", runTray},
#ifdef SDL3BIND_FEATURE_TTF
    ExampleDescriptor{"ttf", "font metrics and the different text rendering modes (needs -font_path)", runTtf},
#endif
#ifdef SDL3BIND_FEATURE_GPU_SHADERS
    ExampleDescriptor{"copy_consistency", "GPU copy passes between draws of the same frame", runCopyConsistency},
#endif
};

std::span<const ExampleDescriptor> getAllExamples() { return sExamples; }

const ExampleDescriptor *findExample(std::string_view name) {
    for(const auto &example : sExamples) {
        if(name == example.name) return &example;
    }
    return nullptr;
}

}  // namespace Examples
