// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef EXAMPLES_H
#define EXAMPLES_H

#include "config.h"

#include <span>
#include <string_view>

namespace Examples {

struct ExampleDescriptor {
    const char *name{nullptr};
    const char *description{nullptr};
    // gets the arguments that weren't consumed as convars, argv[0] included
    int (*run)(int argc, char *argv[]){nullptr};
};

// implemented in ExampleRegistry.cpp
std::span<const ExampleDescriptor> getAllExamples();
// nullptr if there is no such example
const ExampleDescriptor *findExample(std::string_view name);

int runCallbacks(int argc, char *argv[]);
int runMessageBox(int argc, char *argv[]);
int runTray(int argc, char *argv[]);
#ifdef SDL3BIND_FEATURE_TTF
int runTtf(int argc, char *argv[]);
#endif
#ifdef SDL3BIND_FEATURE_GPU_SHADERS
int runCopyConsistency(int argc, char *argv[]);
#endif

}  // namespace Examples

#endif
