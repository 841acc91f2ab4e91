// Copyright (c) 2026, WH, All rights reserved.
#include "ProcessRunner.h"

#include "Errors.h"
#include "Handle.h"
#include "Properties.h"

#include "fmt/format.h"

#include <SDL3/SDL_process.h>
#include <SDL3/SDL_stdinc.h>

namespace ShaderPipe {
namespace {  // static

std::string lastError(std::string_view what) {
    return fmt::format("{}: {}", what, sdl3bind::errors::get().value_or("unknown error"));
}

}  // namespace

std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string> &args) {
    if(args.empty()) return std::unexpected("no command given");

    std::vector<const char *> argv;
    argv.reserve(args.size() + 1);
    for(const auto &arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    auto props = sdl3bind::properties::Group::create();
    if(!props) return std::unexpected(lastError("couldn't create process properties"));

    // SDL only reads the argument array during creation
    const bool propsOk =
        props->set(SDL_PROP_PROCESS_CREATE_ARGS_POINTER, static_cast<void *>(const_cast<char **>(argv.data()))) &&
        props->set(SDL_PROP_PROCESS_CREATE_STDIN_NUMBER, static_cast<Sint64>(SDL_PROCESS_STDIO_NULL)) &&
        props->set(SDL_PROP_PROCESS_CREATE_STDOUT_NUMBER, static_cast<Sint64>(SDL_PROCESS_STDIO_APP)) &&
        props->set(SDL_PROP_PROCESS_CREATE_STDERR_TO_STDOUT_BOOLEAN, true);
    if(!propsOk) return std::unexpected(lastError("couldn't set process properties"));

    auto created = sdl3bind::errors::wrapCallPtr(SDL_CreateProcessWithProperties(props->id()));
    if(!created) return std::unexpected(lastError(fmt::format("couldn't start {}", args.front())));
    sdl3bind::UniquePtr<SDL_Process, SDL_DestroyProcess> process{*created};

    ProcessResult ret;
    size_t size = 0;
    // reads until the pipe closes, then waits for the exit code
    auto data = sdl3bind::errors::wrapCallPtr(SDL_ReadProcess(process.get(), &size, &ret.exitCode));
    if(!data) return std::unexpected(lastError(fmt::format("couldn't read output of {}", args.front())));

    ret.output.assign(static_cast<const char *>(*data), size);
    SDL_free(*data);
    return ret;
}

bool isRunnable(const std::string &exe) {
    const sdl3bind::errors::ScopedCallback quiet{nullptr};
    auto result = runProcess({exe, "--version"});
    return result && result->exitCode == 0;
}

}  // namespace ShaderPipe
