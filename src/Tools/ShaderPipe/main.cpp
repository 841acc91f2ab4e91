// Copyright (c) 2026, WH, All rights reserved.
// build-time tool: shader source -> cross-compiled bytecode -> <name>.h with an embedded sdl3bind::gpu::EmbeddedShader
#include "ConVar.h"
#include "Logging.h"
#include "ShaderPipeline.h"

#include <string>
#include <string_view>

namespace {  // static

void printUsage(const char *exe) {
    Logger::logRaw("usage: {} --input <file> --name <ident> --output <dir> --format <spirv|dxbc|dxil|msl|hlsl>", exe);
    Logger::logRaw(
        "       [--source SPIRV|HLSL] [--debug] [--verbose] [--shadercross <exe>] [--spirv-opt <exe>] [--no-reflect]");
}

int process(int argc, char *argv[]) {
    ShaderPipe::Options opts;
    bool haveFormat = false;

    for(int i = 1; i < argc; i++) {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;

        if(arg == "--debug") {
            opts.debug = true;
        } else if(arg == "--verbose") {
            cv::shader_debug.setValue(true);
        } else if(arg == "--no-reflect") {
            opts.reflect = false;
        } else if(!hasValue) {
            printUsage(argv[0]);
            return 1;
        } else if(arg == "--input") {
            opts.input = argv[++i];
        } else if(arg == "--name") {
            opts.name = argv[++i];
        } else if(arg == "--output") {
            opts.outputDir = argv[++i];
        } else if(arg == "--shadercross") {
            opts.shadercross = argv[++i];
        } else if(arg == "--spirv-opt") {
            opts.spirvOpt = argv[++i];
        } else if(arg == "--format") {
            auto format = ShaderPipe::parseTargetFormat(argv[++i]);
            if(!format) {
                errorLog("unknown shader format {}", argv[i]);
                return 1;
            }
            opts.format = *format;
            haveFormat = true;
        } else if(arg == "--source") {
            auto source = ShaderPipe::parseSourceFormat(argv[++i]);
            if(!source) {
                errorLog("unknown source format {}", argv[i]);
                return 1;
            }
            opts.source = *source;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if(opts.input.empty() || opts.name.empty() || !haveFormat) {
        printUsage(argv[0]);
        return 1;
    }

    auto header = ShaderPipe::run(opts);
    if(!header) {
        errorLog("{}: {}", opts.input, header.error());
        return 1;
    }

    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    Logger::init();
    const int ret = process(argc, argv);
    Logger::shutdown();
    return ret;
}
