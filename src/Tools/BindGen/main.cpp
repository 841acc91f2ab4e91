// Copyright (c) 2026, WH, All rights reserved.
// build-time generator: api/<module>.yaml -> <Module>Api.h
#include "BindingGenerator.h"
#include "Logging.h"

#include <fstream>
#include <iterator>
#include <string>

namespace {  // static

std::string readWholeFile(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if(!in) return {};
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

int generate(int argc, char *argv[]) {
    if(argc != 3) {
        Logger::logRaw("usage: {} <api.yaml> <output.h>", argv[0]);
        return 1;
    }

    const std::string inputPath{argv[1]};
    const std::string outputPath{argv[2]};

    auto api = BindGen::parseApiFile(inputPath);
    if(!api) {
        errorLog("{}: {}", inputPath, api.error());
        return 1;
    }

    const std::string header = BindGen::generateHeader(*api);

    // don't touch the output if nothing changed, so dependents aren't rebuilt for nothing
    if(readWholeFile(outputPath) == header) return 0;

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if(!out) {
        errorLog("couldn't open {} for writing", outputPath);
        return 1;
    }
    out << header;
    if(!out.flush()) {
        errorLog("couldn't write {}", outputPath);
        return 1;
    }

    return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
    Logger::init();
    const int ret = generate(argc, argv);
    Logger::shutdown();
    return ret;
}
