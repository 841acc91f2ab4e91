// Copyright (c) 2026, WH, All rights reserved.
#include "ConVar.h"
#include "ConVarHandler.h"
#include "Errors.h"
#include "Examples.h"
#include "Logging.h"

#include <algorithm>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    // "-name value" pairs are convars, whatever is left goes to the example
    std::vector<std::string> rest = cvars().applyArgs(argc, argv);

    Logger::init(cv::log_file.getString().c_str());
    Logger::installSdlLogOutput();
    sdl3bind::errors::setCallback(sdl3bind::errors::logCallback);

    const bool wantHelp = std::ranges::find(rest, "-help") != rest.end();
    const std::string &name = cv::example.getString();
    const Examples::ExampleDescriptor *example = Examples::findExample(name);
    if(!example || wantHelp) {
        if(!example) Logger::logRaw("unknown example '{}'", name);
        Logger::logRaw("available examples (-example <name>):");
        for(const auto &entry : Examples::getAllExamples()) {
            Logger::logRaw("  {:<18} {}", entry.name, entry.description);
        }
        Logger::logRaw("options:");
        cvars().listConVars();
        Logger::shutdown();
        return example ? 0 : 1;
    }

    std::vector<char *> exampleArgv;
    exampleArgv.push_back(argv[0]);
    for(auto &arg : rest) exampleArgv.push_back(arg.data());
    exampleArgv.push_back(nullptr);

    debugLog("running example {}", example->name);
    const int ret = example->run(static_cast<int>(exampleArgv.size() - 1), exampleArgv.data());
    debugLog("example {} exited with {}", example->name, ret);

    Logger::shutdown();
    return ret;
}
