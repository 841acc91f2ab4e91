// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec, All rights reserved.
#include "ConVarHandler.h"
#include "ConVar.h"

#include "Logging.h"
#include "SString.h"

#include <SDL3/SDL_iostream.h>
#include <SDL3/SDL_stdinc.h>

#include <array>
#include <memory>

ConVarHandler &cvars() {
    static ConVarHandler handler;
    return handler;
}

// private static
std::vector<ConVar *> &ConVarHandler::getConVarArray_int() {
    static std::vector<ConVar *> vConVarArray;
    return vConVarArray;
}

ConVarHandler::NameMap &ConVarHandler::getConVarMap_int() {
    static NameMap vConVarMap;
    return vConVarMap;
}

ConVar *ConVarHandler::getConVar_int(std::string_view name) {
    const auto &cvarMap = getConVarMap_int();
    auto it = cvarMap.find(name);
    if(it != cvarMap.end()) return it->second;
    return nullptr;
}

// public
ConVar *ConVarHandler::getConVarByName(std::string_view name, bool warnIfNotFound) const {
    ConVar *found = ConVarHandler::getConVar_int(name);
    if(!found && warnIfNotFound) {
        Logger::logRaw("ConVar \"{:s}\" does not exist...", name);
    }
    return found;
}

std::string ConVarHandler::flagsToString(uint8_t flags) {
    if(flags == 0) {
        return "no flags";
    }

    static constexpr const auto flagStringPairArray =
        std::array{std::pair{cv::CLIENT, "client"}, std::pair{cv::HIDDEN, "hidden"}, std::pair{cv::NOLOAD, "noload"}};

    std::string string;
    for(bool first = true; const auto &[flag, str] : flagStringPairArray) {
        if((flags & flag) == flag) {
            if(!first) {
                string.append(" ");
            }
            first = false;
            string.append(str);
        }
    }
    return string;
}

bool ConVarHandler::applyLine(std::string_view line, bool fromConfig) {
    // strip comments
    if(const auto commentPos = line.find("//"); commentPos != std::string_view::npos) {
        line = line.substr(0, commentPos);
    }
    SString::trim_inplace(line);
    if(line.empty()) return false;

    std::string_view name = line;
    std::string_view value;
    if(const auto spacePos = line.find_first_of(" \t"); spacePos != std::string_view::npos) {
        name = line.substr(0, spacePos);
        value = line.substr(spacePos + 1);
        SString::trim_inplace(value);
    }

    // quoted values keep their inner whitespace
    if(value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }

    ConVar *cvar = this->getConVarByName(name);
    if(!cvar) return false;

    if(fromConfig && cvar->isFlagSet(cv::NOLOAD)) {
        debugLog("{} can't be set from a config file", name);
        return false;
    }
    if(!cvar->isFlagSet(cv::CLIENT)) {
        debugLog("{} is read-only", name);
        return false;
    }

    if(value.empty() && name.size() == line.size()) {
        cvar->reset();
    } else {
        cvar->setValue(value);
    }
    return true;
}

int ConVarHandler::loadFile(const char *path) {
    size_t size{0};
    std::unique_ptr<char, decltype(&SDL_free)> data{static_cast<char *>(SDL_LoadFile(path, &size)), SDL_free};
    if(!data) {
        warnLog("couldn't read {}: {}", path, SDL_GetError());
        return -1;
    }

    int applied = 0;
    for(const auto &line : SString::split(std::string_view{data.get(), size}, '\n')) {
        if(this->applyLine(line, true)) applied++;
    }

    debugLog("applied {} convar(s) from {}", applied, path);
    return applied;
}

std::vector<std::string> ConVarHandler::applyArgs(int argc, const char *const *argv) {
    std::vector<std::string> rest;

    for(int i = 1; i < argc; i++) {
        std::string_view arg{argv[i]};
        if(arg.size() < 2 || arg[0] != '-') {
            rest.emplace_back(arg);
            continue;
        }

        ConVar *cvar = this->getConVarByName(arg.substr(1), false);
        if(!cvar) {
            rest.emplace_back(arg);
            continue;
        }

        const bool haveValue = i + 1 < argc && !(argv[i + 1][0] == '-' && argv[i + 1][1] != '\0' &&
                                                 cvar->getType() == ConVar::CONVAR_TYPE::BOOL);
        if(haveValue) {
            cvar->setValue(std::string_view{argv[++i]});
        } else if(cvar->getType() == ConVar::CONVAR_TYPE::BOOL) {
            cvar->setValue(true);
        } else {
            warnLog("missing value for -{}", cvar->getName());
        }
    }

    return rest;
}

void ConVarHandler::listConVars() const {
    for(const ConVar *cvar : this->getConVarArray()) {
        if(cvar->isFlagSet(cv::HIDDEN)) continue;
        Logger::logRaw("  -{:<16} (default: {}) {}", cvar->getName(), cvar->getDefaultString(), cvar->getHelpstring());
    }
}
