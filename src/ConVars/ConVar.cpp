// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec, All rights reserved.
#include "ConVar.h"
#include "ConVarHandler.h"

#include "Logging.h"
#include "SString.h"

#include <charconv>

void ConVar::addConVar() {
    std::string_view name = this->getName();

    auto &convar_map = ConVarHandler::getConVarMap_int();

    // no duplicate ConVar names allowed, the first one wins
    if(convar_map.contains(name)) {
        warnLog("duplicate ConVar name {}, ignoring the new one", name);
        return;
    }

    convar_map.emplace(name, this);
    ConVarHandler::getConVarArray_int().push_back(this);
}

void ConVar::reset() {
    if(this->type == CONVAR_TYPE::STRING) {
        this->setValueInt(this->sDefaultValue, true);
    } else {
        this->setValueInt(this->dDefaultValue, true);
    }
}

double ConVar::parseDouble(std::string_view str) const {
    SString::trim_inplace(str);
    if(str.empty()) return 0.;

    if(this->type == CONVAR_TYPE::BOOL) {
        const std::string lower = SString::to_lower(str);
        if(lower == "true" || lower == "on" || lower == "yes") return 1.;
        if(lower == "false" || lower == "off" || lower == "no") return 0.;
    }

    double ret{0.};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), ret);
    if(ec != std::errc{}) return 0.;
    return ret;
}

void ConVar::setDefaultDouble(double defaultValue) {
    this->dDefaultValue = defaultValue;
    if(this->type == CONVAR_TYPE::BOOL) {
        this->sDefaultValue = defaultValue != 0. ? "true" : "false";
    } else {
        this->sDefaultValue = fmt::format("{:g}", defaultValue);
    }
}

void ConVar::setDefaultString(std::string_view defaultValue) {
    this->sDefaultValue = defaultValue;

    // also try to parse default float from the default string
    this->dDefaultValue = this->parseDouble(this->sDefaultValue);
}

// actual ConVar definitions, for the extern declarations in ConVarDefs.h
#undef CONVARDEFS_H
#define DEFINE_CONVARS
#include "ConVarDefs.h"
