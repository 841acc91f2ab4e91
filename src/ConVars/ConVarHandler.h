// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec, All rights reserved.
#pragma once
#include "BaseEnvironment.h"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class ConVar;

class ConVarHandler {
    NOCOPY_NOMOVE(ConVarHandler)
   public:
    static std::string flagsToString(uint8_t flags);

   public:
    ConVarHandler() = default;
    ~ConVarHandler() = default;

    [[nodiscard]] forceinline const std::vector<ConVar *> &getConVarArray() const { return getConVarArray_int(); }

    // nullptr if there is no such convar
    [[nodiscard]] ConVar *getConVarByName(std::string_view name, bool warnIfNotFound = true) const;

    // "name value", "name" alone resets it to the default
    // returns false if the line didn't name a (loadable) convar
    bool applyLine(std::string_view line, bool fromConfig = false);

    // one applyLine per line, "//" starts a comment
    // returns the number of lines that were applied, or -1 if the file couldn't be read
    int loadFile(const char *path);

    // "-name value" pairs, a bare "-name" (followed by another option or nothing) sets a bool convar to true
    // returns the arguments that weren't convars (in order)
    std::vector<std::string> applyArgs(int argc, const char *const *argv);

    // every convar that isn't HIDDEN, with its default and help string, through the raw logger
    void listConVars() const;

   private:
    friend class ConVar;

    // lookups by string_view without building a std::string
    struct NameHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view sv) const { return std::hash<std::string_view>{}(sv); }
    };
    using NameMap = std::unordered_map<std::string, ConVar *, NameHash, std::equal_to<>>;

    static std::vector<ConVar *> &getConVarArray_int();
    static NameMap &getConVarMap_int();
    [[nodiscard]] static ConVar *getConVar_int(std::string_view name);
};

extern ConVarHandler &cvars();
