// Copyright (c) 2026, WH, All rights reserved.
#include "BindingGenerator.h"

#include "SString.h"

#include "fmt/format.h"
#include "yaml-cpp/yaml.h"

#include <iterator>
#include <set>

namespace BindGen {
namespace {  // static

std::string optString(const YAML::Node &node, const char *key) {
    const YAML::Node child = node[key];
    return child ? child.as<std::string>() : std::string{};
}

std::expected<std::vector<EnumValue>, std::string> parsePairs(const YAML::Node &list, std::string_view owner) {
    std::vector<EnumValue> ret;
    if(!list || !list.IsSequence()) return std::unexpected(fmt::format("{}: expected a list of [host, native] pairs", owner));

    for(const auto &entry : list) {
        if(!entry.IsSequence() || entry.size() != 2)
            return std::unexpected(fmt::format("{}: every entry must be a [host, native] pair", owner));
        ret.push_back(EnumValue{.name = entry[0].as<std::string>(), .native = entry[1].as<std::string>()});
    }
    return ret;
}

// the header text is built up line by line
class Writer {
   public:
    template <typename... Args>
    void line(fmt::format_string<Args...> fmt, Args &&...args) {
        fmt::format_to(std::back_inserter(m_buf), fmt, std::forward<Args>(args)...);
        m_buf.push_back('\n');
    }
    void line(std::string_view str = {}) {
        m_buf.append(str);
        m_buf.push_back('\n');
    }
    void doc(std::string_view text) {
        if(text.empty()) return;
        for(const auto &l : SString::split(text, '\n')) {
            if(!l.empty()) line("// {}", l);
        }
    }

    [[nodiscard]] std::string str() const { return fmt::to_string(m_buf); }

   private:
    fmt::memory_buffer m_buf;
};

std::string underlyingOf(const EnumDesc &e) {
    return e.underlying.value_or(fmt::format("std::underlying_type_t<{}>", e.native));
}

void writeEnum(Writer &w, const EnumDesc &e) {
    w.doc(e.doc);
    w.line("enum class {} : {} {{", e.name, underlyingOf(e));
    for(const auto &v : e.values) {
        w.line("    {} = {},", v.name, v.native);
    }
    w.line("};");
    w.line("static_assert(sizeof({}) == sizeof({}));", e.name, e.native);
    w.line();
}

void writeEnumTraits(Writer &w, const ApiDesc &api, const EnumDesc &e) {
    const std::string host = fmt::format("{}::{}", api.ns, e.name);

    w.line("template <>");
    w.line("struct NativeEnum<{}> {{", host);
    w.line("    using native_type = {};", e.native);
    w.line("    static constexpr std::string_view name{{\"{}\"}};", e.name);
    w.line("    static constexpr bool has_invalid = {};", e.invalid.has_value() ? "true" : "false");
    if(e.invalid.has_value()) {
        w.line("    static constexpr native_type invalid = {};", *e.invalid);
    }

    w.line("    static constexpr std::array<{}, {}> values{{", host, e.values.size());
    for(const auto &v : e.values) {
        w.line("        {}::{},", host, v.name);
    }
    w.line("    };");
    w.line();

    if(e.invalid.has_value()) {
        // anything that isn't a known enumerator (the sentinel included) is "absent"
        w.line("    [[nodiscard]] static constexpr std::optional<{}> fromNative(native_type value) noexcept {{", host);
        w.line("        switch(value) {");
        for(const auto &v : e.values) {
            w.line("            case {}:", v.native);
            w.line("                return {}::{};", host, v.name);
        }
        w.line("            default:");
        w.line("                return std::nullopt;");
        w.line("        }");
        w.line("    }");
        w.line("    [[nodiscard]] static constexpr native_type toNative(std::optional<{}> value) noexcept {{", host);
        w.line("        if(!value.has_value()) return invalid;");
        w.line("        return static_cast<native_type>(*value);");
        w.line("    }");
    } else {
        w.line("    [[nodiscard]] static constexpr {} fromNative(native_type value) noexcept {{", host);
        w.line("        return static_cast<{}>(value);", host);
        w.line("    }");
        w.line("    [[nodiscard]] static constexpr native_type toNative({} value) noexcept {{", host);
        w.line("        return static_cast<native_type>(value);");
        w.line("    }");
    }
    w.line("};");
    w.line();
}

void writeFlags(Writer &w, const FlagsDesc &f) {
    w.doc(f.doc);
    w.line("struct {} {{", f.name);
    w.line("    using native_type = {};", f.native);
    w.line();
    for(const auto &b : f.bits) {
        w.line("    bool {}{{false}};", b.name);
    }
    w.line();

    // every bit this struct knows about
    std::string mask;
    for(const auto &b : f.bits) {
        if(!mask.empty()) mask += " | ";
        mask += b.native;
    }
    w.line("    static constexpr native_type mask = static_cast<native_type>({});", mask.empty() ? "0" : mask);
    w.line();

    w.line("    [[nodiscard]] static constexpr {} fromNative(native_type value) noexcept {{", f.name);
    w.line("        {} ret{{}};", f.name);
    for(const auto &b : f.bits) {
        w.line("        ret.{} = (value & {}) != 0;", b.name, b.native);
    }
    w.line("        return ret;");
    w.line("    }");
    w.line();
    w.line("    [[nodiscard]] constexpr native_type toNative() const noexcept {");
    w.line("        native_type ret{0};");
    for(const auto &b : f.bits) {
        w.line("        if(this->{}) ret |= {};", b.name, b.native);
    }
    w.line("        return ret;");
    w.line("    }");
    w.line();
    w.line("    bool operator==(const {} &) const = default;", f.name);
    w.line("};");
    w.line();
}

void writeStruct(Writer &w, const StructDesc &s) {
    w.doc(s.doc);
    w.line("struct {} {{", s.name);
    for(const auto &f : s.fields) {
        w.line("    {} {}{{}};", f.type, f.name);
    }
    w.line();
    w.line("    bool operator==(const {} &) const = default;", s.name);
    w.line("};");

    // the whole point of mirroring: these must be bit-compatible with the native struct
    w.line("static_assert(std::is_trivially_copyable_v<{}>);", s.name);
    w.line("static_assert(std::is_standard_layout_v<{}>);", s.name);
    w.line("static_assert(sizeof({}) == sizeof({}));", s.name, s.native);
    w.line("static_assert(alignof({}) == alignof({}));", s.name, s.native);
    for(const auto &f : s.fields) {
        w.line("static_assert(offsetof({}, {}) == offsetof({}, {}));", s.name, f.name, s.native, f.native);
        w.line("static_assert(sizeof({}::{}) == sizeof({}::{}));", s.name, f.name, s.native, f.native);
    }
    w.line();
    w.line("[[nodiscard]] inline {} toNative(const {} &value) noexcept {{", s.native, s.name);
    w.line("    return std::bit_cast<{}>(value);", s.native);
    w.line("}");
    w.line("[[nodiscard]] inline {} fromNative(const {} &value) noexcept {{", s.name, s.native);
    w.line("    return std::bit_cast<{}>(value);", s.name);
    w.line("}");
    w.line();
}

}  // namespace

std::expected<ApiDesc, std::string> parseApi(const YAML::Node &root) {
    try {
        if(!root.IsMap()) return std::unexpected("top level of an API description must be a map");

        ApiDesc api;
        api.module = optString(root, "module");
        api.ns = optString(root, "namespace");
        if(api.module.empty() || api.ns.empty()) return std::unexpected("'module' and 'namespace' are required");

        if(const auto inc = root["system_includes"]) {
            for(const auto &i : inc) api.systemIncludes.push_back(i.as<std::string>());
        }
        if(const auto inc = root["includes"]) {
            for(const auto &i : inc) api.includes.push_back(i.as<std::string>());
        }

        if(const auto enums = root["enums"]) {
            for(const auto &node : enums) {
                EnumDesc e;
                e.name = optString(node, "name");
                e.native = optString(node, "native");
                e.doc = optString(node, "doc");
                if(node["underlying"]) e.underlying = node["underlying"].as<std::string>();
                if(node["invalid"]) e.invalid = node["invalid"].as<std::string>();

                auto values = parsePairs(node["values"], e.name);
                if(!values) return std::unexpected(values.error());
                e.values = std::move(*values);
                api.enums.push_back(std::move(e));
            }
        }

        if(const auto flags = root["flags"]) {
            for(const auto &node : flags) {
                FlagsDesc f;
                f.name = optString(node, "name");
                f.native = optString(node, "native");
                f.doc = optString(node, "doc");

                auto bits = parsePairs(node["bits"], f.name);
                if(!bits) return std::unexpected(bits.error());
                f.bits = std::move(*bits);
                api.flags.push_back(std::move(f));
            }
        }

        if(const auto structs = root["structs"]) {
            for(const auto &node : structs) {
                StructDesc s;
                s.name = optString(node, "name");
                s.native = optString(node, "native");
                s.doc = optString(node, "doc");

                const auto fields = node["fields"];
                if(!fields || !fields.IsSequence())
                    return std::unexpected(fmt::format("{}: expected a list of [name, type, native] fields", s.name));
                for(const auto &field : fields) {
                    if(!field.IsSequence() || field.size() < 2 || field.size() > 3)
                        return std::unexpected(fmt::format("{}: fields are [name, type] or [name, type, native]", s.name));
                    FieldDesc fd;
                    fd.name = field[0].as<std::string>();
                    fd.type = field[1].as<std::string>();
                    // same field name on both sides unless told otherwise
                    fd.native = field.size() == 3 ? field[2].as<std::string>() : fd.name;
                    s.fields.push_back(std::move(fd));
                }
                api.structs.push_back(std::move(s));
            }
        }

        if(auto err = validate(api)) return std::unexpected(*err);
        return api;
    } catch(const YAML::Exception &e) {
        return std::unexpected(fmt::format("YAML error: {}", e.what()));
    }
}

std::expected<ApiDesc, std::string> parseApiString(std::string_view yaml) {
    try {
        return parseApi(YAML::Load(std::string{yaml}));
    } catch(const YAML::Exception &e) {
        return std::unexpected(fmt::format("YAML error: {}", e.what()));
    }
}

std::expected<ApiDesc, std::string> parseApiFile(const std::string &path) {
    try {
        return parseApi(YAML::LoadFile(path));
    } catch(const YAML::Exception &e) {
        return std::unexpected(fmt::format("{}: {}", path, e.what()));
    }
}

std::optional<std::string> validate(const ApiDesc &api) {
    std::set<std::string, std::less<>> typeNames;
    auto claim = [&](const std::string &name) -> std::optional<std::string> {
        if(name.empty()) return "a type is missing its 'name'";
        if(!typeNames.insert(name).second) return fmt::format("duplicate type name '{}'", name);
        return std::nullopt;
    };

    for(const auto &e : api.enums) {
        if(auto err = claim(e.name)) return err;
        if(e.native.empty()) return fmt::format("enum {} has no 'native' type", e.name);
        if(e.values.empty()) return fmt::format("enum {} has no values", e.name);

        std::set<std::string, std::less<>> names, natives;
        for(const auto &v : e.values) {
            if(!names.insert(v.name).second) return fmt::format("enum {}: duplicate value '{}'", e.name, v.name);
            // the generated switch can't have two cases with the same constant
            if(!natives.insert(v.native).second)
                return fmt::format("enum {}: native constant {} is used twice", e.name, v.native);
            if(e.invalid.has_value() && v.native == *e.invalid)
                return fmt::format("enum {}: the invalid sentinel can't also be a value", e.name);
        }
    }
    for(const auto &f : api.flags) {
        if(auto err = claim(f.name)) return err;
        if(f.native.empty()) return fmt::format("flags {} has no 'native' type", f.name);

        std::set<std::string, std::less<>> names;
        for(const auto &b : f.bits) {
            if(!names.insert(b.name).second) return fmt::format("flags {}: duplicate bit '{}'", f.name, b.name);
        }
    }
    for(const auto &s : api.structs) {
        if(auto err = claim(s.name)) return err;
        if(s.native.empty()) return fmt::format("struct {} has no 'native' type", s.name);
        if(s.fields.empty()) return fmt::format("struct {} has no fields", s.name);

        std::set<std::string, std::less<>> names;
        for(const auto &f : s.fields) {
            if(!names.insert(f.name).second) return fmt::format("struct {}: duplicate field '{}'", s.name, f.name);
        }
    }
    return std::nullopt;
}

std::string generateHeader(const ApiDesc &api) {
    Writer w;

    w.line("// generated by sdl3bind-bindgen from the {} API description, do not edit", api.module);
    w.line("#pragma once");
    w.line();
    for(const auto &inc : api.systemIncludes) w.line("#include <{}>", inc);
    if(!api.systemIncludes.empty()) w.line();
    w.line("#include \"NativeEnum.h\"");
    for(const auto &inc : api.includes) w.line("#include \"{}\"", inc);
    w.line();
    w.line("#include <array>");
    w.line("#include <bit>");
    w.line("#include <cstddef>");
    w.line("#include <optional>");
    w.line("#include <string_view>");
    w.line("#include <type_traits>");
    w.line();

    w.line("namespace {} {{", api.ns);
    w.line();
    // so that unqualified toNative()/fromNative() inside this namespace still see the enum templates
    if(api.ns != "sdl3bind") {
        w.line("using sdl3bind::fromNative;");
        w.line("using sdl3bind::toNative;");
        w.line();
    }

    for(const auto &e : api.enums) writeEnum(w, e);
    for(const auto &f : api.flags) writeFlags(w, f);
    for(const auto &s : api.structs) writeStruct(w, s);

    w.line("}}  // namespace {}", api.ns);
    w.line();

    if(!api.enums.empty()) {
        w.line("namespace sdl3bind {");
        w.line();
        for(const auto &e : api.enums) writeEnumTraits(w, api, e);
        w.line("}  // namespace sdl3bind");
    }

    return w.str();
}

}  // namespace BindGen
