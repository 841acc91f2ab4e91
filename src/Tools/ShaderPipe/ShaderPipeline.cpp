// Copyright (c) 2026, WH, All rights reserved.
#include "ShaderPipeline.h"

#include "ConVar.h"
#include "Logging.h"
#include "ProcessRunner.h"
#include "SString.h"

#include "fmt/format.h"
#include "yaml-cpp/yaml.h"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace ShaderPipe {
namespace {  // static

std::expected<std::vector<unsigned char>, std::string> readBytes(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::unexpected(fmt::format("couldn't open {}", path));
    return std::vector<unsigned char>{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::string readText(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if(!in) return {};
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// unchanged outputs keep their timestamp, so nothing that includes them gets rebuilt
std::expected<void, std::string> writeIfChanged(const std::string &path, std::string_view content) {
    if(readText(path) == content) return {};

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) return std::unexpected(fmt::format("couldn't open {} for writing", path));
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if(!out.flush()) return std::unexpected(fmt::format("couldn't write {}", path));
    return {};
}

std::expected<void, std::string> runStep(const std::vector<std::string> &command) {
    logIf(cv::shader_debug.getBool(), "running {}", SString::join(command));

    auto result = runProcess(command);
    if(!result) return std::unexpected(result.error());
    if(result->exitCode != 0) {
        return std::unexpected(
            fmt::format("{} exited with code {}:\n{}", command.front(), result->exitCode, result->output));
    }
    return {};
}

std::expected<uint32_t, std::string> countOf(const YAML::Node &root, const std::string &key,
                                             const std::string &fallbackKey, uint32_t missing) {
    const YAML::Node direct = root[key];
    const YAML::Node node = direct || fallbackKey.empty() ? direct : root[fallbackKey];
    if(!node) return missing;
    try {
        return node.as<uint32_t>();
    } catch(const YAML::Exception &e) {
        return std::unexpected(fmt::format("'{}' is not a count: {}", key, e.what()));
    }
}

bool isTextFormat(TargetFormat format) { return format == TargetFormat::msl || format == TargetFormat::hlsl; }

std::string_view embeddedFormat(TargetFormat format) {
    switch(format) {
        case TargetFormat::spirv:
            return "sdl3bind::gpu::ShaderFormat::spirv";
        case TargetFormat::dxbc:
            return "sdl3bind::gpu::ShaderFormat::dxbc";
        case TargetFormat::dxil:
            return "sdl3bind::gpu::ShaderFormat::dxil";
        case TargetFormat::msl:
            return "sdl3bind::gpu::ShaderFormat::msl";
        case TargetFormat::hlsl:
            return "std::nullopt";
    }
    std::unreachable();
}

std::string_view embeddedStage(Stage stage) {
    switch(stage) {
        case Stage::vertex:
            return "sdl3bind::gpu::ShaderStage::vertex";
        case Stage::fragment:
            return "sdl3bind::gpu::ShaderStage::fragment";
        case Stage::compute:
            return "std::nullopt";
    }
    std::unreachable();
}

}  // namespace

Stage inferStage(std::string_view path) {
    const auto inner = fs::path{path}.stem().extension();
    if(inner == ".vert") return Stage::vertex;
    if(inner == ".frag") return Stage::fragment;
    return Stage::compute;
}

SourceFormat inferSourceFormat(std::string_view path) {
    return fs::path{path}.extension() == ".spv" ? SourceFormat::spirv : SourceFormat::hlsl;
}

std::optional<TargetFormat> parseTargetFormat(std::string_view str) {
    const std::string lower = SString::to_lower(str);
    if(lower == "spirv") return TargetFormat::spirv;
    if(lower == "dxbc") return TargetFormat::dxbc;
    if(lower == "dxil") return TargetFormat::dxil;
    if(lower == "msl") return TargetFormat::msl;
    if(lower == "hlsl") return TargetFormat::hlsl;
    return std::nullopt;
}

std::optional<SourceFormat> parseSourceFormat(std::string_view str) {
    const std::string lower = SString::to_lower(str);
    if(lower == "spirv") return SourceFormat::spirv;
    if(lower == "hlsl") return SourceFormat::hlsl;
    return std::nullopt;
}

std::string_view stageName(Stage stage) {
    switch(stage) {
        case Stage::vertex:
            return "vertex";
        case Stage::fragment:
            return "fragment";
        case Stage::compute:
            return "compute";
    }
    std::unreachable();
}

std::string_view sourceName(SourceFormat format) { return format == SourceFormat::spirv ? "SPIRV" : "HLSL"; }

std::string_view destName(TargetFormat format) {
    switch(format) {
        case TargetFormat::spirv:
            return "SPIRV";
        case TargetFormat::dxbc:
            return "DXBC";
        case TargetFormat::dxil:
            return "DXIL";
        case TargetFormat::msl:
            return "MSL";
        case TargetFormat::hlsl:
            return "HLSL";
    }
    std::unreachable();
}

std::string_view extensionOf(TargetFormat format) {
    switch(format) {
        case TargetFormat::spirv:
            return "spirv";
        case TargetFormat::dxbc:
            return "dxbc";
        case TargetFormat::dxil:
            return "dxil";
        case TargetFormat::msl:
            return "msl";
        case TargetFormat::hlsl:
            return "hlsl";
    }
    std::unreachable();
}

bool needsCrossCompile(SourceFormat source, TargetFormat target) {
    return !(source == SourceFormat::spirv && target == TargetFormat::spirv);
}

std::expected<Reflection, std::string> parseReflection(std::string_view json) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{json});
    } catch(const YAML::Exception &e) {
        return std::unexpected(fmt::format("invalid reflection data: {}", e.what()));
    }
    if(!root.IsMap()) return std::unexpected("invalid reflection data: expected an object");

    struct Field {
        std::string key;
        // compute shaders report their read-only resources separately
        std::string fallbackKey;
        uint32_t missing;
        uint32_t *out;
    };

    Reflection ret;
    const Field fields[] = {
        {"samplers", "", 0, &ret.samplers},
        {"storage_textures", "readonly_storage_textures", 0, &ret.storage_textures},
        {"storage_buffers", "readonly_storage_buffers", 0, &ret.storage_buffers},
        {"uniform_buffers", "", 0, &ret.uniform_buffers},
        {"readwrite_storage_textures", "", 0, &ret.readwrite_storage_textures},
        {"readwrite_storage_buffers", "", 0, &ret.readwrite_storage_buffers},
        {"threadcount_x", "", 1, &ret.threadcount_x},
        {"threadcount_y", "", 1, &ret.threadcount_y},
        {"threadcount_z", "", 1, &ret.threadcount_z},
    };
    for(const Field &field : fields) {
        auto count = countOf(root, field.key, field.fallbackKey, field.missing);
        if(!count) return std::unexpected(count.error());
        *field.out = *count;
    }
    return ret;
}

std::vector<std::string> spirvFixCommand(const Options &opts, const std::string &in, const std::string &out) {
    return {opts.spirvOpt, "--remove-duplicates", "--skip-validation", in, "-o", out};
}

std::vector<std::string> spirvOptimizeCommand(const Options &opts, const std::string &in, const std::string &out) {
    return {opts.spirvOpt, "-O", in, "-o", out};
}

std::vector<std::string> crossCompileCommand(const Options &opts, const std::string &in, SourceFormat source,
                                             Stage stage, const std::string &out) {
    std::vector<std::string> ret{opts.shadercross,
                                 in,
                                 "--source",
                                 std::string{sourceName(source)},
                                 "--entrypoint",
                                 "main",
                                 "--stage",
                                 std::string{stageName(stage)},
                                 "--dest",
                                 std::string{destName(opts.format)}};
    if(opts.debug) ret.emplace_back("--debug");
    ret.emplace_back("--output");
    ret.push_back(out);
    return ret;
}

std::vector<std::string> reflectCommand(const Options &opts, const std::string &in, SourceFormat source, Stage stage,
                                        const std::string &out) {
    return {opts.shadercross, in,      "--source", std::string{sourceName(source)}, "--entrypoint", "main", "--stage",
            std::string{stageName(stage)}, "--dest", "JSON", "--output", out};
}

bool isValidIdentifier(std::string_view name) {
    if(name.empty()) return false;
    const auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
    if(!alpha(name.front())) return false;
    for(char c : name) {
        if(!alpha(c) && !(c >= '0' && c <= '9')) return false;
    }
    return true;
}

std::string generateEmbedHeader(std::string_view name, std::string_view sourcePath, std::span<const unsigned char> code,
                                TargetFormat format, Stage stage, const Reflection &reflection) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "// generated by sdl3bind-shaderpipe from {}, do not edit\n", sourcePath);
    fmt::format_to(out, "#pragma once\n\n#include \"EmbeddedShader.h\"\n\n#include <optional>\n#include <span>\n\n");
    fmt::format_to(out, "namespace shaders {{\n\n");

    fmt::format_to(out, "inline constexpr unsigned char {}_code[] = {{", name);
    const bool terminate = isTextFormat(format) || code.empty();
    const size_t total = code.size() + (terminate ? 1 : 0);
    for(size_t i = 0; i < total; i++) {
        if(i % 16 == 0) fmt::format_to(out, "\n    ");
        const unsigned char byte = i < code.size() ? code[i] : 0;
        fmt::format_to(out, "0x{:02x},", byte);
    }
    fmt::format_to(out, "\n}};\n\n");

    fmt::format_to(out, "inline constexpr sdl3bind::gpu::EmbeddedShader {}{{\n", name);
    fmt::format_to(out, "    .code = std::span<const unsigned char>{{{}_code, {}}},\n", name, code.size());
    fmt::format_to(out, "    .format = {},\n", embeddedFormat(format));
    fmt::format_to(out, "    .stage = {},\n", embeddedStage(stage));
    fmt::format_to(out, "    .num_samplers = {},\n", reflection.samplers);
    fmt::format_to(out, "    .num_storage_textures = {},\n", reflection.storage_textures);
    fmt::format_to(out, "    .num_storage_buffers = {},\n", reflection.storage_buffers);
    fmt::format_to(out, "    .num_uniform_buffers = {},\n", reflection.uniform_buffers);
    if(stage == Stage::compute) {
        fmt::format_to(out, "    .num_readwrite_storage_textures = {},\n", reflection.readwrite_storage_textures);
        fmt::format_to(out, "    .num_readwrite_storage_buffers = {},\n", reflection.readwrite_storage_buffers);
        fmt::format_to(out, "    .threadcount_x = {},\n", reflection.threadcount_x);
        fmt::format_to(out, "    .threadcount_y = {},\n", reflection.threadcount_y);
        fmt::format_to(out, "    .threadcount_z = {},\n", reflection.threadcount_z);
    }
    fmt::format_to(out, "}};\n\n}}  // namespace shaders\n");

    return fmt::to_string(buf);
}

std::expected<std::string, std::string> run(const Options &opts) {
    if(!isValidIdentifier(opts.name)) return std::unexpected(fmt::format("'{}' is not a valid identifier", opts.name));
    if(!fs::exists(opts.input)) return std::unexpected(fmt::format("{} doesn't exist", opts.input));

    std::error_code ec;
    fs::create_directories(opts.outputDir, ec);
    if(ec) return std::unexpected(fmt::format("couldn't create {}: {}", opts.outputDir, ec.message()));

    const auto outPath = [&](std::string_view suffix) {
        return (fs::path{opts.outputDir} / fmt::format("{}{}", opts.name, suffix)).string();
    };

    const Stage stage = inferStage(opts.input);
    const SourceFormat source = opts.source.value_or(inferSourceFormat(opts.input));
    std::string current = opts.input;

    if(source == SourceFormat::spirv) {
        if(isRunnable(opts.spirvOpt)) {
            const std::string fixed = outPath("-fixed.spv");
            if(auto ok = runStep(spirvFixCommand(opts, current, fixed)); !ok) return std::unexpected(ok.error());
            const std::string optimized = outPath("-opt.spv");
            if(auto ok = runStep(spirvOptimizeCommand(opts, fixed, optimized)); !ok)
                return std::unexpected(ok.error());
            current = optimized;
        } else {
            warnLog("{} not found, shader output will be unoptimized!", opts.spirvOpt);
        }
    }

    // reflection works on the (optimized) source, not on the cross-compiled output
    Reflection reflection;
    if(opts.reflect) {
        const std::string jsonPath = outPath(".json");
        if(auto ok = runStep(reflectCommand(opts, current, source, stage, jsonPath)); !ok)
            return std::unexpected(ok.error());
        auto parsed = parseReflection(readText(jsonPath));
        if(!parsed) return std::unexpected(fmt::format("{}: {}", jsonPath, parsed.error()));
        reflection = *parsed;
    }

    if(needsCrossCompile(source, opts.format)) {
        const std::string compiled = outPath(fmt::format(".{}", extensionOf(opts.format)));
        if(auto ok = runStep(crossCompileCommand(opts, current, source, stage, compiled)); !ok)
            return std::unexpected(ok.error());
        current = compiled;
    }

    auto code = readBytes(current);
    if(!code) return std::unexpected(code.error());
    if(code->empty()) return std::unexpected(fmt::format("{} is empty", current));

    const std::string headerPath = outPath(".h");
    const std::string header = generateEmbedHeader(opts.name, opts.input, *code, opts.format, stage, reflection);
    if(auto ok = writeIfChanged(headerPath, header); !ok) return std::unexpected(ok.error());

    logIf(cv::shader_debug.getBool(), "{}: {} bytes of {} ({})", headerPath, code->size(), destName(opts.format),
          stageName(stage));
    return headerPath;
}

}  // namespace ShaderPipe
