// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef PROCESSRUNNER_H
#define PROCESSRUNNER_H

#include <expected>
#include <string>
#include <vector>

namespace ShaderPipe {

struct ProcessResult {
    int exitCode{0};
    // stdout and stderr, interleaved
    std::string output;
};

// runs args[0] (looked up in PATH) with the rest as its arguments and waits for it to exit
// fails only if the process couldn't be started at all, a non-zero exit code is still a ProcessResult
[[nodiscard]] std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string> &args);

// true if "<exe> --version" starts and exits with 0
[[nodiscard]] bool isRunnable(const std::string &exe);

}  // namespace ShaderPipe

#endif
