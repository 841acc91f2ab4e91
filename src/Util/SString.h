// Copyright (c) 2023-2024, kiwec & 2025, WH, All rights reserved.
#pragma once
#include "BaseEnvironment.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

// small string helpers for config lines, generated text and command lines

namespace SString {

// the views point into s, an empty field between two delimiters is kept
std::vector<std::string_view> split(std::string_view s, char delim);

std::string join(const std::vector<std::string> &strings, char delim = ' ');

// adjusts the view to exclude leading/trailing whitespace
static forceinline void trim_inplace(std::string_view &str) {
    const size_t start = str.find_first_not_of(" \t\r\n");
    if(start == std::string_view::npos) {
        str = std::string_view();
        return;
    }
    const size_t end = str.find_last_not_of(" \t\r\n");
    str = str.substr(start, end - start + 1);
}

// only really valid for ASCII
static forceinline std::string to_lower(std::string_view str) {
    std::string lstr{str};
    std::ranges::transform(lstr, lstr.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lstr;
}

}  // namespace SString
