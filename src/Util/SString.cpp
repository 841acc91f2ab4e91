// Copyright (c) 2023-2024, kiwec & 2025, WH, All rights reserved.

#include "SString.h"

namespace SString {

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> ret;
    size_t start = 0;
    for(size_t pos = s.find(delim); pos != std::string_view::npos; pos = s.find(delim, start)) {
        ret.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    ret.push_back(s.substr(start));
    return ret;
}

std::string join(const std::vector<std::string> &strings, char delim) {
    std::string ret;
    for(const auto &str : strings) {
        if(&str != &strings.front()) ret.push_back(delim);
        ret.append(str);
    }
    return ret;
}

}  // namespace SString
