/*
 * PATH resolution implementation - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/exec/path.hpp>
#include <cstdlib>
#include <sys/stat.h>

namespace toolbridge {

bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

std::vector<std::string> split_search_path(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t colon = value.find(':', start);
        if (colon == std::string::npos) colon = value.size();
        if (colon > start) parts.push_back(value.substr(start, colon - start));
        start = colon + 1;
    }
    return parts;
}

std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd; else return std::nullopt;
    }
    for (auto &d : split_search_path(search_path)) {
        std::string full = d + '/' + cmd;
        if (is_executable(full)) return full;
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& cmd) {
    const char* pathEnv = std::getenv("PATH");
    return resolve_executable(cmd, pathEnv ? pathEnv : "");
}

} // namespace toolbridge
