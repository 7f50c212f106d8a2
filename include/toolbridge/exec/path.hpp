/*
 * PATH resolution utilities - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// Existing regular file with at least one execute bit set.
bool is_executable(const std::string& p);

// Split a PATH-like list on ':' keeping order; empty entries are dropped.
std::vector<std::string> split_search_path(const std::string& value);

// Resolve command name to an absolute path using PATH (or the given search path).
// If cmd contains '/' it is returned as-is when executable.
std::optional<std::string> resolve_executable(const std::string& cmd);
std::optional<std::string> resolve_executable(const std::string& cmd, const std::string& search_path);

} // namespace toolbridge
