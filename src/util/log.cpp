/*
 * Diagnostics on stderr - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace toolbridge::log {

namespace {
std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::mutex g_out_mutex; // one line at a time from worker threads
}

void set_level(Level lvl) { g_level.store(static_cast<int>(lvl)); }
Level level() { return static_cast<Level>(g_level.load()); }
bool enabled(Level lvl) { return static_cast<int>(lvl) <= g_level.load(); }

std::optional<Level> parse_level(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return std::tolower(c); });
    if (n == "error") return Level::Error;
    if (n == "warn" || n == "warning") return Level::Warn;
    if (n == "info") return Level::Info;
    if (n == "debug") return Level::Debug;
    return std::nullopt;
}

void write(Level lvl, const std::string& tag, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::string upper = tag;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
    std::lock_guard<std::mutex> lk(g_out_mutex);
    switch (lvl) {
        case Level::Debug: std::cerr << "[DEBUG][" << tag << "] " << msg << '\n'; break;
        case Level::Error: std::cerr << "[" << upper << "] error: " << msg << '\n'; break;
        case Level::Warn: std::cerr << "[" << upper << "] warning: " << msg << '\n'; break;
        case Level::Info: std::cerr << "[" << upper << "] " << msg << '\n'; break;
    }
}

} // namespace toolbridge::log
