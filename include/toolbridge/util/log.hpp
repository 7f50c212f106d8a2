/*
 * Diagnostics on stderr - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace toolbridge::log {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_level(Level lvl);
Level level();
bool enabled(Level lvl);
// "error" | "warn" | "info" | "debug"
std::optional<Level> parse_level(const std::string& name);

// Writes "[TAG] message" (or "[DEBUG][tag] message") to std::cerr when lvl is enabled.
void write(Level lvl, const std::string& tag, const std::string& msg);

inline void error(const std::string& tag, const std::string& msg) { write(Level::Error, tag, msg); }
inline void warn(const std::string& tag, const std::string& msg) { write(Level::Warn, tag, msg); }
inline void info(const std::string& tag, const std::string& msg) { write(Level::Info, tag, msg); }
inline void debug(const std::string& tag, const std::string& msg) { write(Level::Debug, tag, msg); }

} // namespace toolbridge::log
