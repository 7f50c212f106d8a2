/*
 * Build task descriptor - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class ConsoleMode { Rich, Plain, Quiet };

const char* to_string(ConsoleMode m);
// "rich" | "plain" | "quiet"
std::optional<ConsoleMode> parse_console_mode(const std::string& s);

struct BuildTaskRequest {
    std::string task_path;                           // e.g. ":app:build"
    std::vector<std::string> args;                   // extra command line arguments
    std::map<std::string, std::string> system_properties;
    std::map<std::string, std::string> environment;
    bool offline = false;
    bool refresh_dependencies = false;
    bool debug = false;
    ConsoleMode console = ConsoleMode::Plain;
    std::chrono::milliseconds timeout{0};            // <= 0: none
};

// Extra args, then --offline, --refresh-dependencies, the console flag and
// one -Dkey=value per system property. The task path is not included.
std::vector<std::string> build_arguments(const BuildTaskRequest& req);

// Properties that make the build JVM wait for a debugger on `port`.
std::vector<std::string> debug_arguments(int port);

// A currently unused local TCP port. Throws std::runtime_error on socket failure.
int find_free_port();

} // namespace toolbridge
