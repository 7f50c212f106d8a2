/*
 * Configuration (~/.toolbridgerc) - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/build/build_request.hpp>
#include <toolbridge/util/log.hpp>
#include <toolbridge/vcs/git_commands.hpp>
#include <chrono>
#include <istream>
#include <optional>
#include <string>

namespace toolbridge {

struct Config {
    std::optional<std::string> git_executable;    // skip discovery when set
    std::optional<std::string> gradle_executable;
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds status_timeout{5000};
    std::chrono::milliseconds push_timeout{15000};
    std::chrono::milliseconds network_timeout{30000};
    std::chrono::milliseconds auto_refresh_interval{5000};
    bool gradle_offline = false;
    ConsoleMode gradle_console = ConsoleMode::Plain;
    log::Level log_level = log::Level::Warn;

    GitTimeouts git_timeouts() const;
};

// "key=value" lines, '#' comments. Unknown keys and bad values are reported
// on stderr and otherwise ignored. Returns false for those.
bool apply_setting(Config& cfg, const std::string& key, const std::string& value);
Config parse_config(std::istream& in);
// A missing or unreadable file yields the defaults.
Config load_config(const std::string& path);
// $HOME/.toolbridgerc, empty when HOME is unset.
std::string default_config_path();

} // namespace toolbridge
