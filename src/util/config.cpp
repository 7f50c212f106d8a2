/*
 * Configuration (~/.toolbridgerc) - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/util/config.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace toolbridge {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool parse_bool(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

bool parse_millis(const std::string& key, const std::string& v, std::chrono::milliseconds& out) {
    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size() || n <= 0) throw std::invalid_argument(v);
        out = std::chrono::milliseconds(n);
        return true;
    } catch (const std::exception&) {
        log::warn("config", key + ": expected a positive number of milliseconds, got '" + v + "'");
        return false;
    }
}

} // namespace

GitTimeouts Config::git_timeouts() const {
    GitTimeouts t;
    t.local = status_timeout;
    t.commit = std::max(status_timeout, t.commit);
    t.push = push_timeout;
    t.network = network_timeout;
    return t;
}

bool apply_setting(Config& cfg, const std::string& key, const std::string& value) {
    if (key == "git_executable") { cfg.git_executable = value; return true; }
    if (key == "gradle_executable") { cfg.gradle_executable = value; return true; }
    if (key == "probe_timeout_ms") return parse_millis(key, value, cfg.probe_timeout);
    if (key == "status_timeout_ms") return parse_millis(key, value, cfg.status_timeout);
    if (key == "push_timeout_ms") return parse_millis(key, value, cfg.push_timeout);
    if (key == "network_timeout_ms") return parse_millis(key, value, cfg.network_timeout);
    if (key == "auto_refresh_interval_ms") return parse_millis(key, value, cfg.auto_refresh_interval);
    if (key == "gradle_offline") { cfg.gradle_offline = parse_bool(value); return true; }
    if (key == "gradle_console") {
        if (auto m = parse_console_mode(value)) { cfg.gradle_console = *m; return true; }
        log::warn("config", "gradle_console: expected rich|plain|quiet, got '" + value + "'");
        return false;
    }
    if (key == "log_level") {
        if (auto l = log::parse_level(value)) { cfg.log_level = *l; return true; }
        log::warn("config", "log_level: expected error|warn|info|debug, got '" + value + "'");
        return false;
    }
    log::warn("config", "unknown key '" + key + "'");
    return false;
}

Config parse_config(std::istream& in) {
    Config cfg;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            log::warn("config", "ignoring line without '=': " + line);
            continue;
        }
        apply_setting(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
    return cfg;
}

Config load_config(const std::string& path) {
    if (path.empty()) return Config{};
    std::ifstream in(path);
    if (!in) return Config{};
    return parse_config(in);
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.toolbridgerc";
}

} // namespace toolbridge
