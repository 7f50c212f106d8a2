/*
 * Executable discovery - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/process_runner.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class OsFamily { Posix, Windows };

OsFamily host_os_family();

// Inputs of the fallback candidate list, separated from the host so the
// list can be computed for either OS family.
struct LocatorEnvironment {
    OsFamily os = OsFamily::Posix;
    std::string home;
    std::optional<std::string> sdkman_dir;
    std::function<bool(char drive)> drive_exists; // Windows only

    static LocatorEnvironment host();
};

// Well-known install locations for tool ("git", "gradle"), in probe order.
std::vector<std::filesystem::path> candidate_paths(const std::string& tool, const LocatorEnvironment& env);

class ExecutableLocator {
public:
    explicit ExecutableLocator(const ProcessRunner& runner, LocatorEnvironment env = LocatorEnvironment::host());

    // Runs "<tool> --version" within probe_timeout and resolves it on PATH;
    // falls back to candidate_paths(). Absence is not an error.
    std::optional<std::filesystem::path> locate(const std::string& tool,
                                                std::chrono::milliseconds probe_timeout = std::chrono::milliseconds(5000)) const;

    // First candidate that exists, is a regular file and is executable.
    static std::optional<std::filesystem::path> first_usable(const std::vector<std::filesystem::path>& candidates);
private:
    const ProcessRunner& m_runner;
    LocatorEnvironment m_env;
};

} // namespace toolbridge
