/*
 * Executable discovery implementation - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/exec/locator.hpp>
#include <toolbridge/exec/path.hpp>
#include <toolbridge/util/log.hpp>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

namespace toolbridge {

OsFamily host_os_family() {
#ifdef _WIN32
    return OsFamily::Windows;
#else
    return OsFamily::Posix;
#endif
}

LocatorEnvironment LocatorEnvironment::host() {
    LocatorEnvironment env;
    env.os = host_os_family();
    const char* home = std::getenv(env.os == OsFamily::Windows ? "USERPROFILE" : "HOME");
    if (home) env.home = home;
    if (const char* sdk = std::getenv("SDKMAN_DIR")) env.sdkman_dir = std::string(sdk);
    env.drive_exists = [](char drive) {
        std::error_code ec;
        return fs::exists(fs::path(std::string(1, drive) + ":\\"), ec);
    };
    return env;
}

std::vector<fs::path> candidate_paths(const std::string& tool, const LocatorEnvironment& env) {
    std::vector<fs::path> paths;
    if (tool.empty()) return paths;
    if (env.os == OsFamily::Windows) {
        std::string folder = tool;
        folder[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(folder[0])));
        const std::string exe = tool == "gradle" ? tool + ".bat" : tool + ".exe";
        const std::string bases[] = {
            "\\Program Files\\" + folder + "\\bin\\",
            "\\Program Files\\" + folder + "\\cmd\\",
            "\\Program Files (x86)\\" + folder + "\\bin\\",
            "\\Program Files (x86)\\" + folder + "\\cmd\\",
            "\\ProgramData\\chocolatey\\bin\\"
        };
        // A: and B: are floppy letters.
        for (char drive = 'C'; drive <= 'Z'; ++drive) {
            if (!env.drive_exists || !env.drive_exists(drive)) continue;
            for (auto &b : bases) paths.emplace_back(std::string(1, drive) + ":" + b + exe);
        }
        if (!env.home.empty()) {
            const std::string scoop = env.home + "\\scoop\\";
            paths.emplace_back(scoop + "apps\\" + tool + "\\current\\bin\\" + exe);
            paths.emplace_back(scoop + "apps\\" + tool + "\\current\\cmd\\" + exe);
            paths.emplace_back(scoop + "shims\\" + exe);
        }
        return paths;
    }
    for (const char* dir : {"/usr/bin/", "/usr/local/bin/", "/opt/homebrew/bin/", "/snap/bin/"})
        paths.emplace_back(std::string(dir) + tool);
    if (tool == "gradle") {
        paths.emplace_back("/opt/gradle/bin/gradle");
        if (env.sdkman_dir) paths.emplace_back(*env.sdkman_dir + "/candidates/gradle/current/bin/gradle");
        else if (!env.home.empty()) paths.emplace_back(env.home + "/.sdkman/candidates/gradle/current/bin/gradle");
    }
    return paths;
}

ExecutableLocator::ExecutableLocator(const ProcessRunner& runner, LocatorEnvironment env)
    : m_runner(runner), m_env(std::move(env)) {}

std::optional<fs::path> ExecutableLocator::first_usable(const std::vector<fs::path>& candidates) {
    for (auto &p : candidates) {
        if (is_executable(p.string())) return p;
    }
    return std::nullopt;
}

std::optional<fs::path> ExecutableLocator::locate(const std::string& tool, std::chrono::milliseconds probe_timeout) const {
    if (tool.empty()) return std::nullopt;
    auto probe = CommandBuilder(tool).arg("--version").timeout(probe_timeout).merge_stderr().build();
    auto r = m_runner.run(probe);
    if (r.succeeded()) {
        if (auto resolved = resolve_executable(tool)) {
            std::error_code ec;
            fs::path canonical = fs::canonical(*resolved, ec);
            return ec ? fs::path(*resolved) : canonical;
        }
    } else if (r.timed_out) {
        log::warn("locate", tool + " --version timed out after " + std::to_string(probe_timeout.count()) + "ms");
    } else {
        log::debug("locate", tool + " not runnable from PATH (exit " + std::to_string(r.exit_code) + ")");
    }
    auto found = first_usable(candidate_paths(tool, m_env));
    if (found) log::debug("locate", tool + " found at " + found->string());
    return found;
}

} // namespace toolbridge
