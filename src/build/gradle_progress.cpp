/*
 * Gradle console progress recognition - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/build/gradle_progress.hpp>
#include <algorithm>
#include <regex>

namespace toolbridge {

std::string GradleProgressParser::strip_ansi(const std::string& s) {
    static const std::regex csi("\x1b\\[[0-9;?]*[ -/]*[@-~]");
    return std::regex_replace(s, csi, "");
}

std::optional<ProgressUpdate> GradleProgressParser::parse(const std::string& raw) const {
    static const std::regex percent(R"(^<[=\-]*>\s*(\d{1,3})%\s*([A-Z]+)?.*$)");
    std::string line = strip_ansi(raw);
    size_t a = line.find_first_not_of(" \t");
    if (a == std::string::npos) return std::nullopt;
    line = line.substr(a);
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.pop_back();

    std::smatch m;
    if (std::regex_match(line, m, percent)) {
        ProgressUpdate u;
        u.kind = ProgressUpdate::Kind::Percentage;
        u.phase = m[2].matched ? m[2].str() : std::string("EXECUTING");
        u.percent = std::clamp(std::stoi(m[1].str()), 0, 100);
        u.fraction = *u.percent / 100.0;
        u.text = line;
        return u;
    }
    if (line.rfind("> Task ", 0) == 0 || line.rfind("> Configure project", 0) == 0) {
        ProgressUpdate u;
        u.kind = ProgressUpdate::Kind::Message;
        u.text = line;
        return u;
    }
    if (line.rfind("BUILD SUCCESSFUL", 0) == 0 || line.rfind("BUILD FAILED", 0) == 0) {
        ProgressUpdate u;
        u.kind = ProgressUpdate::Kind::Message;
        u.text = line;
        if (line[6] == 'S') u.fraction = 1.0;
        return u;
    }
    return std::nullopt;
}

} // namespace toolbridge
