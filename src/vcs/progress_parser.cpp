/*
 * git progress line recognition - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/progress_parser.hpp>
#include <algorithm>
#include <regex>

namespace toolbridge {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

ProgressUpdate message(std::string text) {
    ProgressUpdate u;
    u.kind = ProgressUpdate::Kind::Message;
    u.text = std::move(text);
    return u;
}

} // namespace

std::string GitProgressParser::normalize_phase(const std::string& phase) {
    static const std::regex ws(R"(\s+)");
    std::string p = trim(phase);
    if (p.empty()) return "(unknown)";
    return std::regex_replace(p, ws, " ");
}

std::optional<ProgressUpdate> GitProgressParser::parse(const std::string& line) const {
    static const std::regex percent_line(R"(^([A-Za-z ][A-Za-z ]+?):\s*(\d{1,3})%.*$)");
    static const std::regex phase_prefix(R"(^([A-Za-z ][A-Za-z ]+?):\s*.*$)");
    static const std::regex remote_prefix(R"(^remote:\s*(.*)$)");

    if (line.rfind(" + ", 0) == 0 || line.rfind(" = ", 0) == 0) return message(trim(line));
    std::string normalized = trim(line);
    if (normalized.empty()) return std::nullopt;
    if (normalized.rfind("From ", 0) == 0 || normalized.rfind("* ", 0) == 0) return message(normalized);

    std::smatch m;
    if (std::regex_match(normalized, m, remote_prefix)) {
        std::string rest = trim(m[1].str());
        if (auto nested = parse(rest)) return nested;
        return message(rest);
    }
    if (std::regex_match(normalized, m, percent_line)) {
        ProgressUpdate u;
        u.kind = ProgressUpdate::Kind::Percentage;
        u.phase = normalize_phase(m[1].str());
        u.percent = std::clamp(std::stoi(m[2].str()), 0, 100);
        u.text = normalized;
        return u;
    }
    if (std::regex_match(normalized, m, phase_prefix)) {
        ProgressUpdate u;
        u.kind = ProgressUpdate::Kind::Phase;
        u.phase = normalize_phase(m[1].str());
        u.text = normalized;
        return u;
    }
    return message(normalized);
}

} // namespace toolbridge
