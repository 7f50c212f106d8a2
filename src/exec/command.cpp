/*
 * Command invocation implementation - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/exec/command.hpp>
#include <stdexcept>

namespace toolbridge {

std::string CommandInvocation::display() const {
    std::string out = executable;
    for (auto &a : args) {
        out += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) out += '"' + a + '"';
        else out += a;
    }
    return out;
}

CommandBuilder::CommandBuilder(std::string executable) { m_inv.executable = std::move(executable); }

CommandBuilder& CommandBuilder::arg(std::string a) { m_inv.args.push_back(std::move(a)); return *this; }

CommandBuilder& CommandBuilder::args(const std::vector<std::string>& a) {
    m_inv.args.insert(m_inv.args.end(), a.begin(), a.end());
    return *this;
}

CommandBuilder& CommandBuilder::env(const std::string& key, const std::string& value) { m_inv.env[key] = value; return *this; }

CommandBuilder& CommandBuilder::working_dir(const std::filesystem::path& dir) { m_inv.working_dir = dir; return *this; }

CommandBuilder& CommandBuilder::timeout(std::chrono::milliseconds t) { m_inv.timeout = t; return *this; }

CommandBuilder& CommandBuilder::merge_stderr(bool merge) {
    m_inv.stderr_mode = merge ? StderrMode::Merge : StderrMode::Separate;
    return *this;
}

CommandBuilder& CommandBuilder::capture(CaptureMode mode) { m_inv.capture = mode; return *this; }

CommandInvocation CommandBuilder::build() const {
    if (m_inv.executable.empty()) throw std::invalid_argument("command invocation without executable");
    return m_inv;
}

} // namespace toolbridge
