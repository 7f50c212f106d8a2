/*
 * Command invocation - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// How stdout is split before it reaches the result and the listener.
// stderr is always split in lines.
enum class CaptureMode {
    Lines,       // split on '\n' or '\r', empty lines dropped
    NullRecords, // split on '\0' (git -z output)
    Whole        // one chunk with the complete text
};

enum class StderrMode { Separate, Merge };

struct CommandInvocation {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overlay on top of the inherited environment
    std::optional<std::filesystem::path> working_dir;
    std::chrono::milliseconds timeout{0};   // <= 0 means no timeout
    StderrMode stderr_mode = StderrMode::Separate;
    CaptureMode capture = CaptureMode::Lines;

    bool has_timeout() const { return timeout.count() > 0; }
    // Human readable command line, for logs and error messages.
    std::string display() const;
};

class CommandBuilder {
public:
    explicit CommandBuilder(std::string executable);
    CommandBuilder& arg(std::string a);
    CommandBuilder& args(const std::vector<std::string>& a);
    CommandBuilder& env(const std::string& key, const std::string& value);
    CommandBuilder& working_dir(const std::filesystem::path& dir);
    CommandBuilder& timeout(std::chrono::milliseconds t);
    CommandBuilder& merge_stderr(bool merge = true);
    CommandBuilder& capture(CaptureMode mode);
    // Throws std::invalid_argument when the executable is empty.
    CommandInvocation build() const;
private:
    CommandInvocation m_inv;
};

} // namespace toolbridge
