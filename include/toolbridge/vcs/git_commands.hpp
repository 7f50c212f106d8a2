/*
 * git command lines - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/command.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace toolbridge {

struct GitTimeouts {
    std::chrono::milliseconds local{5000};    // status, rev-parse, add, restore, config
    std::chrono::milliseconds commit{10000};
    std::chrono::milliseconds push{15000};
    std::chrono::milliseconds network{30000}; // fetch, pull
};

struct CommitRequest {
    std::string message;
    std::string description; // second -m paragraph when not blank
    bool amend = false;
    bool sign_off = false;
    std::vector<std::filesystem::path> paths; // empty: everything staged
};

// Builds git invocations. Every command runs with GIT_TERMINAL_PROMPT=0.
class GitCommands {
public:
    explicit GitCommands(std::string git_executable = "git", GitTimeouts timeouts = {});

    const std::string& executable() const { return m_git; }
    const GitTimeouts& timeouts() const { return m_timeouts; }

    CommandInvocation status(const std::filesystem::path& repo) const; // porcelain v1, -b -z
    CommandInvocation is_inside_work_tree(const std::filesystem::path& dir) const;
    CommandInvocation show_toplevel(const std::filesystem::path& dir) const;
    CommandInvocation stage(const std::filesystem::path& repo, const std::vector<std::filesystem::path>& paths) const;
    CommandInvocation unstage(const std::filesystem::path& repo, const std::vector<std::filesystem::path>& paths) const;
    CommandInvocation commit(const std::filesystem::path& repo, const CommitRequest& req) const;
    CommandInvocation push(const std::filesystem::path& repo) const;
    CommandInvocation fetch(const std::filesystem::path& repo) const;
    CommandInvocation pull(const std::filesystem::path& repo) const;
    CommandInvocation remotes(const std::filesystem::path& repo) const;
    CommandInvocation upstream(const std::filesystem::path& repo) const;
    CommandInvocation config_get(const std::string& key) const;
    CommandInvocation version() const;
private:
    CommandBuilder base(std::chrono::milliseconds timeout) const;

    std::string m_git;
    GitTimeouts m_timeouts;
};

} // namespace toolbridge
