/*
 * git command lines - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/git_commands.hpp>

namespace fs = std::filesystem;

namespace toolbridge {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

GitCommands::GitCommands(std::string git_executable, GitTimeouts timeouts)
    : m_git(std::move(git_executable)), m_timeouts(timeouts) {}

CommandBuilder GitCommands::base(std::chrono::milliseconds timeout) const {
    CommandBuilder b(m_git);
    b.env("GIT_TERMINAL_PROMPT", "0").timeout(timeout);
    return b;
}

CommandInvocation GitCommands::status(const fs::path& repo) const {
    return base(m_timeouts.local).working_dir(repo)
        .args({"status", "--porcelain=v1", "-b", "-z"})
        .capture(CaptureMode::NullRecords).build();
}

CommandInvocation GitCommands::is_inside_work_tree(const fs::path& dir) const {
    return base(m_timeouts.local).working_dir(dir).args({"rev-parse", "--is-inside-work-tree"}).build();
}

CommandInvocation GitCommands::show_toplevel(const fs::path& dir) const {
    return base(m_timeouts.local).working_dir(dir).args({"rev-parse", "--show-toplevel"}).build();
}

CommandInvocation GitCommands::stage(const fs::path& repo, const std::vector<fs::path>& paths) const {
    auto b = base(m_timeouts.local).working_dir(repo).args({"add", "--"});
    for (auto &p : paths) b.arg(p.string());
    return b.build();
}

CommandInvocation GitCommands::unstage(const fs::path& repo, const std::vector<fs::path>& paths) const {
    auto b = base(m_timeouts.local).working_dir(repo).args({"restore", "--staged", "--"});
    for (auto &p : paths) b.arg(p.string());
    return b.build();
}

CommandInvocation GitCommands::commit(const fs::path& repo, const CommitRequest& req) const {
    auto b = base(m_timeouts.commit).working_dir(repo).args({"commit", "-m", req.message});
    if (!is_blank(req.description)) b.args({"-m", req.description});
    if (req.amend) b.arg("--amend");
    if (req.sign_off) b.arg("--signoff");
    if (!req.paths.empty()) {
        b.arg("--");
        for (auto &p : req.paths) if (!p.empty()) b.arg(p.string());
    }
    return b.build();
}

CommandInvocation GitCommands::push(const fs::path& repo) const {
    return base(m_timeouts.push).working_dir(repo).args({"push", "--progress"}).build();
}

CommandInvocation GitCommands::fetch(const fs::path& repo) const {
    return base(m_timeouts.network).working_dir(repo).args({"fetch", "--prune", "--progress"}).build();
}

CommandInvocation GitCommands::pull(const fs::path& repo) const {
    return base(m_timeouts.network).working_dir(repo).args({"pull", "--ff-only", "--progress"}).build();
}

CommandInvocation GitCommands::remotes(const fs::path& repo) const {
    return base(m_timeouts.local).working_dir(repo).args({"remote", "-v"}).build();
}

CommandInvocation GitCommands::upstream(const fs::path& repo) const {
    return base(m_timeouts.local).working_dir(repo)
        .args({"rev-parse", "--abbrev-ref", "--symbolic-full-name", "@{u}"}).build();
}

CommandInvocation GitCommands::config_get(const std::string& key) const {
    return base(m_timeouts.local).args({"config", "--get", key}).build();
}

CommandInvocation GitCommands::version() const {
    return base(m_timeouts.local).arg("--version").build();
}

} // namespace toolbridge
