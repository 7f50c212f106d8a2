/*
 * git client - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/task/progress.hpp>
#include <toolbridge/vcs/file_change.hpp>
#include <toolbridge/vcs/git_commands.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge {

// A git command the caller depends on timed out, was cancelled or failed.
class GitError : public std::runtime_error {
public:
    explicit GitError(const std::string& msg, int exit_code = -1)
        : std::runtime_error(msg), m_exit_code(exit_code) {}
    int exit_code() const { return m_exit_code; }
private:
    int m_exit_code;
};

struct GitRepository {
    std::filesystem::path root; // absolute, normalized top level
    bool operator==(const GitRepository& o) const { return root == o.root; }
};

struct GitUpstream {
    std::string remote;
    std::string branch;
};

struct GitRemote {
    std::string name;
    std::string fetch_url;
    std::string push_url;
};

struct GitIdentity {
    std::optional<std::string> user_name;
    std::optional<std::string> user_email;
    std::optional<std::string> version;
};

// Progress of fetch/pull/push. Message updates carry the last seen phase,
// starting with "Fetch", "Pull" or "Push".
using GitProgressCallback = std::function<void(const ProgressUpdate&)>;

class GitClient {
public:
    GitClient(const ProcessRunner& runner, GitCommands commands);

    const GitCommands& commands() const { return m_commands; }

    RepositoryStatus status(const GitRepository& repo) const;
    // Absent when dir is not inside a work tree or git does not answer in time.
    std::optional<GitRepository> detect_repository(const std::filesystem::path& dir) const;

    void stage(const GitRepository& repo, const std::vector<std::filesystem::path>& paths) const;
    void unstage(const GitRepository& repo, const std::vector<std::filesystem::path>& paths) const;
    void commit(const GitRepository& repo, const CommitRequest& req) const;

    void fetch(const GitRepository& repo, const GitProgressCallback& progress = {}, const CancellationToken* token = nullptr) const;
    void pull(const GitRepository& repo, const GitProgressCallback& progress = {}, const CancellationToken* token = nullptr) const;
    void push(const GitRepository& repo, const GitProgressCallback& progress = {}, const CancellationToken* token = nullptr) const;

    std::vector<GitRemote> remotes(const GitRepository& repo) const;
    // "origin/main" -> {origin, main}; a ref without '/' is taken as a branch of "origin".
    std::optional<GitUpstream> upstream(const GitRepository& repo) const;
    std::optional<std::string> user_name() const;
    std::optional<std::string> user_email() const;
    std::optional<std::string> version() const;
    GitIdentity identity() const;

    static std::optional<GitUpstream> parse_upstream(const std::string& ref);
    static std::vector<GitRemote> parse_remotes(const std::vector<std::string>& lines);
private:
    // Throws GitError unless the command exited 0.
    ExecutionResult run_checked(const CommandInvocation& inv, const std::string& what,
                                OutputListener* listener = nullptr, const CancellationToken* token = nullptr) const;
    // Throws GitError on timeout/cancel; absent on non-zero exit or empty output.
    std::optional<std::string> query(const CommandInvocation& inv, const std::string& what) const;
    void run_with_progress(const CommandInvocation& inv, const std::string& what, const std::string& phase,
                           const GitProgressCallback& progress, const CancellationToken* token) const;

    const ProcessRunner& m_runner;
    GitCommands m_commands;
};

} // namespace toolbridge
