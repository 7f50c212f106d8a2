/*
 * git client - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/git_client.hpp>
#include <toolbridge/vcs/progress_parser.hpp>
#include <toolbridge/vcs/status_parser.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace toolbridge {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::string joined_stdout(const ExecutionResult& r) {
    std::string out;
    for (auto &l : r.stdout_lines) out += l;
    return trim(out);
}

// Feeds stderr lines (where git writes progress) through the progress parser.
class ProgressForwarder : public OutputListener {
public:
    ProgressForwarder(const GitProgressCallback& cb, std::string phase) : m_cb(cb), m_phase(std::move(phase)) {}
    void on_output(OutputStream stream, const std::string& chunk) override {
        log::debug("git", chunk);
        if (!m_cb || stream != OutputStream::Stderr) return;
        auto upd = m_parser.parse(chunk);
        if (!upd) return;
        if (upd->kind == ProgressUpdate::Kind::Message) upd->phase = m_phase;
        else m_phase = upd->phase;
        m_cb(*upd);
    }
private:
    const GitProgressCallback& m_cb;
    std::string m_phase;
    GitProgressParser m_parser;
};

} // namespace

GitClient::GitClient(const ProcessRunner& runner, GitCommands commands)
    : m_runner(runner), m_commands(std::move(commands)) {}

ExecutionResult GitClient::run_checked(const CommandInvocation& inv, const std::string& what,
                                       OutputListener* listener, const CancellationToken* token) const {
    auto r = m_runner.run(inv, listener, token);
    if (r.spawn_error) throw GitError("git " + what + " could not start: " + *r.spawn_error, r.exit_code);
    if (r.timed_out) throw GitError("git " + what + " timed out", r.exit_code);
    if (r.cancelled) throw GitError("git " + what + " was cancelled", r.exit_code);
    if (r.exit_code != 0) throw GitError("git " + what + " failed: " + r.stderr_text(), r.exit_code);
    return r;
}

std::optional<std::string> GitClient::query(const CommandInvocation& inv, const std::string& what) const {
    auto r = m_runner.run(inv);
    if (r.timed_out) throw GitError("git " + what + " timed out", r.exit_code);
    if (r.cancelled) throw GitError("git " + what + " was cancelled", r.exit_code);
    if (r.exit_code != 0) return std::nullopt;
    std::string value = joined_stdout(r);
    if (value.empty()) return std::nullopt;
    return value;
}

RepositoryStatus GitClient::status(const GitRepository& repo) const {
    auto r = run_checked(m_commands.status(repo.root), "status");
    std::size_t skipped = 0;
    auto st = StatusParser(repo.root).parse_records(r.stdout_lines, &skipped);
    if (skipped) log::warn("git", "status: skipped " + std::to_string(skipped) + " malformed records");
    return st;
}

std::optional<GitRepository> GitClient::detect_repository(const fs::path& dir) const {
    auto inside = m_runner.run(m_commands.is_inside_work_tree(dir));
    if (inside.timed_out || inside.cancelled) {
        log::warn("git", "rev-parse --is-inside-work-tree " + std::string(inside.timed_out ? "timed out" : "was cancelled") + " for " + dir.string());
        return std::nullopt;
    }
    std::string answer = inside.first_stdout_line().value_or("");
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c){ return std::tolower(c); });
    if (inside.exit_code != 0 || trim(answer) != "true") return std::nullopt;

    auto top = m_runner.run(m_commands.show_toplevel(dir));
    if (top.timed_out || top.cancelled) {
        log::warn("git", "rev-parse --show-toplevel " + std::string(top.timed_out ? "timed out" : "was cancelled") + " for " + dir.string());
        return std::nullopt;
    }
    if (top.exit_code != 0) return std::nullopt;
    std::string top_level = joined_stdout(top);
    if (top_level.empty()) return std::nullopt;
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(top_level), ec);
    if (ec) {
        log::warn("git", "cannot use top-level path " + top_level + ": " + ec.message());
        return std::nullopt;
    }
    return GitRepository{abs.lexically_normal()};
}

void GitClient::stage(const GitRepository& repo, const std::vector<fs::path>& paths) const {
    if (paths.empty()) return;
    run_checked(m_commands.stage(repo.root, paths), "add");
}

void GitClient::unstage(const GitRepository& repo, const std::vector<fs::path>& paths) const {
    if (paths.empty()) return;
    run_checked(m_commands.unstage(repo.root, paths), "restore");
}

void GitClient::commit(const GitRepository& repo, const CommitRequest& req) const {
    if (trim(req.message).empty()) throw std::invalid_argument("commit message is empty");
    run_checked(m_commands.commit(repo.root, req), "commit");
}

void GitClient::run_with_progress(const CommandInvocation& inv, const std::string& what, const std::string& phase,
                                  const GitProgressCallback& progress, const CancellationToken* token) const {
    ProgressForwarder fwd(progress, phase);
    run_checked(inv, what, &fwd, token);
}

void GitClient::fetch(const GitRepository& repo, const GitProgressCallback& progress, const CancellationToken* token) const {
    run_with_progress(m_commands.fetch(repo.root), "fetch", "Fetch", progress, token);
}

void GitClient::pull(const GitRepository& repo, const GitProgressCallback& progress, const CancellationToken* token) const {
    run_with_progress(m_commands.pull(repo.root), "pull", "Pull", progress, token);
}

void GitClient::push(const GitRepository& repo, const GitProgressCallback& progress, const CancellationToken* token) const {
    run_with_progress(m_commands.push(repo.root), "push", "Push", progress, token);
}

std::vector<GitRemote> GitClient::parse_remotes(const std::vector<std::string>& lines) {
    // "origin\thttps://host/repo.git (fetch)"
    std::vector<GitRemote> out;
    for (auto &line : lines) {
        std::istringstream in(line);
        std::string name, url, kind;
        if (!(in >> name >> url)) continue;
        in >> kind;
        auto it = std::find_if(out.begin(), out.end(), [&](const GitRemote& r){ return r.name == name; });
        if (it == out.end()) { out.push_back(GitRemote{name, {}, {}}); it = std::prev(out.end()); }
        if (kind == "(push)") it->push_url = url;
        else it->fetch_url = url;
    }
    return out;
}

std::vector<GitRemote> GitClient::remotes(const GitRepository& repo) const {
    return parse_remotes(run_checked(m_commands.remotes(repo.root), "remote").stdout_lines);
}

std::optional<GitUpstream> GitClient::parse_upstream(const std::string& raw) {
    std::string ref = trim(raw);
    if (ref.empty()) return std::nullopt;
    size_t slash = ref.find('/');
    if (slash == std::string::npos) return GitUpstream{"origin", ref};
    return GitUpstream{ref.substr(0, slash), ref.substr(slash + 1)};
}

std::optional<GitUpstream> GitClient::upstream(const GitRepository& repo) const {
    auto ref = query(m_commands.upstream(repo.root), "rev-parse");
    if (!ref) return std::nullopt;
    return parse_upstream(*ref);
}

std::optional<std::string> GitClient::user_name() const { return query(m_commands.config_get("user.name"), "config user.name"); }
std::optional<std::string> GitClient::user_email() const { return query(m_commands.config_get("user.email"), "config user.email"); }
std::optional<std::string> GitClient::version() const { return query(m_commands.version(), "--version"); }

GitIdentity GitClient::identity() const {
    return GitIdentity{user_name(), user_email(), version()};
}

} // namespace toolbridge
