/*
 * Process runner implementation - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/exec/process_runner.hpp>
#include <toolbridge/exec/path.hpp>
#include <toolbridge/util/log.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace toolbridge {

namespace {

constexpr int kPollIntervalMs = 50;

using Emit = std::function<void(std::string&&)>;

// Turns raw pipe bytes into lines, NUL records or one whole chunk.
// In line mode '\r' also ends a line (progress redraws); the '\n' of a
// "\r\n" pair does not add an empty line, a real blank line does.
class Splitter {
public:
    explicit Splitter(CaptureMode mode) : m_mode(mode) {}

    void feed(const char* data, size_t n, const Emit& emit) {
        if (m_mode == CaptureMode::Whole) { m_buf.append(data, n); return; }
        for (size_t i = 0; i < n; ++i) {
            char c = data[i];
            if (m_mode == CaptureMode::NullRecords) {
                if (c != '\0') { m_buf.push_back(c); continue; }
                emit(std::move(m_buf));
                m_buf.clear();
                continue;
            }
            bool line_ended_by_cr = m_line_ended_by_cr;
            m_line_ended_by_cr = false;
            if (c == '\r') {
                if (!m_buf.empty()) { emit(std::move(m_buf)); m_line_ended_by_cr = true; }
                m_buf.clear();
            } else if (c == '\n') {
                if (!line_ended_by_cr) emit(std::move(m_buf));
                m_buf.clear();
            } else {
                m_buf.push_back(c);
            }
        }
    }

    void flush(const Emit& emit) {
        if (!m_buf.empty()) emit(std::move(m_buf));
        m_buf.clear();
    }
private:
    CaptureMode m_mode;
    std::string m_buf;
    bool m_line_ended_by_cr = false;
};

struct Pipe {
    int fd[2] = {-1, -1};
    void close_read() { if (fd[0] != -1) { close(fd[0]); fd[0] = -1; } }
    void close_write() { if (fd[1] != -1) { close(fd[1]); fd[1] = -1; } }
    ~Pipe() { close_read(); close_write(); }
};

int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return -1;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace

std::optional<std::string> ExecutionResult::first_stdout_line() const {
    if (stdout_lines.empty()) return std::nullopt;
    return stdout_lines.front();
}

std::optional<std::string> ExecutionResult::first_stderr_line() const {
    if (stderr_lines.empty()) return std::nullopt;
    return stderr_lines.front();
}

std::string ExecutionResult::stdout_text() const { return join_lines(stdout_lines); }
std::string ExecutionResult::stderr_text() const { return join_lines(stderr_lines); }

ExecutionResult ProcessRunner::run(const CommandInvocation& inv, OutputListener* listener, const CancellationToken* token) const {
    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    ExecutionResult result;
    auto finish = [&]() -> ExecutionResult {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
        return std::move(result);
    };

    auto exe = resolve_executable(inv.executable);
    if (!exe) {
        result.exit_code = 127;
        result.spawn_error = inv.executable + ": command not found";
        log::debug("exec", *result.spawn_error);
        return finish();
    }

    const bool merge = inv.stderr_mode == StderrMode::Merge;
    Pipe out, err, status_pipe;
    // O_CLOEXEC keeps these ends out of children forked by other workers;
    // dup2 clears the flag on the child's stdout and stderr.
    if (pipe2(out.fd, O_CLOEXEC) != 0 || (!merge && pipe2(err.fd, O_CLOEXEC) != 0) ||
        pipe2(status_pipe.fd, O_CLOEXEC) != 0) {
        result.exit_code = 127;
        result.spawn_error = std::string("pipe: ") + std::strerror(errno);
        return finish();
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_s;
    argv_s.reserve(inv.args.size() + 1);
    argv_s.push_back(*exe);
    argv_s.insert(argv_s.end(), inv.args.begin(), inv.args.end());
    std::vector<char*> cargv;
    cargv.reserve(argv_s.size() + 1);
    for (auto &s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    std::string workdir = inv.working_dir ? inv.working_dir->string() : std::string();
    // Inherited environment with the overlay applied; the child only calls execve.
    std::vector<std::string> env_s;
    for (char **e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && inv.env.count(entry.substr(0, eq))) continue;
        env_s.push_back(std::move(entry));
    }
    for (auto &kv : inv.env) env_s.push_back(kv.first + "=" + kv.second);
    std::vector<char*> cenv;
    cenv.reserve(env_s.size() + 1);
    for (auto &s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = 127;
        result.spawn_error = std::string("fork: ") + std::strerror(errno);
        return finish();
    }
    if (pid == 0) {
        setpgid(0, 0);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        auto fail = [&](int code) {
            int e = errno;
            ssize_t w = write(status_pipe.fd[1], &e, sizeof(e));
            (void)w;
            _exit(code);
        };
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); close(devnull); }
        if (dup2(out.fd[1], STDOUT_FILENO) < 0) fail(127);
        if (dup2(merge ? out.fd[1] : err.fd[1], STDERR_FILENO) < 0) fail(127);
        close(out.fd[0]); close(out.fd[1]);
        if (!merge) { close(err.fd[0]); close(err.fd[1]); }
        close(status_pipe.fd[0]);
        if (!workdir.empty() && chdir(workdir.c_str()) != 0) fail(127);
        execve(cargv[0], cargv.data(), cenv.data());
        fail(127);
    }

    setpgid(pid, pid);
    out.close_write();
    err.close_write();
    status_pipe.close_write();

    // The status pipe is closed by exec; any bytes mean exec (or setup) failed.
    int child_errno = 0;
    ssize_t n;
    while ((n = read(status_pipe.fd[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {}
    if (n > 0) {
        int st = 0;
        while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        result.exit_code = 127;
        result.spawn_error = inv.executable + ": " + std::strerror(child_errno);
        log::debug("exec", *result.spawn_error);
        return finish();
    }

    log::debug("exec", "started pid " + std::to_string(pid) + ": " + inv.display());
    if (listener) listener->on_started(pid);

    Splitter out_split(inv.capture);
    Splitter err_split(merge ? inv.capture : CaptureMode::Lines);
    Emit emit_out = [&](std::string&& s) {
        if (listener) listener->on_output(OutputStream::Stdout, s);
        result.stdout_lines.push_back(std::move(s));
    };
    Emit emit_err = [&](std::string&& s) {
        if (listener) listener->on_output(OutputStream::Stderr, s);
        result.stderr_lines.push_back(std::move(s));
    };

    for (int fd : {out.fd[0], err.fd[0]}) if (fd != -1) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

    const auto deadline = inv.has_timeout() ? start + inv.timeout : clock::time_point::max();
    bool exited = false, reaped = false, terminating = false, killed = false;
    int status = 0;
    clock::time_point kill_at{}, drain_until{};
    std::array<char, 4096> buf{};

    auto drain = [&](Pipe& p, Splitter& sp, const Emit& emit) {
        while (p.fd[0] != -1) {
            ssize_t r = read(p.fd[0], buf.data(), buf.size());
            if (r > 0) { sp.feed(buf.data(), static_cast<size_t>(r), emit); continue; }
            if (r < 0 && errno == EINTR) continue;
            if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            p.close_read(); // EOF or hard error
        }
    };

    while (true) {
        auto now = clock::now();
        if (!exited && !terminating) {
            if (token && token->is_cancelled()) result.cancelled = true;
            else if (now >= deadline) result.timed_out = true;
            if (result.cancelled || result.timed_out) {
                log::debug("exec", std::string(result.cancelled ? "cancelling" : "timeout for") + " pid " + std::to_string(pid));
                kill(-pid, SIGTERM);
                terminating = true;
                kill_at = now + m_opts.kill_grace;
            }
        }
        if (terminating && !killed && now >= kill_at) {
            kill(-pid, SIGKILL);
            killed = true;
        }

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (out.fd[0] != -1) fds[nfds++] = {out.fd[0], POLLIN, 0};
        if (err.fd[0] != -1) fds[nfds++] = {err.fd[0], POLLIN, 0};
        if (nfds == 0 && exited) break;
        int pr = poll(nfds ? fds.data() : nullptr, nfds, kPollIntervalMs);
        if (pr < 0 && errno != EINTR) {
            log::warn("exec", std::string("poll: ") + std::strerror(errno));
            out.close_read(); err.close_read();
        }
        if (pr > 0) {
            drain(out, out_split, emit_out);
            drain(err, err_split, emit_err);
        }

        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exited = reaped = true;
                drain_until = clock::now() + m_opts.drain_grace;
            } else if (w < 0 && errno != EINTR) {
                exited = true;
                log::warn("exec", std::string("waitpid: ") + std::strerror(errno));
            }
        } else if (clock::now() >= drain_until) {
            // Descendants still hold the pipes open; keep what has been read.
            if (terminating) kill(-pid, SIGKILL);
            out.close_read(); err.close_read();
        }
    }

    out_split.flush(emit_out);
    err_split.flush(emit_err);

    if (reaped) result.exit_code = decode_status(status);
    else result.exit_code = result.cancelled ? -2 : (result.timed_out ? -3 : -1);
    auto r = finish();
    log::debug("exec", inv.executable + " exited " + std::to_string(r.exit_code) + " in " + std::to_string(r.duration.count()) + "ms");
    return r;
}

} // namespace toolbridge
