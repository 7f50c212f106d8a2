#include <gtest/gtest.h>
#include <toolbridge/exec/command.hpp>
#include <toolbridge/exec/path.hpp>
#include <toolbridge/exec/process_runner.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <thread>
#include <unistd.h>

using namespace toolbridge;
namespace fs = std::filesystem;

static CommandInvocation sh(const std::string& script) {
    return CommandBuilder("/bin/sh").arg("-c").arg(script).build();
}

namespace {
struct Collector : OutputListener {
    std::vector<std::string> out, err;
    pid_t pid = 0;
    void on_started(pid_t p) override { pid = p; }
    void on_output(OutputStream s, const std::string& chunk) override {
        (s == OutputStream::Stdout ? out : err).push_back(chunk);
    }
};
}

TEST(ProcessRunner, CapturesStdoutLines) {
    ProcessRunner runner;
    auto r = runner.run(sh("echo one; echo; echo two"));
    EXPECT_TRUE(r.succeeded());
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_lines, (std::vector<std::string>{"one", "", "two"}));
    EXPECT_EQ(r.first_stdout_line().value_or(""), "one");
    EXPECT_FALSE(r.first_stderr_line().has_value());
}

TEST(ProcessRunner, SeparatesStderr) {
    ProcessRunner runner;
    auto r = runner.run(sh("echo out; echo err 1>&2; exit 3"));
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.succeeded());
    EXPECT_EQ(r.stdout_text(), "out");
    EXPECT_EQ(r.stderr_text(), "err");
}

TEST(ProcessRunner, MergesStderrWhenAsked) {
    ProcessRunner runner;
    auto inv = CommandBuilder("/bin/sh").arg("-c").arg("echo out; echo err 1>&2").merge_stderr().build();
    auto r = runner.run(inv);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.stderr_lines.empty());
    ASSERT_EQ(r.stdout_lines.size(), 2u);
}

TEST(ProcessRunner, CrLfIsOneLineBreak) {
    ProcessRunner runner;
    auto r = runner.run(CommandBuilder("printf").arg("a\\n\\nb\\r\\nc\\r\\n\\r\\nd").build());
    EXPECT_EQ(r.stdout_lines, (std::vector<std::string>{"a", "", "b", "c", "", "d"}));
}

TEST(ProcessRunner, CarriageReturnEndsProgressLines) {
    ProcessRunner runner;
    auto r = runner.run(CommandBuilder("printf").arg("10%%\\r50%%\\r100%%\\n").build());
    EXPECT_EQ(r.stdout_lines, (std::vector<std::string>{"10%", "50%", "100%"}));
}

TEST(ProcessRunner, SplitsNullRecords) {
    ProcessRunner runner;
    auto inv = CommandBuilder("printf").arg("a b\\0c\\0").capture(CaptureMode::NullRecords).build();
    auto r = runner.run(inv);
    ASSERT_EQ(r.stdout_lines.size(), 2u);
    EXPECT_EQ(r.stdout_lines[0], "a b");
    EXPECT_EQ(r.stdout_lines[1], "c");
}

TEST(ProcessRunner, MissingExecutableIs127) {
    ProcessRunner runner;
    auto r = runner.run(CommandBuilder("definitely-not-a-real-tool-xyz").build());
    EXPECT_EQ(r.exit_code, 127);
    ASSERT_TRUE(r.spawn_error.has_value());
    EXPECT_NE(r.spawn_error->find("definitely-not-a-real-tool-xyz"), std::string::npos);
}

TEST(ProcessRunner, TimeoutKeepsEarlierOutput) {
    ProcessRunner runner;
    auto inv = CommandBuilder("/bin/sh").arg("-c").arg("echo a; echo b; sleep 5")
        .timeout(std::chrono::milliseconds(500)).build();
    auto start = std::chrono::steady_clock::now();
    auto r = runner.run(inv);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(4));
    ASSERT_EQ(r.stdout_lines.size(), 2u);
    EXPECT_EQ(r.stdout_lines[1], "b");
}

TEST(ProcessRunner, CancellationStopsProcess) {
    ProcessRunner runner;
    CancellationToken token;
    std::thread canceller([&]{
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto r = runner.run(sh("sleep 10"), nullptr, &token);
    canceller.join();
    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.timed_out);
    EXPECT_LT(r.duration, std::chrono::milliseconds(5000));
}

TEST(ProcessRunner, AppliesEnvAndWorkingDir) {
    ProcessRunner runner;
    auto dir = fs::temp_directory_path();
    auto inv = CommandBuilder("/bin/sh").arg("-c").arg("echo $TB_VALUE; pwd")
        .env("TB_VALUE", "hello").working_dir(dir).build();
    auto r = runner.run(inv);
    ASSERT_EQ(r.stdout_lines.size(), 2u);
    EXPECT_EQ(r.stdout_lines[0], "hello");
    EXPECT_EQ(fs::canonical(r.stdout_lines[1]), fs::canonical(dir));
}

TEST(ProcessRunner, EnvOverlayReplacesInheritedValue) {
    ProcessRunner runner;
    setenv("TB_INHERITED", "old", 1);
    auto inv = CommandBuilder("/bin/sh").arg("-c").arg("echo $TB_INHERITED; env | grep -c '^TB_INHERITED='; echo $TB_KEPT")
        .env("TB_INHERITED", "new").build();
    setenv("TB_KEPT", "kept", 1);
    auto r = runner.run(inv);
    unsetenv("TB_INHERITED");
    unsetenv("TB_KEPT");
    EXPECT_EQ(r.stdout_lines, (std::vector<std::string>{"new", "1", "kept"}));
}

TEST(ProcessRunner, ConcurrentRunsWithEnvOverlay) {
    ProcessRunner runner;
    std::vector<std::thread> workers;
    std::atomic<int> good{0};
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                std::string v = std::to_string(t) + "-" + std::to_string(i);
                auto inv = CommandBuilder("/bin/sh").arg("-c").arg("echo $TB_WORKER")
                    .env("TB_WORKER", v).timeout(std::chrono::seconds(10)).build();
                auto r = runner.run(inv);
                if (r.succeeded() && r.stdout_lines == std::vector<std::string>{v}) ++good;
            }
        });
    }
    for (auto &w : workers) w.join();
    EXPECT_EQ(good.load(), 80);
}

TEST(ProcessRunner, PipeEndsDoNotLeakIntoChildren) {
    ProcessRunner runner;
    auto count_fds = [&] {
        auto r = runner.run(sh("ls /proc/self/fd | wc -l"));
        return r.stdout_lines.empty() ? -1 : std::stoi(r.stdout_lines[0]);
    };
    int alone = count_fds();
    ASSERT_GT(alone, 0);

    // A second run holds its output pipes open meanwhile.
    struct Started : OutputListener {
        std::promise<void> p;
        void on_started(pid_t) override { p.set_value(); }
        void on_output(OutputStream, const std::string&) override {}
    } started;
    auto running = started.p.get_future();
    std::thread other([&] { runner.run(sh("sleep 1"), &started); });
    running.wait();
    EXPECT_EQ(count_fds(), alone);
    other.join();
}

TEST(ProcessRunner, ListenerSeesLinesAndPid) {
    ProcessRunner runner;
    Collector c;
    auto r = runner.run(sh("echo x; echo y 1>&2"), &c);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_GT(c.pid, 0);
    EXPECT_EQ(c.out, std::vector<std::string>{"x"});
    EXPECT_EQ(c.err, std::vector<std::string>{"y"});
}

TEST(ProcessRunner, SignalledExitIs128PlusSignal) {
    ProcessRunner runner;
    auto r = runner.run(sh("kill -9 $$"));
    EXPECT_EQ(r.exit_code, 128 + 9);
}

TEST(CommandBuilder, RejectsEmptyExecutable) {
    EXPECT_THROW(CommandBuilder("").build(), std::invalid_argument);
}

TEST(PathResolve, SearchPathOrder) {
    auto parts = split_search_path("/a::/b:");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "/a");
    EXPECT_EQ(parts[1], "/b");
    auto p = resolve_executable("sh", "/nonexistent:/bin");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, "/bin/sh");
    EXPECT_FALSE(resolve_executable("sh", "/nonexistent").has_value());
    EXPECT_TRUE(is_executable("/bin/sh"));
    EXPECT_FALSE(is_executable("/"));
}
