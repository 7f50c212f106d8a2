#include <gtest/gtest.h>
#include <toolbridge/build/gradle_service.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sys/stat.h>
#include <unistd.h>

using namespace toolbridge;
namespace fs = std::filesystem;

// A project directory whose gradlew is a shell script.
class GradleProjectTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("toolbridge-gradle-" + std::to_string(getpid()) + "-" +
                                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    void wrapper(const std::string& body) {
        std::ofstream(dir / "gradlew") << "#!/bin/sh\n" << body << "\n";
        chmod((dir / "gradlew").c_str(), 0755);
    }

    fs::path dir;
    ProcessRunner runner;
};

TEST_F(GradleProjectTest, LauncherPrefersWrapper) {
    TaskExecutionEngine engine(runner);
    GradleExecutionService without(engine, dir, fs::path("/opt/gradle/bin/gradle"));
    EXPECT_EQ(without.launcher(), "/opt/gradle/bin/gradle");
    GradleExecutionService plain(engine, dir);
    EXPECT_EQ(plain.launcher(), "gradle");

    wrapper("exit 0");
    EXPECT_EQ(plain.launcher(), (dir / "gradlew").string());
}

TEST_F(GradleProjectTest, InvocationLayout) {
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir, fs::path("gradle"));
    BuildTaskRequest req;
    req.task_path = ":app:run";
    req.args = {"--info"};
    req.offline = true;
    req.environment = {{"JAVA_HOME", "/jdk"}};
    req.timeout = std::chrono::milliseconds(1000);
    auto inv = svc.make_invocation(req, 5005);
    EXPECT_EQ(inv.executable, "gradle");
    EXPECT_EQ(inv.args, (std::vector<std::string>{
        ":app:run", "--info", "--offline", "--console=plain",
        "-Dorg.gradle.debug=true", "-Dorg.gradle.debug.port=5005"}));
    EXPECT_EQ(inv.env.at("JAVA_HOME"), "/jdk");
    EXPECT_EQ(inv.working_dir.value(), dir);
    EXPECT_EQ(inv.timeout.count(), 1000);
}

TEST_F(GradleProjectTest, RunsTaskWithProgress) {
    wrapper("echo \"> Task $1\"\n"
            "echo '<===------> 30% EXECUTING [1s]'\n"
            "echo '<======---> 60% EXECUTING [2s]'\n"
            "echo 'BUILD SUCCESSFUL in 2s'");
    TaskExecutionEngine engine(runner);
    std::mutex m;
    std::vector<double> fractions;
    engine.subscribe([&](const TaskEvent& e){
        if (auto *p = std::get_if<ProgressEvent>(&e)) {
            std::lock_guard<std::mutex> lk(m);
            fractions.push_back(p->fraction);
        }
    });
    GradleExecutionService svc(engine, dir);
    BuildTaskRequest req;
    req.task_path = "build";
    auto handle = svc.run_task(req);
    EXPECT_FALSE(handle.debug_port.has_value());
    auto res = handle.result.get();
    EXPECT_EQ(res.state, TaskState::Completed);
    ASSERT_FALSE(res.output.empty());
    EXPECT_EQ(res.output[0], "> Task build");

    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(fractions.size(), 4u);
    EXPECT_DOUBLE_EQ(fractions[1], 0.3);
    EXPECT_DOUBLE_EQ(fractions[2], 0.6);
    EXPECT_DOUBLE_EQ(fractions[3], 1.0);
}

TEST_F(GradleProjectTest, DebugRunAnnouncesPort) {
    wrapper("for a in \"$@\"; do echo \"$a\"; done");
    TaskExecutionEngine engine(runner);
    std::mutex m;
    std::vector<StatusEvent> notes;
    engine.subscribe([&](const TaskEvent& e){
        if (auto *s = std::get_if<StatusEvent>(&e)) {
            std::lock_guard<std::mutex> lk(m);
            if (s->message_key == message_keys::kDebugStarted) notes.push_back(*s);
        }
    });
    GradleExecutionService svc(engine, dir);
    BuildTaskRequest req;
    req.task_path = "run";
    req.debug = true;
    auto handle = svc.run_task(req);
    ASSERT_TRUE(handle.debug_port.has_value());
    auto res = handle.result.get();
    EXPECT_EQ(res.state, TaskState::Completed);
    EXPECT_NE(std::find(res.output.begin(), res.output.end(),
                        "-Dorg.gradle.debug.port=" + std::to_string(*handle.debug_port)), res.output.end());
    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].args.back(), std::to_string(*handle.debug_port));
}

TEST_F(GradleProjectTest, FailedBuildReportsExitCode) {
    wrapper("echo 'BUILD FAILED in 1s'; exit 1");
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir);
    BuildTaskRequest req;
    req.task_path = "test";
    auto res = svc.run_task(req).result.get();
    EXPECT_EQ(res.state, TaskState::Failed);
    EXPECT_EQ(res.exit_code, 1);
}

TEST_F(GradleProjectTest, StopAllRunningTasks) {
    wrapper("sleep 10");
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir);
    BuildTaskRequest req;
    req.task_path = "run";
    auto a = svc.run_task(req);
    auto b = svc.run_task(req);
    EXPECT_EQ(svc.running_tasks().size(), 2u);
    auto stopped = svc.stop_all_running_tasks();
    EXPECT_EQ(stopped.size(), 2u);
    EXPECT_EQ(a.result.get().state, TaskState::Cancelled);
    EXPECT_EQ(b.result.get().state, TaskState::Cancelled);
    EXPECT_TRUE(svc.running_tasks().empty());
}

TEST_F(GradleProjectTest, RecentRequestsNewestFirstAndBounded) {
    wrapper("exit 0");
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir);
    for (int i = 0; i < 12; ++i) {
        BuildTaskRequest req;
        req.task_path = "task" + std::to_string(i);
        svc.run_task(req);
    }
    engine.wait_all();
    auto recent = svc.recent_requests();
    ASSERT_EQ(recent.size(), GradleExecutionService::kRecentLimit);
    EXPECT_EQ(recent.front().task_path, "task11");
    EXPECT_EQ(recent.back().task_path, "task2");
}

TEST_F(GradleProjectTest, FinishedTasksAreNotTracked) {
    wrapper("exit 0");
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir);
    BuildTaskRequest req;
    req.task_path = "build";
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(svc.run_task(req).result.get().state, TaskState::Completed);
        EXPECT_EQ(svc.tracked_count(), 1u);
    }
    EXPECT_TRUE(svc.running_tasks().empty());
}

TEST_F(GradleProjectTest, EmptyTaskPathIsRejected) {
    TaskExecutionEngine engine(runner);
    GradleExecutionService svc(engine, dir);
    EXPECT_THROW(svc.run_task(BuildTaskRequest{}), std::invalid_argument);
    EXPECT_TRUE(svc.recent_requests().empty());
}
