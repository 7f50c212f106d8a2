#include <gtest/gtest.h>
#include <toolbridge/build/gradle_model.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

using namespace toolbridge;
namespace fs = std::filesystem;

static const std::vector<std::string> kListing{
    "",
    "> Task :tasks",
    "",
    "------------------------------------------------------------",
    "Tasks runnable from root project 'demo'",
    "------------------------------------------------------------",
    "",
    "Application tasks",
    "-----------------",
    "run - Runs this project as a JVM application",
    "",
    "Build tasks",
    "-----------",
    "assemble - Assembles the outputs of this project.",
    "app:compileJava - Compiles main Java source.",
    "",
    "Other tasks",
    "-----------",
    "prepareKotlinBuildScriptModel",
    "",
    "Rules",
    "-----",
    "Pattern: clean<TaskName>: Cleans the output files of a task.",
    "",
    "To see all tasks and more detail, run gradle tasks --all",
    "",
    "BUILD SUCCESSFUL in 1s",
    "1 actionable task: 1 executed",
};

TEST(GradleTaskListing, ParsesGroupsAndTasks) {
    auto model = parse_task_listing(kListing);
    EXPECT_EQ(model.root_project, "demo");
    ASSERT_EQ(model.tasks.size(), 4u);

    EXPECT_EQ(model.tasks[0].path, ":run");
    EXPECT_EQ(model.tasks[0].group, "Application");
    EXPECT_EQ(model.tasks[0].description, "Runs this project as a JVM application");

    const auto *compile = model.find(":app:compileJava");
    ASSERT_NE(compile, nullptr);
    EXPECT_EQ(compile->name, "compileJava");
    EXPECT_EQ(compile->group, "Build");

    const auto *other = model.find(":prepareKotlinBuildScriptModel");
    ASSERT_NE(other, nullptr);
    EXPECT_TRUE(other->group.empty());
    EXPECT_TRUE(other->description.empty());

    EXPECT_EQ(model.groups(), (std::vector<std::string>{"Application", "Build", ""}));
    EXPECT_EQ(model.find(":missing"), nullptr);
}

TEST(GradleTaskListing, EmptyOutput) {
    auto model = parse_task_listing({});
    EXPECT_TRUE(model.tasks.empty());
    EXPECT_TRUE(model.root_project.empty());
}

class GradleModelServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("toolbridge-model-" + std::to_string(getpid()) + "-" +
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

TEST_F(GradleModelServiceTest, LoadsAndCachesModel) {
    std::string script = "[ \"$1 $2 $3\" = \"tasks --all --console=plain\" ] || exit 3\n";
    for (auto l : kListing) {
        for (size_t q = l.find('\''); q != std::string::npos; q = l.find('\'', q + 4)) l.replace(q, 1, "'\\''");
        script += "echo '" + l + "'\n";
    }
    wrapper(script);

    TaskExecutionEngine engine(runner);
    GradleExecutionService executor(engine, dir);
    GradleModelService models(runner, executor);
    EXPECT_EQ(models.cached_model(), nullptr);

    std::vector<ReloadPhase> phases;
    models.subscribe([&](const ReloadEvent<GradleBuildModel>& e){ phases.push_back(e.phase); });

    auto model = models.refresh_model().get();
    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->tasks.size(), 4u);
    EXPECT_EQ(models.cached_model(), model);
    EXPECT_EQ(models.refresh_model().get(), model);
    EXPECT_EQ(phases, (std::vector<ReloadPhase>{ReloadPhase::Started, ReloadPhase::Succeeded}));
}

TEST_F(GradleModelServiceTest, FailureIsReportedAndCacheKept) {
    wrapper("echo 'FAILURE: Build failed' 1>&2; exit 1");
    TaskExecutionEngine engine(runner);
    GradleExecutionService executor(engine, dir);
    GradleModelService models(runner, executor);
    try {
        models.refresh_model().get();
        FAIL() << "expected GradleError";
    } catch (const GradleError& e) {
        EXPECT_NE(std::string(e.what()).find("FAILURE: Build failed"), std::string::npos);
    }
    EXPECT_EQ(models.cached_model(), nullptr);
}
