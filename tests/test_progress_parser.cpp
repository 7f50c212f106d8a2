#include <gtest/gtest.h>
#include <toolbridge/build/gradle_progress.hpp>
#include <toolbridge/vcs/progress_parser.hpp>

using namespace toolbridge;

TEST(GitProgress, PercentageLine) {
    GitProgressParser p;
    auto u = p.parse("Receiving objects:  45% (450/1000), 1.2 MiB | 3.0 MiB/s");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->kind, ProgressUpdate::Kind::Percentage);
    EXPECT_EQ(u->phase, "Receiving objects");
    EXPECT_EQ(u->percent.value_or(-1), 45);
    EXPECT_FALSE(u->fraction.has_value());
}

TEST(GitProgress, RemotePrefixIsStripped) {
    GitProgressParser p;
    auto u = p.parse("remote: Counting objects: 100% (12/12), done.");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->kind, ProgressUpdate::Kind::Percentage);
    EXPECT_EQ(u->phase, "Counting objects");
    EXPECT_EQ(u->percent.value_or(-1), 100);

    auto plain = p.parse("remote: Resolving deltas");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->kind, ProgressUpdate::Kind::Message);
    EXPECT_EQ(plain->text, "Resolving deltas");
}

TEST(GitProgress, PhaseWithoutPercentage) {
    GitProgressParser p;
    auto u = p.parse("Enumerating   objects: 5, done.");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->kind, ProgressUpdate::Kind::Phase);
    EXPECT_EQ(u->phase, "Enumerating objects");
}

TEST(GitProgress, RefUpdatesAndHeadersAreMessages) {
    GitProgressParser p;
    auto ref = p.parse(" + 1a2b3c...4d5e6f main -> origin/main  (forced update)");
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(ref->kind, ProgressUpdate::Kind::Message);
    EXPECT_EQ(ref->text.rfind("+ 1a2b3c", 0), 0u);

    auto from = p.parse("From github.com:example/repo");
    ASSERT_TRUE(from.has_value());
    EXPECT_EQ(from->kind, ProgressUpdate::Kind::Message);

    auto star = p.parse(" * [new branch]      feature -> origin/feature");
    ASSERT_TRUE(star.has_value());
    EXPECT_EQ(star->kind, ProgressUpdate::Kind::Message);
    EXPECT_EQ(star->text, "* [new branch]      feature -> origin/feature");

    EXPECT_FALSE(p.parse("   ").has_value());
}

TEST(GitProgress, NormalizePhase) {
    EXPECT_EQ(GitProgressParser::normalize_phase("  Writing \t objects "), "Writing objects");
    EXPECT_EQ(GitProgressParser::normalize_phase(""), "(unknown)");
}

TEST(GradleProgress, ProgressBar) {
    GradleProgressParser p;
    auto u = p.parse("\x1b[1m<=====--------> 42% EXECUTING [3s]\x1b[m");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->kind, ProgressUpdate::Kind::Percentage);
    EXPECT_EQ(u->phase, "EXECUTING");
    EXPECT_EQ(u->percent.value_or(-1), 42);
    ASSERT_TRUE(u->fraction.has_value());
    EXPECT_DOUBLE_EQ(*u->fraction, 0.42);
}

TEST(GradleProgress, TaskAndOutcomeLines) {
    GradleProgressParser p;
    auto task = p.parse("> Task :app:compileJava");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->kind, ProgressUpdate::Kind::Message);
    EXPECT_FALSE(task->fraction.has_value());

    auto ok = p.parse("BUILD SUCCESSFUL in 4s");
    ASSERT_TRUE(ok.has_value());
    EXPECT_DOUBLE_EQ(ok->fraction.value_or(0.0), 1.0);

    auto failed = p.parse("BUILD FAILED in 2s");
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->fraction.has_value());

    EXPECT_FALSE(p.parse("Compiling with JDK 17").has_value());
}

TEST(GradleProgress, StripAnsi) {
    EXPECT_EQ(GradleProgressParser::strip_ansi("\x1b[0K\x1b[31mred\x1b[0m"), "red");
}
