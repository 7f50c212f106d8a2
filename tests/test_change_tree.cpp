#include <gtest/gtest.h>
#include <toolbridge/vcs/change_tree.hpp>

using namespace toolbridge;
namespace fs = std::filesystem;

static FileChange change(const std::string& path, char x = ' ', char y = 'M') {
    FileChange fc;
    fc.path = fs::path("/repo") / path;
    fc.index_status = x;
    fc.worktree_status = y;
    return fc;
}

static const ChangeNode& changes_root(const ChangeTreeUpdate& u) {
    return *u.root->children.at(0);
}

TEST(ChangeTree, EmptyListHasNoTree) {
    ChangeTreeBuilder b;
    auto u = b.build("/repo", {});
    EXPECT_FALSE(u.has_changes);
    EXPECT_EQ(u.root, nullptr);
}

TEST(ChangeTree, RootAndChangesRoot) {
    ChangeTreeBuilder b;
    auto u = b.build("/repo", {change("x.txt")});
    ASSERT_TRUE(u.has_changes);
    EXPECT_EQ(u.root->kind, ChangeNode::Kind::Root);
    ASSERT_EQ(u.root->children.size(), 1u);
    const auto &cr = changes_root(u);
    EXPECT_EQ(cr.kind, ChangeNode::Kind::ChangesRoot);
    EXPECT_EQ(cr.label, "Changes");
    ASSERT_EQ(cr.children.size(), 1u);
    EXPECT_TRUE(cr.children[0]->is_file());
    EXPECT_EQ(cr.children[0]->label, "x.txt");
    EXPECT_EQ(cr.children[0]->relative_path, fs::path("x.txt"));
}

TEST(ChangeTree, CollapsesSingleChildDirectoryChains) {
    ChangeTreeBuilder b;
    auto u = b.build("/repo", {change("a/b/c/file.txt"), change("x/one.txt"), change("x/two.txt")});
    const auto &cr = changes_root(u);
    ASSERT_EQ(cr.children.size(), 2u);

    const auto &abc = *cr.children[0];
    EXPECT_TRUE(abc.is_directory());
    EXPECT_EQ(abc.label, "a/b/c");
    EXPECT_EQ(abc.relative_path, fs::path("a/b/c"));
    EXPECT_EQ(abc.absolute_path, fs::path("/repo/a/b/c"));
    ASSERT_EQ(abc.children.size(), 1u);
    EXPECT_EQ(abc.children[0]->label, "file.txt");

    const auto &x = *cr.children[1];
    EXPECT_EQ(x.label, "x");
    EXPECT_EQ(x.children.size(), 2u);
    EXPECT_EQ(x.changes.size(), 2u);
    EXPECT_EQ(x.file_count(), 2u);
    EXPECT_EQ(cr.file_count(), 3u);
}

TEST(ChangeTree, DirectoryWithFileAndSubdirIsNotCollapsed) {
    ChangeTreeBuilder b;
    auto u = b.build("/repo", {change("src/main.cpp"), change("src/util/log.cpp")});
    const auto &src = *changes_root(u).children.at(0);
    EXPECT_EQ(src.label, "src");
    ASSERT_EQ(src.children.size(), 2u);
    EXPECT_TRUE(src.children[0]->is_directory());
    EXPECT_EQ(src.children[0]->label, "util");
    EXPECT_TRUE(src.children[1]->is_file());
    EXPECT_EQ(src.children[1]->label, "main.cpp");
}

TEST(ChangeTree, DirectoriesFirstThenFilesInInputOrder) {
    ChangeTreeBuilder b;
    auto u = b.build("/repo", {change("zeta.txt"), change("b/x.txt"), change("alpha.txt"), change("a/y.txt")});
    const auto &cr = changes_root(u);
    ASSERT_EQ(cr.children.size(), 4u);
    EXPECT_EQ(cr.children[0]->label, "a");
    EXPECT_EQ(cr.children[1]->label, "b");
    EXPECT_EQ(cr.children[2]->label, "zeta.txt");
    EXPECT_EQ(cr.children[3]->label, "alpha.txt");
}

TEST(ChangeTree, SameInputKeepsPreviousTree) {
    ChangeTreeBuilder b;
    std::vector<FileChange> list{change("a.txt"), change("d/b.txt")};
    auto first = b.build("/repo", list);
    auto second = b.build("/repo", list);
    EXPECT_TRUE(first.rebuilt);
    EXPECT_FALSE(second.rebuilt);
    EXPECT_EQ(first.root, second.root);
    EXPECT_EQ(b.current(), first.root);

    list.push_back(change("c.txt", '?', '?'));
    auto third = b.build("/repo", list);
    EXPECT_TRUE(third.rebuilt);
    EXPECT_NE(third.root, first.root);
}

TEST(ChangeTree, PathOutsideRootThrows) {
    ChangeTreeBuilder b;
    FileChange outside;
    outside.path = "/elsewhere/file.txt";
    outside.worktree_status = 'M';
    try {
        b.build("/repo", {outside});
        FAIL() << "expected ChangeTreeError";
    } catch (const ChangeTreeError& e) {
        EXPECT_EQ(e.path(), fs::path("/elsewhere/file.txt"));
    }
    FileChange root_itself;
    root_itself.path = "/repo";
    EXPECT_THROW(b.build("/repo", {root_itself}), ChangeTreeError);
}
