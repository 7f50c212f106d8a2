/*
 * Change tree grouping - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/vcs/file_change.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolbridge {

// A change whose path is not inside the repository root.
class ChangeTreeError : public std::runtime_error {
public:
    ChangeTreeError(const std::string& msg, std::filesystem::path offending)
        : std::runtime_error(msg), m_path(std::move(offending)) {}
    const std::filesystem::path& path() const { return m_path; }
private:
    std::filesystem::path m_path;
};

struct ChangeNode {
    enum class Kind { Root, ChangesRoot, Directory, File };

    Kind kind = Kind::Root;
    std::string label;                    // directory: "a/b/c" once collapsed; file: file name
    std::filesystem::path relative_path;  // relative to the repository root
    std::filesystem::path absolute_path;
    std::vector<FileChange> changes;      // directory: every change beneath it; file: exactly one
    std::vector<std::shared_ptr<ChangeNode>> children;

    bool is_directory() const { return kind == Kind::Directory; }
    bool is_file() const { return kind == Kind::File; }
    // Number of file leaves in this subtree.
    std::size_t file_count() const;
};

struct ChangeTreeUpdate {
    bool has_changes = false; // false: nothing to show, root is null
    bool rebuilt = false;     // false: same input as the previous call, root is the previous tree
    std::shared_ptr<const ChangeNode> root;
};

// Groups a flat change list into root -> changes root -> directories -> files.
// At every level directories come first (sorted by relative path), then
// files in input order. Chains of single-child directories are collapsed.
class ChangeTreeBuilder {
public:
    // Throws ChangeTreeError when a change lies outside repository_root.
    ChangeTreeUpdate build(const std::filesystem::path& repository_root, const std::vector<FileChange>& changes);

    std::shared_ptr<const ChangeNode> current() const { return m_last_tree; }

    // Stateless construction; changes must not be empty.
    static std::shared_ptr<ChangeNode> make_tree(const std::filesystem::path& repository_root, const std::vector<FileChange>& changes);
    // Merges a directory with its only child while that child is a directory, bottom-up.
    static void collapse_single_child_directories(ChangeNode& node);
private:
    bool m_has_last = false;
    std::filesystem::path m_last_root;
    std::vector<FileChange> m_last_changes;
    std::shared_ptr<const ChangeNode> m_last_tree;
};

} // namespace toolbridge
