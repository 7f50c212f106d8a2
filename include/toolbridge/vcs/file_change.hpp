/*
 * File change and repository status model - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// ' ', 'M', 'A', 'D', 'R', 'C', 'U', '?' plus git's 'T' (type change) and '!' (ignored).
bool is_status_code(char c);

struct FileChange {
    std::filesystem::path path;
    std::optional<std::filesystem::path> old_path; // renames and copies only
    char index_status = ' ';
    char worktree_status = ' ';

    bool is_untracked() const { return index_status == '?' && worktree_status == '?'; }
    bool is_conflict() const { return index_status == 'U' || worktree_status == 'U'; }
    bool is_modified() const { return index_status == 'M' || worktree_status == 'M'; }
    bool is_added() const { return index_status == 'A' || worktree_status == 'A'; }
    bool is_deleted() const { return index_status == 'D' || worktree_status == 'D'; }
    bool is_renamed() const { return index_status == 'R' || worktree_status == 'R'; }
    bool is_copied() const { return index_status == 'C' || worktree_status == 'C'; }
    bool is_unchanged() const { return index_status == ' ' && worktree_status == ' '; }
    bool is_staged() const { return index_status != ' ' && !is_untracked(); }
    bool is_unstaged() const { return worktree_status != ' ' && !is_untracked(); }

    // The two-character porcelain code, e.g. "M ", "??".
    std::string status_code() const { return std::string{index_status, worktree_status}; }

    bool operator==(const FileChange& o) const {
        return path == o.path && old_path == o.old_path && index_status == o.index_status && worktree_status == o.worktree_status;
    }
    bool operator!=(const FileChange& o) const { return !(*this == o); }
};

struct RepositoryStatus {
    std::string branch = "(unknown)";
    int ahead = 0;
    int behind = 0;
    std::vector<FileChange> changes;

    bool is_clean() const { return changes.empty(); }
    bool operator==(const RepositoryStatus& o) const {
        return branch == o.branch && ahead == o.ahead && behind == o.behind && changes == o.changes;
    }
    bool operator!=(const RepositoryStatus& o) const { return !(*this == o); }
};

} // namespace toolbridge
