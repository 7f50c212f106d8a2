/*
 * Porcelain status parser - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/vcs/file_change.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

struct BranchInfo {
    std::string branch = "(unknown)";
    int ahead = 0;
    int behind = 0;
};

struct StatusParseResult {
    std::vector<FileChange> changes;
    std::size_t skipped = 0; // malformed lines that were ignored
};

// Parses `git status --porcelain=v1` output. Malformed lines are skipped,
// never fatal. Paths are resolved against the repository root when one is given.
class StatusParser {
public:
    StatusParser() = default;
    explicit StatusParser(std::filesystem::path repository_root) : m_root(std::move(repository_root)) {}

    // "XY path" or "XY path -> second"; the second path becomes the prior path.
    std::optional<FileChange> parse(const std::string& line) const;
    // Newline separated output; "## " branch headers and blank lines are ignored.
    StatusParseResult parse_all(const std::string& output) const;
    // `-z -b` records: branch header first, then "XY path" records, each
    // rename/copy followed by a record with its prior path.
    RepositoryStatus parse_records(const std::vector<std::string>& records, std::size_t* skipped = nullptr) const;

    // "## main...origin/main [ahead 1, behind 2]", "## HEAD (no branch)", "## No commits yet on main"
    static BranchInfo parse_branch_header(const std::string& header);
    // Undo git's C-style quoting of paths ("a\tb" -> a<TAB>b); unquoted input is returned as is.
    static std::string unquote_path(const std::string& path);
private:
    std::filesystem::path resolve(const std::string& rel) const;
    std::optional<FileChange> parse_entry(const std::string& entry, const std::string* second) const;

    std::filesystem::path m_root;
};

} // namespace toolbridge
