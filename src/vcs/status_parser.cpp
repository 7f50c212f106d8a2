/*
 * Porcelain status parser - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/status_parser.hpp>
#include <toolbridge/util/log.hpp>
#include <charconv>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace toolbridge {

namespace {

const std::string kArrow = " -> ";

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// An unparsable or overflowing count reads as 0.
int parse_count(const std::string& digits) {
    int v = 0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (res.ec != std::errc() || res.ptr != digits.data() + digits.size()) {
        log::debug("git", "ignored branch count '" + digits + "'");
        return 0;
    }
    return v;
}

bool expects_second_path(char x, char y) {
    return x == 'R' || x == 'C' || y == 'R' || y == 'C';
}

} // namespace

bool is_status_code(char c) {
    switch (c) {
        case ' ': case 'M': case 'A': case 'D': case 'R': case 'C': case 'U': case '?': case 'T': case '!':
            return true;
        default:
            return false;
    }
}

std::string StatusParser::unquote_path(const std::string& path) {
    if (path.size() < 2 || path.front() != '"' || path.back() != '"') return path;
    std::string out;
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        char c = path[i];
        if (c != '\\' || i + 2 >= path.size()) { out.push_back(c); continue; }
        char n = path[++i];
        switch (n) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case 'a': out.push_back('\a'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'v': out.push_back('\v'); break;
            default:
                if (n >= '0' && n <= '7') {
                    // Octal byte, used for non-ASCII UTF-8 sequences.
                    int v = n - '0';
                    for (int k = 0; k < 2 && i + 2 < path.size() && path[i + 1] >= '0' && path[i + 1] <= '7'; ++k)
                        v = v * 8 + (path[++i] - '0');
                    out.push_back(static_cast<char>(v));
                } else {
                    out.push_back(n);
                }
        }
    }
    return out;
}

fs::path StatusParser::resolve(const std::string& rel) const {
    fs::path p(rel);
    if (!m_root.empty()) p = m_root / p;
    return p.lexically_normal();
}

std::optional<FileChange> StatusParser::parse_entry(const std::string& entry, const std::string* second) const {
    if (entry.size() < 4 || entry[2] != ' ') return std::nullopt;
    char x = entry[0], y = entry[1];
    if (!is_status_code(x) || !is_status_code(y)) return std::nullopt;
    std::string first = trim(entry.substr(3));
    if (first.empty()) return std::nullopt;

    FileChange fc;
    fc.index_status = x;
    fc.worktree_status = y;
    if (second) {
        std::string prior = trim(*second);
        if (prior.empty()) return std::nullopt;
        fc.path = resolve(first);
        fc.old_path = resolve(prior);
    } else {
        fc.path = resolve(first);
    }
    return fc;
}

std::optional<FileChange> StatusParser::parse(const std::string& line) const {
    std::string l = line;
    while (!l.empty() && (l.back() == '\r' || l.back() == '\n')) l.pop_back();
    if (l.size() < 4) return std::nullopt;
    std::string rest = l.substr(3);
    size_t arrow = rest.find(kArrow);
    if (arrow == std::string::npos) {
        return parse_entry(l.substr(0, 3) + unquote_path(trim(rest)), nullptr);
    }
    std::string first = unquote_path(trim(rest.substr(0, arrow)));
    std::string second = unquote_path(trim(rest.substr(arrow + kArrow.size())));
    return parse_entry(l.substr(0, 3) + first, &second);
}

StatusParseResult StatusParser::parse_all(const std::string& output) const {
    StatusParseResult res;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line.rfind("## ", 0) == 0) continue;
        if (auto fc = parse(line)) {
            res.changes.push_back(std::move(*fc));
        } else {
            ++res.skipped;
            log::debug("status", "skipped malformed line: " + line);
        }
    }
    return res;
}

RepositoryStatus StatusParser::parse_records(const std::vector<std::string>& records, std::size_t* skipped) const {
    RepositoryStatus status;
    if (skipped) *skipped = 0;
    if (records.empty()) return status;

    size_t index = 0;
    if (records.front().rfind("##", 0) == 0) {
        auto bi = parse_branch_header(records.front());
        status.branch = bi.branch;
        status.ahead = bi.ahead;
        status.behind = bi.behind;
        index = 1;
    }
    for (; index < records.size(); ++index) {
        const std::string& rec = records[index];
        if (rec.empty()) continue;
        bool paired = rec.size() >= 2 && expects_second_path(rec[0], rec[1]) && index + 1 < records.size();
        auto fc = parse_entry(rec, paired ? &records[index + 1] : nullptr);
        if (!fc) {
            if (skipped) ++*skipped;
            log::debug("status", "skipped malformed record: " + rec);
            continue;
        }
        if (fc->old_path) ++index; // consumed the prior path record
        status.changes.push_back(std::move(*fc));
    }
    return status;
}

BranchInfo StatusParser::parse_branch_header(const std::string& raw) {
    static const std::regex ahead_re(R"(ahead\s+(\d+))");
    static const std::regex behind_re(R"(behind\s+(\d+))");
    BranchInfo bi;
    std::string header = trim(raw);
    if (header.rfind("##", 0) == 0) header = trim(header.substr(2));

    size_t lb = header.find('['), rb = header.rfind(']');
    if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
        std::string bracket = header.substr(lb, rb - lb + 1);
        std::smatch m;
        if (std::regex_search(bracket, m, ahead_re)) bi.ahead = parse_count(m[1].str());
        if (std::regex_search(bracket, m, behind_re)) bi.behind = parse_count(m[1].str());
    }

    static const std::string no_commits = "No commits yet on ";
    static const std::string initial = "Initial commit on ";
    if (header.rfind(no_commits, 0) == 0) {
        bi.branch = trim(header.substr(no_commits.size()));
    } else if (header.rfind(initial, 0) == 0) {
        bi.branch = trim(header.substr(initial.size()));
    } else if (header.rfind("HEAD", 0) == 0) {
        bi.branch = "(detached)";
    } else {
        size_t dots = header.find("...");
        std::string head = dots != std::string::npos ? header.substr(0, dots) : header;
        size_t cut = head.find(' ');
        if (cut != std::string::npos) head = head.substr(0, cut);
        head = trim(head);
        bi.branch = head.empty() ? "(unknown)" : head;
    }
    return bi;
}

} // namespace toolbridge
