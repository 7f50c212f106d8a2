/*
 * Change tree grouping - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <toolbridge/vcs/change_tree.hpp>
#include <toolbridge/util/log.hpp>
#include <algorithm>
#include <map>

namespace fs = std::filesystem;

namespace toolbridge {

namespace {

fs::path relativize(const fs::path& root, const fs::path& p) {
    fs::path rel = p.lexically_normal().lexically_relative(root);
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        throw ChangeTreeError("change outside repository root " + root.string() + ": " + p.string(), p);
    }
    return rel;
}

void order_children(ChangeNode& node) {
    std::stable_sort(node.children.begin(), node.children.end(),
        [](const std::shared_ptr<ChangeNode>& a, const std::shared_ptr<ChangeNode>& b) {
            if (a->is_directory() != b->is_directory()) return a->is_directory();
            if (a->is_directory()) return a->relative_path.generic_string() < b->relative_path.generic_string();
            return false; // files keep input order
        });
    for (auto &c : node.children) order_children(*c);
}

} // namespace

std::size_t ChangeNode::file_count() const {
    if (kind == Kind::File) return 1;
    std::size_t n = 0;
    for (auto &c : children) n += c->file_count();
    return n;
}

void ChangeTreeBuilder::collapse_single_child_directories(ChangeNode& node) {
    for (auto &c : node.children) collapse_single_child_directories(*c);
    while (node.is_directory() && node.children.size() == 1 && node.children.front()->is_directory()) {
        std::shared_ptr<ChangeNode> only = node.children.front();
        node.label += "/" + only->label;
        node.relative_path = only->relative_path;
        node.absolute_path = only->absolute_path;
        node.changes = only->changes;
        node.children = only->children;
    }
}

std::shared_ptr<ChangeNode> ChangeTreeBuilder::make_tree(const fs::path& repository_root, const std::vector<FileChange>& changes) {
    const fs::path root = repository_root.lexically_normal();
    auto tree = std::make_shared<ChangeNode>();
    tree->kind = ChangeNode::Kind::Root;
    tree->absolute_path = root;
    auto changes_root = std::make_shared<ChangeNode>();
    changes_root->kind = ChangeNode::Kind::ChangesRoot;
    changes_root->label = "Changes";
    changes_root->absolute_path = root;
    changes_root->changes = changes;
    tree->children.push_back(changes_root);

    std::map<std::string, std::shared_ptr<ChangeNode>> directories;
    for (auto &change : changes) {
        fs::path rel = relativize(root, change.path);
        ChangeNode* parent = changes_root.get();
        fs::path current;
        for (auto &part : rel.parent_path()) {
            current /= part;
            auto &dir = directories[current.generic_string()];
            if (!dir) {
                dir = std::make_shared<ChangeNode>();
                dir->kind = ChangeNode::Kind::Directory;
                dir->label = part.string();
                dir->relative_path = current;
                dir->absolute_path = (root / current).lexically_normal();
                parent->children.push_back(dir);
            }
            dir->changes.push_back(change);
            parent = dir.get();
        }
        auto leaf = std::make_shared<ChangeNode>();
        leaf->kind = ChangeNode::Kind::File;
        leaf->label = rel.filename().string();
        leaf->relative_path = rel;
        leaf->absolute_path = change.path.lexically_normal();
        leaf->changes.push_back(change);
        parent->children.push_back(std::move(leaf));
    }

    order_children(*changes_root);
    collapse_single_child_directories(*changes_root);
    return tree;
}

ChangeTreeUpdate ChangeTreeBuilder::build(const fs::path& repository_root, const std::vector<FileChange>& changes) {
    ChangeTreeUpdate upd;
    if (m_has_last && m_last_root == repository_root && m_last_changes == changes) {
        upd.has_changes = !changes.empty();
        upd.rebuilt = false;
        upd.root = m_last_tree;
        return upd;
    }
    std::shared_ptr<const ChangeNode> tree;
    if (!changes.empty()) tree = make_tree(repository_root, changes);
    m_has_last = true;
    m_last_root = repository_root;
    m_last_changes = changes;
    m_last_tree = tree;
    upd.has_changes = !changes.empty();
    upd.rebuilt = true;
    upd.root = tree;
    log::debug("tree", "rebuilt change tree with " + std::to_string(changes.size()) + " changes");
    return upd;
}

} // namespace toolbridge
