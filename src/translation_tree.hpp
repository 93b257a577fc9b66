#pragma once

#include "translation.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace transtree {

struct TreeLeaf {
    std::string key;
    bool templated = false;
};

// Children and leaves are looked up case-insensitively; stored names keep their casing.
class TreeNode {
public:
    explicit TreeNode(std::string name) : name_(std::move(name)) {}

    TreeNode(const TreeNode&) = delete;
    TreeNode& operator=(const TreeNode&) = delete;

    const std::string& name() const noexcept { return name_; }

    TreeNode* find_node(std::string_view path);
    const TreeNode* find_node(std::string_view path) const;
    TreeNode* make_node(std::string_view path);

    bool add_leaf(const std::string& key, bool templated);
    const TreeLeaf* find_leaf(std::string_view key) const;

    const std::map<std::string, std::unique_ptr<TreeNode>>& children() const noexcept { return children_; }
    const std::map<std::string, TreeLeaf>& leaves() const noexcept { return leaves_; }

private:
    TreeNode* child(std::string_view name) const;
    TreeNode* make_child(std::string_view name);

    std::string name_;
    std::map<std::string, std::unique_ptr<TreeNode>> children_;
    std::map<std::string, TreeLeaf> leaves_;
};

class TranslationTree {
public:
    TranslationTree() : root_(std::make_unique<TreeNode>(std::string())) {}

    TreeNode& root() noexcept { return *root_; }
    const TreeNode& root() const noexcept { return *root_; }

    TreeNode* find_node(std::string_view path) { return root_->find_node(path); }
    const TreeNode* find_node(std::string_view path) const { return root_->find_node(path); }
    TreeNode* make_node(std::string_view path) { return root_->make_node(path); }

    // Places a leaf for a dotted key under the node of its group path.
    // Throws DuplicateKeyError for an existing leaf and ParserError for an invalid path.
    void add_entry(const std::string& qualified_key, bool templated);

    std::size_t leaf_count() const;

private:
    std::unique_ptr<TreeNode> root_;
};

TranslationTree build_translation_tree(const Translation& translation);

}  // namespace transtree
