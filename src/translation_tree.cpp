#include "translation_tree.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

#include <functional>
#include <utility>

namespace transtree {
namespace {

bool has_empty_segment(std::string_view path) {
    if (path.empty()) {
        return true;
    }
    std::size_t start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            return start == path.size();
        }
        if (dot == start) {
            return true;
        }
        start = dot + 1;
    }
}

}  // namespace

TreeNode* TreeNode::child(std::string_view name) const {
    const auto it = children_.find(to_lower_ascii(std::string(name)));
    return it == children_.end() ? nullptr : it->second.get();
}

TreeNode* TreeNode::make_child(std::string_view name) {
    auto& slot = children_[to_lower_ascii(std::string(name))];
    if (!slot) {
        slot = std::make_unique<TreeNode>(std::string(name));
    }
    return slot.get();
}

TreeNode* TreeNode::find_node(std::string_view path) {
    return const_cast<TreeNode*>(std::as_const(*this).find_node(path));
}

const TreeNode* TreeNode::find_node(std::string_view path) const {
    if (path.empty()) {
        return nullptr;
    }

    const auto dot = path.find('.');
    if (dot == 0) {
        return nullptr;
    }
    if (dot == std::string_view::npos) {
        return child(path);
    }

    const TreeNode* next = child(path.substr(0, dot));
    if (next == nullptr) {
        return nullptr;
    }
    return next->find_node(path.substr(dot + 1));
}

TreeNode* TreeNode::make_node(std::string_view path) {
    // validate up front so that a bad path leaves no half-built branch behind
    if (has_empty_segment(path)) {
        return nullptr;
    }

    TreeNode* node = this;
    std::size_t start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            return node->make_child(path.substr(start));
        }
        node = node->make_child(path.substr(start, dot - start));
        start = dot + 1;
    }
}

bool TreeNode::add_leaf(const std::string& key, bool templated) {
    auto [it, inserted] = leaves_.try_emplace(to_lower_ascii(key), TreeLeaf{key, templated});
    return inserted;
}

const TreeLeaf* TreeNode::find_leaf(std::string_view key) const {
    const auto it = leaves_.find(to_lower_ascii(std::string(key)));
    return it == leaves_.end() ? nullptr : &it->second;
}

void TranslationTree::add_entry(const std::string& qualified_key, bool templated) {
    if (has_empty_segment(qualified_key)) {
        throw ParserError("Key '" + qualified_key + "' could not be used to build a tree of translation entries");
    }

    TreeNode* node = root_.get();
    std::string leaf_key = qualified_key;

    const auto last_dot = qualified_key.rfind('.');
    if (last_dot != std::string::npos) {
        node = root_->make_node(std::string_view(qualified_key).substr(0, last_dot));
        leaf_key = qualified_key.substr(last_dot + 1);
    }

    if (!node->add_leaf(leaf_key, templated)) {
        throw DuplicateKeyError(qualified_key);
    }
}

std::size_t TranslationTree::leaf_count() const {
    std::function<std::size_t(const TreeNode&)> count = [&](const TreeNode& node) {
        std::size_t n = node.leaves().size();
        for (const auto& [_, child] : node.children()) {
            n += count(*child);
        }
        return n;
    };
    return count(*root_);
}

TranslationTree build_translation_tree(const Translation& translation) {
    TranslationTree tree;
    for (const auto& [key, entry] : translation.entries()) {
        tree.add_entry(key, entry.templated);
    }
    return tree;
}

}  // namespace transtree
