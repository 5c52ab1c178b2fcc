/**
 * @file menu_tree.cpp
 * @brief Arena-backed menu tree implementation
 */

#include "menu_tree.hpp"
#include <iterator>
#include <utility>

namespace tree_menu {

MenuTree::MenuTree(MenuEntry root)
{
    nodes_.push_back(Node{std::move(root), {}});
    parents_.push_back(ROOT_INDEX_);
}

size_t MenuTree::AppendToRoot(MenuEntry entry)
{
    const size_t index = nodes_.size();
    nodes_.push_back(Node{std::move(entry), {}});
    parents_.push_back(ROOT_INDEX_);
    nodes_[ROOT_INDEX_].children.push_back(index);
    return index;
}

size_t MenuTree::AbsorbSubtree(MenuTree&& subtree)
{
    if (&subtree == this || subtree.nodes_.empty()) {
        return ROOT_INDEX_;
    }

    // The subtree keeps its own pre-order; shift its indices past our last node
    const size_t offset = nodes_.size();
    for (Node& node : subtree.nodes_) {
        for (size_t& child : node.children) {
            child += offset;
        }
    }
    for (size_t i = 1; i < subtree.parents_.size(); ++i) {
        subtree.parents_[i] += offset;
    }
    subtree.parents_[ROOT_INDEX_] = ROOT_INDEX_;

    nodes_.reserve(nodes_.size() + subtree.nodes_.size());
    nodes_.insert(nodes_.end(),
                  std::make_move_iterator(subtree.nodes_.begin()),
                  std::make_move_iterator(subtree.nodes_.end()));
    parents_.insert(parents_.end(), subtree.parents_.begin(), subtree.parents_.end());
    nodes_[ROOT_INDEX_].children.push_back(offset);

    subtree.nodes_.clear();
    subtree.parents_.clear();
    return offset;
}

size_t MenuTree::Depth(size_t index) const noexcept
{
    size_t depth = 0;
    while (index != ROOT_INDEX_ && index < parents_.size()) {
        index = parents_[index];
        ++depth;
    }
    return depth;
}

} // namespace tree_menu
