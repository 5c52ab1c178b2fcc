/**
 * @file menu_tree.hpp
 * @brief Ordered n-ary tree of menu entries
 *
 * Nodes live in one arena (std::vector) and refer to their children by
 * index. Node 0 is the root. Nodes are only ever appended as the last child
 * of the root, or as a whole absorbed subtree, so arena order is always the
 * pre-order traversal order and walking the tree is a plain index scan.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "menu_items.hpp"

namespace tree_menu {

class MenuTree {
public:
    struct Node {
        MenuEntry entry;
        std::vector<size_t> children;   // arena indices, insertion order
    };

    static constexpr size_t ROOT_INDEX_ = 0;

    explicit MenuTree(MenuEntry root);

    MenuTree(MenuTree&&) noexcept = default;
    MenuTree& operator=(MenuTree&&) noexcept = default;
    MenuTree(const MenuTree&) = delete;
    MenuTree& operator=(const MenuTree&) = delete;

    // Public functions: PascalCase

    /**
     * @brief Append @p entry as the new last child of the root
     * @return Arena index of the new node
     */
    size_t AppendToRoot(MenuEntry entry);

    /**
     * @brief Take over every node of @p subtree as the new last child of the root
     *
     * Nodes are moved, not copied. @p subtree is left empty. Absorbing
     * the tree into itself, or an empty tree, changes nothing.
     * @return Arena index of the absorbed subtree's root
     */
    size_t AbsorbSubtree(MenuTree&& subtree);

    /**
     * @brief Number of nodes in a pre-order traversal, root included
     */
    size_t Count() const noexcept { return nodes_.size(); }

    const Node& GetRoot() const noexcept { return nodes_[ROOT_INDEX_]; }

    // Nodes in pre-order; index 0 is the root
    const Node& GetNode(size_t index) const noexcept { return nodes_[index]; }
    Node& GetNode(size_t index) noexcept { return nodes_[index]; }

    /**
     * @brief Nesting depth of the node at @p index (root = 0)
     */
    size_t Depth(size_t index) const noexcept;

private:
    // Member variables: snake_case + trailing underscore
    std::vector<Node> nodes_;
    std::vector<size_t> parents_;   // parents_[0] is unused
};

} // namespace tree_menu
