/**
 * @file test_menu_tree.cpp
 * @brief Arena tree structure tests
 */

#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "menu_tree.hpp"

using tree_menu::CheckboxItem;
using tree_menu::GetEntryBase;
using tree_menu::MenuTree;
using tree_menu::SectionItem;
using tree_menu::SubmenuItem;

namespace {

std::vector<std::string> PreOrderLabels(const MenuTree& tree)
{
    std::vector<std::string> labels;
    for (size_t i = 0; i < tree.Count(); ++i) {
        labels.push_back(GetEntryBase(tree.GetNode(i).entry).GetLabel());
    }
    return labels;
}

} // namespace

TEST(MenuTreeTest, NewTreeHoldsOnlyRoot)
{
    MenuTree tree(SubmenuItem("Root"));
    EXPECT_EQ(tree.Count(), 1u);
    EXPECT_STREQ(GetEntryBase(tree.GetRoot().entry).GetLabel(), "Root");
    EXPECT_TRUE(tree.GetRoot().children.empty());
    EXPECT_EQ(tree.Depth(MenuTree::ROOT_INDEX_), 0u);
}

TEST(MenuTreeTest, AppendKeepsInsertionOrder)
{
    MenuTree tree(SubmenuItem("Root"));
    EXPECT_EQ(tree.AppendToRoot(CheckboxItem("A")), 1u);
    EXPECT_EQ(tree.AppendToRoot(SectionItem("B")), 2u);
    EXPECT_EQ(tree.AppendToRoot(SectionItem("C")), 3u);

    EXPECT_EQ(tree.GetRoot().children, (std::vector<size_t>{1, 2, 3}));
    EXPECT_EQ(PreOrderLabels(tree), (std::vector<std::string>{"Root", "A", "B", "C"}));
    EXPECT_EQ(tree.Depth(2), 1u);
}

TEST(MenuTreeTest, AbsorbedSubtreeStaysNested)
{
    MenuTree tree(SubmenuItem("Root"));
    tree.AppendToRoot(CheckboxItem("A"));

    MenuTree nested(SubmenuItem("Sub"));
    nested.AppendToRoot(SectionItem("S1"));
    nested.AppendToRoot(SectionItem("S2"));

    EXPECT_EQ(tree.AbsorbSubtree(std::move(nested)), 2u);
    tree.AppendToRoot(SectionItem("C"));

    EXPECT_EQ(tree.Count(), 6u);
    EXPECT_EQ(PreOrderLabels(tree),
              (std::vector<std::string>{"Root", "A", "Sub", "S1", "S2", "C"}));
    EXPECT_EQ(tree.GetRoot().children, (std::vector<size_t>{1, 2, 5}));
    EXPECT_EQ(tree.GetNode(2).children, (std::vector<size_t>{3, 4}));
    EXPECT_EQ(tree.Depth(3), 2u);
    EXPECT_EQ(tree.Depth(5), 1u);

    EXPECT_EQ(nested.Count(), 0u);
}

TEST(MenuTreeTest, AbsorbsSubtreesOfSubtrees)
{
    MenuTree inner(SubmenuItem("Inner"));
    inner.AppendToRoot(SectionItem("I1"));

    MenuTree middle(SubmenuItem("Middle"));
    middle.AppendToRoot(SectionItem("M1"));
    middle.AbsorbSubtree(std::move(inner));

    MenuTree tree(SubmenuItem("Root"));
    tree.AppendToRoot(SectionItem("A"));
    tree.AbsorbSubtree(std::move(middle));

    EXPECT_EQ(PreOrderLabels(tree),
              (std::vector<std::string>{"Root", "A", "Middle", "M1", "Inner", "I1"}));
    EXPECT_EQ(tree.GetNode(2).children, (std::vector<size_t>{3, 4}));
    EXPECT_EQ(tree.GetNode(4).children, (std::vector<size_t>{5}));
    EXPECT_EQ(tree.Depth(5), 3u);
}

TEST(MenuTreeTest, AbsorbingEmptiedTreeChangesNothing)
{
    MenuTree tree(SubmenuItem("Root"));
    MenuTree nested(SubmenuItem("Sub"));
    tree.AbsorbSubtree(std::move(nested));
    ASSERT_EQ(tree.Count(), 2u);

    EXPECT_EQ(tree.AbsorbSubtree(std::move(nested)), MenuTree::ROOT_INDEX_);
    EXPECT_EQ(tree.Count(), 2u);
    EXPECT_EQ(tree.GetRoot().children.size(), 1u);
}

TEST(MenuTreeTest, AbsorbingItselfChangesNothing)
{
    MenuTree tree(SubmenuItem("Root"));
    tree.AppendToRoot(SectionItem("A"));

    EXPECT_EQ(tree.AbsorbSubtree(std::move(tree)), MenuTree::ROOT_INDEX_);
    EXPECT_EQ(PreOrderLabels(tree), (std::vector<std::string>{"Root", "A"}));
    EXPECT_EQ(tree.GetRoot().children, (std::vector<size_t>{1}));
}
