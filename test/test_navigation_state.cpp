/**
 * @file test_navigation_state.cpp
 * @brief Cursor state machine tests
 */

#include <gtest/gtest.h>
#include "navigation_state.hpp"

using tree_menu::NavigationState;

namespace {

NavigationState WithCount(size_t count)
{
    NavigationState state;
    state.UpdateItemCount(count);
    return state;
}

void MoveTo(NavigationState& state, size_t cursor)
{
    while (state.GetHighlightedItem() != cursor) {
        state.MoveDown();
    }
}

} // namespace

TEST(NavigationStateTest, StartsAtZeroWithNoItems)
{
    NavigationState state;
    EXPECT_EQ(state.GetHighlightedItem(), 0u);
    EXPECT_EQ(state.GetItemCount(), 0u);
}

TEST(NavigationStateTest, MoveDownVisitsItemCountBeforeWrapping)
{
    NavigationState state = WithCount(3);

    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 1u);
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 2u);

    // The wrap test is "cursor > item_count": the cursor rests on item_count once
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 3u);
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 0u);
}

TEST(NavigationStateTest, MoveDownCycleHasItemCountPlusOneStates)
{
    NavigationState state = WithCount(5);
    for (size_t lap = 0; lap < 3; ++lap) {
        for (size_t expected = 1; expected <= 5; ++expected) {
            state.MoveDown();
            EXPECT_EQ(state.GetHighlightedItem(), expected);
        }
        state.MoveDown();
        EXPECT_EQ(state.GetHighlightedItem(), 0u);
    }
}

TEST(NavigationStateTest, MoveUpWrapsFromZeroToLastIndex)
{
    NavigationState state = WithCount(4);
    state.MoveUp();
    EXPECT_EQ(state.GetHighlightedItem(), 3u);
    state.MoveUp();
    EXPECT_EQ(state.GetHighlightedItem(), 2u);
}

TEST(NavigationStateTest, MoveUpWithNoItemsStaysAtZero)
{
    NavigationState state;
    state.MoveUp();
    EXPECT_EQ(state.GetHighlightedItem(), 0u);
}

TEST(NavigationStateTest, MoveDownWithNoItemsStaysAtZero)
{
    NavigationState state;
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 0u);
}

TEST(NavigationStateTest, DownThenUpRestoresCursor)
{
    const size_t count = 6;
    for (size_t start = 0; start < count; ++start) {
        NavigationState state = WithCount(count);
        MoveTo(state, start);
        state.MoveDown();
        state.MoveUp();
        EXPECT_EQ(state.GetHighlightedItem(), start) << "start=" << start;
    }
}

TEST(NavigationStateTest, UpThenDownRestoresCursorAwayFromZero)
{
    const size_t count = 6;
    for (size_t start = 1; start < count; ++start) {
        NavigationState state = WithCount(count);
        MoveTo(state, start);
        state.MoveUp();
        state.MoveDown();
        EXPECT_EQ(state.GetHighlightedItem(), start) << "start=" << start;
    }
}

TEST(NavigationStateTest, UpThenDownFromZeroLandsOnItemCount)
{
    // Up wraps to item_count - 1, down then stops on item_count instead of 0
    NavigationState state = WithCount(6);
    state.MoveUp();
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 6u);
}

TEST(NavigationStateTest, UpdateItemCountDoesNotClampCursor)
{
    NavigationState state = WithCount(5);
    MoveTo(state, 4);

    state.UpdateItemCount(2);
    EXPECT_EQ(state.GetItemCount(), 2u);
    EXPECT_EQ(state.GetHighlightedItem(), 4u);

    // The next MoveDown sees 5 > 2 and wraps
    state.MoveDown();
    EXPECT_EQ(state.GetHighlightedItem(), 0u);
}
