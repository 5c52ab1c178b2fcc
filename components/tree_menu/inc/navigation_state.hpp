/**
 * @file navigation_state.hpp
 * @brief Cursor state machine for menu navigation
 *
 * Holds the highlighted index and a cached item count. Independent of
 * rendering; the menu refreshes the count after every structural change.
 */

#pragma once

#include <cstddef>

namespace tree_menu {

class NavigationState {
public:
    NavigationState() noexcept;

    // Public functions: PascalCase

    /**
     * @brief Advance the cursor, wrapping to 0 once it passes item_count
     *
     * The wrap test is "cursor > item_count", so the cursor visits
     * item_count itself (one step past the last entry) before wrapping.
     */
    void MoveDown() noexcept;

    /**
     * @brief Step the cursor back, wrapping from 0 to item_count - 1
     *
     * With item_count == 0 the cursor stays at 0.
     */
    void MoveUp() noexcept;

    /**
     * @brief Replace the cached item count
     *
     * The cursor is not clamped. A count that shrinks below the cursor leaves
     * it out of range until the next MoveDown/MoveUp wraps it.
     */
    void UpdateItemCount(size_t item_count) noexcept;

    size_t GetHighlightedItem() const noexcept { return highlighted_item_; }
    size_t GetItemCount() const noexcept { return item_count_; }

private:
    // Member variables: snake_case + trailing underscore
    size_t highlighted_item_;
    size_t item_count_;
};

} // namespace tree_menu
