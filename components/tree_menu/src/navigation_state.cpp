/**
 * @file navigation_state.cpp
 * @brief Cursor state machine implementation
 */

#include "navigation_state.hpp"
#include "esp_log.h"

namespace tree_menu {

static const char* TAG_NAV_ = "NavigationState";

NavigationState::NavigationState() noexcept
    : highlighted_item_(0)
    , item_count_(0)
{
}

void NavigationState::MoveDown() noexcept
{
    highlighted_item_++;
    if (highlighted_item_ > item_count_) {
        highlighted_item_ = 0;
    }
}

void NavigationState::MoveUp() noexcept
{
    if (item_count_ == 0) {
        ESP_LOGD(TAG_NAV_, "MoveUp ignored, menu is empty");
        highlighted_item_ = 0;
        return;
    }

    if (highlighted_item_ == 0) {
        highlighted_item_ = item_count_ - 1;
    } else {
        highlighted_item_--;
    }
}

void NavigationState::UpdateItemCount(size_t item_count) noexcept
{
    item_count_ = item_count;
    if (item_count_ > 0 && highlighted_item_ >= item_count_) {
        ESP_LOGW(TAG_NAV_, "Cursor %u out of range after count update (%u items)",
                 static_cast<unsigned>(highlighted_item_), static_cast<unsigned>(item_count_));
    }
}

} // namespace tree_menu
