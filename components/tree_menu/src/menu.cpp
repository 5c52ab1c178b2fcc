/**
 * @file menu.cpp
 * @brief Menu controller and layout/draw pipeline
 */

#include "menu.hpp"
#include "esp_log.h"
#include <utility>
#include <variant>

namespace tree_menu {

static const char* TAG_MENU_ = "Menu";

namespace {

void warnIfNullLabel(const char* label, MenuItemType type) noexcept
{
    if (label == nullptr) {
        ESP_LOGW(TAG_MENU_, "%s added with null label, drawing it empty", MenuItemTypeName(type));
    }
}

} // namespace

Menu::Menu(const char* title, const MenuStyle& style)
    : style_(style)
    , tree_(MenuEntry(SubmenuItem(title)))
    , state_()
{
    warnIfNullLabel(title, MenuItemType::Submenu);
}

void Menu::AddItem(MenuEntry entry)
{
    if (tree_.Count() == 0) {
        ESP_LOGE(TAG_MENU_, "AddItem on a menu that was moved into a parent");
        return;
    }
    tree_.AppendToRoot(std::move(entry));
    refreshItemCount();
}

void Menu::AddCheckbox(const char* label)
{
    warnIfNullLabel(label, MenuItemType::Checkbox);
    AddItem(CheckboxItem(label));
}

void Menu::AddSelector(const char* label, std::vector<const char*> options)
{
    warnIfNullLabel(label, MenuItemType::Selector);
    AddItem(SelectorItem(label, std::move(options)));
}

void Menu::AddSection(const char* label)
{
    warnIfNullLabel(label, MenuItemType::Section);
    AddItem(SectionItem(label));
}

void Menu::AddSubmenu(Menu&& submenu)
{
    if (&submenu == this) {
        ESP_LOGE(TAG_MENU_, "AddSubmenu: menu \"%s\" cannot contain itself", GetTitle());
        return;
    }
    if (tree_.Count() == 0 || submenu.tree_.Count() == 0) {
        ESP_LOGE(TAG_MENU_, "AddSubmenu with a menu that was already moved");
        return;
    }
    const size_t nested_count = submenu.tree_.Count();
    tree_.AbsorbSubtree(std::move(submenu.tree_));
    submenu.state_.UpdateItemCount(0);
    refreshItemCount();
    ESP_LOGD(TAG_MENU_, "Absorbed submenu with %u entries", static_cast<unsigned>(nested_count));
}

void Menu::NavigateDown() noexcept
{
    state_.MoveDown();
}

void Menu::NavigateUp() noexcept
{
    state_.MoveUp();
}

void Menu::SelectItem() noexcept
{
    ESP_LOGD(TAG_MENU_, "SelectItem on entry %u has no action",
             static_cast<unsigned>(state_.GetHighlightedItem()));
}

esp_err_t Menu::AdvanceSelection() noexcept
{
    const size_t index = highlightedNodeIndex();
    if (index >= tree_.Count()) {
        return ESP_ERR_NOT_FOUND;
    }

    SelectorItem* selector = std::get_if<SelectorItem>(&tree_.GetNode(index).entry);
    if (selector == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    selector->AdvanceSelection();
    return ESP_OK;
}

esp_err_t Menu::Draw(DrawTarget& target, const TextMetrics& metrics) const noexcept
{
    if (tree_.Count() == 0) {
        ESP_LOGE(TAG_MENU_, "Draw on a menu that was moved into a parent");
        return ESP_ERR_INVALID_STATE;
    }

    DrawRegion display(target);
    esp_err_t ret = display.Clear(style_.background_color);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG_MENU_, "Failed to clear display: %s", esp_err_to_name(ret));
        return ret;
    }

    // 1. Header
    ret = display.DrawText(GetTitle(), Point(), style_.heading_text_style, TextBaseline::Top);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG_MENU_, "Failed to draw header: %s", esp_err_to_name(ret));
        return ret;
    }
    const uint16_t header_height = metrics.LineHeight(style_.heading_text_style);

    // 2. Viewport below the header
    const Rect display_area = display.Bounds();
    const uint16_t viewport_height = display_area.height > header_height
                                         ? static_cast<uint16_t>(display_area.height - header_height)
                                         : 0;
    Rect remaining = display_area.ResizedHeight(viewport_height, AnchorY::Bottom);

    // 3. Whole rows, first row = highlighted entry
    for (size_t i = highlightedNodeIndex(); i < tree_.Count(); ++i) {
        const MenuEntry& entry = tree_.GetNode(i).entry;
        const uint16_t item_height = MeasureEntry(entry, metrics, style_).height;
        if (item_height > remaining.height) {
            break;
        }

        DrawRegion row = display.Cropped(remaining.ResizedHeight(item_height, AnchorY::Top));
        ret = DrawEntry(entry, row, metrics, style_);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG_MENU_, "Failed to draw entry %u \"%s\": %s", static_cast<unsigned>(i),
                     GetEntryBase(entry).GetLabel(), esp_err_to_name(ret));
            return ret;
        }

        remaining = remaining.ResizedHeight(static_cast<uint16_t>(remaining.height - item_height),
                                            AnchorY::Bottom);
    }

    return ESP_OK;
}

void Menu::LogTree() const noexcept
{
    ESP_LOGI(TAG_MENU_, "Menu \"%s\": %u items, cursor %u", GetTitle(),
             static_cast<unsigned>(GetItemCount()), static_cast<unsigned>(GetHighlightedItem()));
    for (size_t i = MenuTree::ROOT_INDEX_ + 1; i < tree_.Count(); ++i) {
        const MenuEntry& entry = tree_.GetNode(i).entry;
        const int indent = static_cast<int>(tree_.Depth(i) * 2);
        ESP_LOGI(TAG_MENU_, "%*s[\"%s\":%s]", indent, "", GetEntryBase(entry).GetLabel(),
                 MenuItemTypeName(GetEntryType(entry)));
    }
}

const char* Menu::GetTitle() const noexcept
{
    if (tree_.Count() == 0) {
        return "";
    }
    return GetEntryBase(tree_.GetRoot().entry).GetLabel();
}

void Menu::refreshItemCount() noexcept
{
    state_.UpdateItemCount(tree_.Count());
    ESP_LOGD(TAG_MENU_, "Menu \"%s\" now has %u items", GetTitle(),
             static_cast<unsigned>(tree_.Count()));
}

size_t Menu::highlightedNodeIndex() const noexcept
{
    // Cursor 0 is the first entry after the root
    return MenuTree::ROOT_INDEX_ + 1 + state_.GetHighlightedItem();
}

} // namespace tree_menu
