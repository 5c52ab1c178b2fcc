/**
 * @file menu_items.cpp
 * @brief Menu entry measure/draw implementations
 */

#include "menu_items.hpp"
#include "menu_config.hpp"
#include <utility>

namespace tree_menu {

const char* MenuItemTypeName(MenuItemType type) noexcept
{
    switch (type) {
        case MenuItemType::Section:  return "Section";
        case MenuItemType::Checkbox: return "Checkbox";
        case MenuItemType::Selector: return "Selector";
        case MenuItemType::Submenu:  return "Submenu";
    }
    return "Unknown";
}

MenuItemBase::MenuItemBase(const char* label) noexcept
    : label_(label != nullptr ? label : "")
    , highlighted_(false)
    , position_()
{
}

Rect MenuItemBase::Measure(const TextMetrics& metrics, const MenuStyle& style) const noexcept
{
    return metrics.MeasureString(label_, style.item_text_style, Point(), TextBaseline::Bottom);
}

esp_err_t MenuItemBase::drawLabel(DrawRegion& region, const MenuStyle& style) const noexcept
{
    return region.DrawText(label_, position_, style.item_text_style, TextBaseline::Top);
}

esp_err_t MenuItemBase::drawRightAligned(DrawRegion& region, const char* text,
                                         const MenuStyle& style) const noexcept
{
    // Anchored to the full row width, independent of the label
    const Point right_edge(static_cast<int16_t>(region.Bounds().width), 0);
    return region.DrawText(text, right_edge, style.item_text_style,
                           TextBaseline::Top, TextAlignment::Right);
}

// ------------- SECTION -------------

SectionItem::SectionItem(const char* label) noexcept
    : MenuItemBase(label)
{
}

esp_err_t SectionItem::Draw(DrawRegion& region, const TextMetrics& metrics,
                            const MenuStyle& style) const noexcept
{
    (void)metrics;
    return drawLabel(region, style);
}

// ------------- CHECKBOX -------------

CheckboxItem::CheckboxItem(const char* label) noexcept
    : MenuItemBase(label)
{
}

esp_err_t CheckboxItem::Draw(DrawRegion& region, const TextMetrics& metrics,
                             const MenuStyle& style) const noexcept
{
    (void)metrics;
    esp_err_t ret = drawLabel(region, style);
    if (ret != ESP_OK) {
        return ret;
    }
    return drawRightAligned(region, CHECKBOX_GLYPH_, style);
}

// ------------- SELECTOR -------------

SelectorItem::SelectorItem(const char* label, std::vector<const char*> options)
    : MenuItemBase(label)
    , options_(std::move(options))
    , selected_(0)
{
}

esp_err_t SelectorItem::Draw(DrawRegion& region, const TextMetrics& metrics,
                             const MenuStyle& style) const noexcept
{
    (void)metrics;
    esp_err_t ret = drawLabel(region, style);
    if (ret != ESP_OK) {
        return ret;
    }

    const char* option = GetSelectedOption();
    if (option == nullptr) {
        return ESP_OK;
    }
    return drawRightAligned(region, option, style);
}

void SelectorItem::AdvanceSelection() noexcept
{
    if (options_.empty()) {
        return;
    }
    selected_ = (selected_ + 1) % options_.size();
}

const char* SelectorItem::GetSelectedOption() const noexcept
{
    if (options_.empty()) {
        return nullptr;
    }
    return options_[selected_] != nullptr ? options_[selected_] : "";
}

// ------------- SUBMENU -------------

SubmenuItem::SubmenuItem(const char* label) noexcept
    : MenuItemBase(label)
{
}

esp_err_t SubmenuItem::Draw(DrawRegion& region, const TextMetrics& metrics,
                            const MenuStyle& style) const noexcept
{
    const int32_t item_height = Measure(metrics, style).height;
    const uint16_t indicator_width = static_cast<uint16_t>(item_height / 2);
    const Rect bounds = region.Bounds();

    // Arrow in a (height / 2) x height box at the right edge of the row
    DrawRegion indicator = region.Cropped(bounds.ResizedWidth(indicator_width, AnchorX::Right));
    const int32_t v_pad = INDICATOR_VERTICAL_PAD_;
    const int32_t r_pad = INDICATOR_RIGHT_PAD_;
    esp_err_t ret = indicator.FillTriangle(
        Point(0, static_cast<int16_t>(v_pad)),
        Point(0, static_cast<int16_t>(item_height - v_pad)),
        Point(static_cast<int16_t>(indicator_width - r_pad),
              static_cast<int16_t>((item_height - v_pad * 2) / 2 + v_pad)),
        style.indicator_fill_color);
    if (ret != ESP_OK) {
        return ret;
    }

    const uint16_t label_width = bounds.width > indicator_width
                                     ? static_cast<uint16_t>(bounds.width - indicator_width)
                                     : 0;
    DrawRegion label_area = region.Cropped(bounds.ResizedWidth(label_width, AnchorX::Left));
    return drawLabel(label_area, style);
}

// ------------- DISPATCH -------------

MenuItemType GetEntryType(const MenuEntry& entry) noexcept
{
    // Variant alternatives are declared in MenuItemType order
    return static_cast<MenuItemType>(entry.index());
}

const MenuItemBase& GetEntryBase(const MenuEntry& entry) noexcept
{
    return std::visit([](const auto& item) -> const MenuItemBase& { return item; }, entry);
}

MenuItemBase& GetEntryBase(MenuEntry& entry) noexcept
{
    return std::visit([](auto& item) -> MenuItemBase& { return item; }, entry);
}

Rect MeasureEntry(const MenuEntry& entry, const TextMetrics& metrics,
                  const MenuStyle& style) noexcept
{
    return GetEntryBase(entry).Measure(metrics, style);
}

esp_err_t DrawEntry(const MenuEntry& entry, DrawRegion& region,
                    const TextMetrics& metrics, const MenuStyle& style) noexcept
{
    return std::visit(
        [&](const auto& item) { return item.Draw(region, metrics, style); },
        entry);
}

} // namespace tree_menu
