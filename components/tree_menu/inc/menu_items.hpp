/**
 * @file menu_items.hpp
 * @brief Menu entry types (Section, Checkbox, Selector, Submenu)
 *
 * The set of entries is closed, so they are plain value types held in a
 * std::variant (MenuEntry) instead of a virtual hierarchy. Measuring and
 * drawing dispatch once per case and never allocate.
 *
 * Labels are not copied: every label and option pointer must stay valid for
 * the lifetime of the menu that holds the entry.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>
#include "esp_err.h"
#include "geometry.hpp"
#include "menu_style.hpp"
#include "draw_target.hpp"

namespace tree_menu {

enum class MenuItemType : uint8_t {
    Section,
    Checkbox,
    Selector,
    Submenu
};

const char* MenuItemTypeName(MenuItemType type) noexcept;

/**
 * @brief Fields shared by every entry type
 */
class MenuItemBase {
public:
    // Public functions: PascalCase
    const char* GetLabel() const noexcept { return label_; }
    bool IsHighlighted() const noexcept { return highlighted_; }
    Point GetPosition() const noexcept { return position_; }

    /**
     * @brief Move the label origin inside the entry's row
     */
    void Translate(Point by) noexcept { position_ += by; }

    /**
     * @brief Label box measured with the item style at baseline Bottom, origin zero
     *
     * Only the size is meaningful; it is the height of the entry's row.
     */
    Rect Measure(const TextMetrics& metrics, const MenuStyle& style) const noexcept;

protected:
    explicit MenuItemBase(const char* label) noexcept;

    esp_err_t drawLabel(DrawRegion& region, const MenuStyle& style) const noexcept;
    esp_err_t drawRightAligned(DrawRegion& region, const char* text,
                               const MenuStyle& style) const noexcept;

    // Member variables: snake_case + trailing underscore
    const char* label_;
    bool highlighted_;
    Point position_;
};

/**
 * @brief Non-selectable text row
 */
class SectionItem : public MenuItemBase {
public:
    explicit SectionItem(const char* label) noexcept;
    esp_err_t Draw(DrawRegion& region, const TextMetrics& metrics,
                   const MenuStyle& style) const noexcept;
};

/**
 * @brief Label with a right-aligned "[ ]" state glyph
 */
class CheckboxItem : public MenuItemBase {
public:
    explicit CheckboxItem(const char* label) noexcept;
    esp_err_t Draw(DrawRegion& region, const TextMetrics& metrics,
                   const MenuStyle& style) const noexcept;
};

/**
 * @brief Label with one option out of a fixed list
 */
class SelectorItem : public MenuItemBase {
public:
    SelectorItem(const char* label, std::vector<const char*> options);

    esp_err_t Draw(DrawRegion& region, const TextMetrics& metrics,
                   const MenuStyle& style) const noexcept;

    /**
     * @brief Step to the next option, wrapping back to the first
     */
    void AdvanceSelection() noexcept;

    size_t GetSelectedIndex() const noexcept { return selected_; }
    size_t GetOptionCount() const noexcept { return options_.size(); }

    // nullptr when the option list is empty
    const char* GetSelectedOption() const noexcept;

private:
    std::vector<const char*> options_;
    size_t selected_;
};

/**
 * @brief Row that owns child entries, drawn with a right-pointing arrow
 */
class SubmenuItem : public MenuItemBase {
public:
    explicit SubmenuItem(const char* label) noexcept;
    esp_err_t Draw(DrawRegion& region, const TextMetrics& metrics,
                   const MenuStyle& style) const noexcept;
};

using MenuEntry = std::variant<SectionItem, CheckboxItem, SelectorItem, SubmenuItem>;

MenuItemType GetEntryType(const MenuEntry& entry) noexcept;
const MenuItemBase& GetEntryBase(const MenuEntry& entry) noexcept;
MenuItemBase& GetEntryBase(MenuEntry& entry) noexcept;
Rect MeasureEntry(const MenuEntry& entry, const TextMetrics& metrics,
                  const MenuStyle& style) noexcept;
esp_err_t DrawEntry(const MenuEntry& entry, DrawRegion& region,
                    const TextMetrics& metrics, const MenuStyle& style) noexcept;

} // namespace tree_menu
