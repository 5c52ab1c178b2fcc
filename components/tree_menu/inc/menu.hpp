/**
 * @file menu.hpp
 * @brief Hierarchical menu: structure, navigation and rendering
 *
 * Usage from a host loop:
 * @code
 *   tree_menu::Menu menu("Settings", tree_menu::MakeMonochromeStyle());
 *   menu.AddCheckbox("Sound");
 *   menu.AddSection("About");
 *
 *   tree_menu::GfxSurface surface(display);
 *   while (true) {
 *       // on input: menu.NavigateDown() / menu.NavigateUp()
 *       if (menu.Draw(surface, surface) == ESP_OK) {
 *           display.display();
 *       }
 *   }
 * @endcode
 *
 * Not thread-safe; serialize access when driven from several tasks.
 */

#pragma once

#include <cstddef>
#include <vector>
#include "esp_err.h"
#include "draw_target.hpp"
#include "menu_items.hpp"
#include "menu_style.hpp"
#include "menu_tree.hpp"
#include "navigation_state.hpp"

namespace tree_menu {

class Menu {
public:
    /**
     * @brief Create an empty menu
     * @param title Header text, also the label when absorbed as a submenu.
     *              Must outlive the menu.
     * @param style Visual configuration for this menu and every submenu added to it
     */
    Menu(const char* title, const MenuStyle& style);

    Menu(Menu&&) noexcept = default;
    Menu& operator=(Menu&&) noexcept = default;
    Menu(const Menu&) = delete;
    Menu& operator=(const Menu&) = delete;

    // Public functions: PascalCase

    // Structure
    void AddItem(MenuEntry entry);
    void AddCheckbox(const char* label);
    void AddSelector(const char* label, std::vector<const char*> options);
    void AddSection(const char* label);

    /**
     * @brief Nest @p submenu under this menu's root
     *
     * The submenu's whole tree moves in as one subtree; @p submenu is
     * left empty and must not be used afterwards.
     */
    void AddSubmenu(Menu&& submenu);

    // Navigation
    void NavigateDown() noexcept;
    void NavigateUp() noexcept;

    /**
     * @brief Activate the highlighted entry (no effect yet)
     */
    void SelectItem() noexcept;

    /**
     * @brief Cycle the option of the Selector in the highlighted row
     * @return ESP_OK, ESP_ERR_NOT_FOUND when no entry is highlighted,
     *         ESP_ERR_INVALID_STATE when the highlighted entry is not a Selector
     */
    esp_err_t AdvanceSelection() noexcept;

    /**
     * @brief Render one frame
     *
     * Clears the whole target, draws the title, then fills the space below
     * it with whole rows starting at the highlighted entry. A row that does
     * not fit is not drawn and stops the pass. The first surface error
     * aborts the pass and is returned; the frame is then partially drawn.
     */
    esp_err_t Draw(DrawTarget& target, const TextMetrics& metrics) const noexcept;

    /**
     * @brief Log the entry tree at INFO level, one line per entry
     */
    void LogTree() const noexcept;

    const char* GetTitle() const noexcept;
    size_t GetItemCount() const noexcept { return state_.GetItemCount(); }
    size_t GetHighlightedItem() const noexcept { return state_.GetHighlightedItem(); }
    const MenuTree& GetTree() const noexcept { return tree_; }
    const MenuStyle& GetStyle() const noexcept { return style_; }

private:
    // Private functions: camelCase
    void refreshItemCount() noexcept;
    size_t highlightedNodeIndex() const noexcept;

    // Member variables: snake_case + trailing underscore
    MenuStyle style_;
    MenuTree tree_;
    NavigationState state_;
};

} // namespace tree_menu
