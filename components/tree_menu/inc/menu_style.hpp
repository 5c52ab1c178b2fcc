/**
 * @file menu_style.hpp
 * @brief Colors and text styles shared by every entry of a menu
 */

#pragma once

#include <cstdint>
#include <gfxfont.h>

namespace tree_menu {

/**
 * @brief Text appearance passed to the drawing surface
 */
struct TextStyle {
    const GFXfont* font = nullptr;   // nullptr selects the built-in 6x8 font
    uint8_t        size = 1;         // integer scale factor (setTextSize)
    uint16_t       color = 0xFFFF;
};

/**
 * @brief Visual configuration of a whole menu
 *
 * One instance is owned by each Menu and governs the menu and every
 * submenu absorbed into it.
 */
struct MenuStyle {
    uint16_t  background_color     = 0x0000;
    TextStyle heading_text_style;
    TextStyle item_text_style;
    uint16_t  indicator_fill_color = 0xFFFF;
    uint16_t  highlight_color      = 0xFFFF;   // not used by rendering yet
    TextStyle highlight_text_style;            // not used by rendering yet
};

/**
 * @brief Default style for 1-bit OLED panels (white on black, inverted highlight)
 */
MenuStyle MakeMonochromeStyle() noexcept;

} // namespace tree_menu
