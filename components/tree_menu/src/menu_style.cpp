/**
 * @file menu_style.cpp
 * @brief Default menu styles
 */

#include "menu_style.hpp"
#include "menu_config.hpp"

namespace tree_menu {

MenuStyle MakeMonochromeStyle() noexcept
{
    MenuStyle style;
    style.background_color = MONO_BLACK_;

    style.heading_text_style.font  = nullptr;
    style.heading_text_style.size  = 1;
    style.heading_text_style.color = MONO_WHITE_;

    style.item_text_style = style.heading_text_style;

    style.indicator_fill_color = MONO_WHITE_;

    // Highlighted row: white bar, black text
    style.highlight_color = MONO_WHITE_;
    style.highlight_text_style = style.item_text_style;
    style.highlight_text_style.color = MONO_BLACK_;

    return style;
}

} // namespace tree_menu
