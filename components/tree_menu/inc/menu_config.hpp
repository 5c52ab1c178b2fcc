/**
 * @file menu_config.hpp
 * @brief Compile-time configuration for the tree menu component
 */

#pragma once

#include <cstdint>

namespace tree_menu {

// ------------- SUBMENU INDICATOR -------------

// Padding around the submenu arrow, in pixels
static constexpr uint16_t INDICATOR_VERTICAL_PAD_ = 2;   // top and bottom
static constexpr uint16_t INDICATOR_RIGHT_PAD_    = 2;   // from the right edge of the row

// ------------- CHECKBOX -------------

// Fixed three-character state glyph drawn right-aligned on checkbox rows
static constexpr const char* CHECKBOX_GLYPH_ = "[ ]";

// ------------- BUILT-IN FONT -------------

// Adafruit GFX classic font cell (5x7 glyph plus spacing) at text size 1
static constexpr uint16_t CLASSIC_FONT_CELL_WIDTH_  = 6;
static constexpr uint16_t CLASSIC_FONT_CELL_HEIGHT_ = 8;

// ------------- MONOCHROME COLORS -------------

// Same values as SH110X_BLACK / SH110X_WHITE
static constexpr uint16_t MONO_BLACK_ = 0;
static constexpr uint16_t MONO_WHITE_ = 1;

} // namespace tree_menu
