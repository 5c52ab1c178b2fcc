/**
 * @file config.hpp
 * @brief Configuration for the menu demo
 *
 * The demo renders into an off-screen 1-bit canvas the size of the
 * 1.3" SH1106 OLED (128x64) and logs every frame as ASCII art, so menu
 * layout can be checked without hardware attached.
 */

#pragma once

#include <cstdint>

// ------------- CANVAS CONFIG -------------

// Same geometry as the SH1106 panel
static constexpr uint16_t OLED_WIDTH_  = 128;
static constexpr uint16_t OLED_HEIGHT_ = 64;

// ASCII rendering of canvas pixels
static constexpr char PIXEL_ON_CHAR_  = '#';
static constexpr char PIXEL_OFF_CHAR_ = '.';

// ------------- DEMO SCRIPT -------------

// Cursor steps applied between rendered frames
static constexpr uint8_t DEMO_NAVIGATION_STEPS_ = 8;
