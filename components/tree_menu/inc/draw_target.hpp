/**
 * @file draw_target.hpp
 * @brief Drawing surface and text measurement interfaces used by the menu
 *
 * The menu never talks to a display driver directly. It draws through
 * DrawTarget (pixels) and sizes rows through TextMetrics (fonts). Every
 * drawing call can fail with a surface-specific esp_err_t, which the menu
 * hands back to its caller unchanged.
 */

#pragma once

#include <cstdint>
#include "esp_err.h"
#include "geometry.hpp"
#include "menu_style.hpp"

namespace tree_menu {

enum class TextBaseline {
    Top,      // y is the top row of the text box
    Middle,   // y is the middle row of the text box
    Bottom    // y is the bottom row of the text box
};

enum class TextAlignment {
    Left,     // text box starts at x
    Center,   // text box is centred on x
    Right     // text box ends just before x
};

/**
 * @brief Pixel surface the menu renders onto
 *
 * All coordinates are absolute. Nothing may be written outside @p clip.
 */
class DrawTarget {
public:
    virtual ~DrawTarget() = default;

    // Public functions: PascalCase
    virtual Rect Bounds() const noexcept = 0;
    virtual esp_err_t FillRect(const Rect& rect, uint16_t color, const Rect& clip) noexcept = 0;
    virtual esp_err_t FillTriangle(Point p0, Point p1, Point p2, uint16_t color,
                                   const Rect& clip) noexcept = 0;
    virtual esp_err_t DrawText(const char* text, Point origin, const TextStyle& style,
                               TextBaseline baseline, TextAlignment alignment,
                               const Rect& clip) noexcept = 0;
};

/**
 * @brief Font measurement provider
 */
class TextMetrics {
public:
    virtual ~TextMetrics() = default;

    /**
     * @brief Bounding box of @p text drawn left-aligned at @p origin
     */
    virtual Rect MeasureString(const char* text, const TextStyle& style,
                               Point origin, TextBaseline baseline) const noexcept = 0;

    /**
     * @brief Vertical advance of one line of text in @p style
     */
    virtual uint16_t LineHeight(const TextStyle& style) const noexcept = 0;
};

/**
 * @brief Clipped, translated view of a DrawTarget
 *
 * Coordinates passed to a region are local: (0, 0) is the top-left corner
 * of its area. Drawing is clipped to the area. Regions are cheap values and
 * do not own the target.
 */
class DrawRegion {
public:
    explicit DrawRegion(DrawTarget& target) noexcept;
    DrawRegion(DrawTarget& target, const Rect& area) noexcept;

    // Local bounds, always anchored at (0, 0)
    Rect Bounds() const noexcept;
    const Rect& Area() const noexcept { return area_; }

    /**
     * @brief Sub-region for a local rectangle, clipped to this region
     */
    DrawRegion Cropped(const Rect& local) const noexcept;

    esp_err_t Clear(uint16_t color) noexcept;
    esp_err_t FillTriangle(Point p0, Point p1, Point p2, uint16_t color) noexcept;
    esp_err_t DrawText(const char* text, Point origin, const TextStyle& style,
                       TextBaseline baseline,
                       TextAlignment alignment = TextAlignment::Left) noexcept;

private:
    // Private functions: camelCase
    Point toAbsolute(Point local) const noexcept;

    // Member variables: snake_case + trailing underscore
    DrawTarget* target_;
    Rect area_;
};

} // namespace tree_menu
