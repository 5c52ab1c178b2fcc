/**
 * @file geometry.hpp
 * @brief Points and rectangles in display coordinates
 *
 * Coordinates use the same types as Adafruit GFX (int16_t positions,
 * uint16_t sizes) so values pass straight through to the display driver.
 */

#pragma once

#include <cstdint>
#include <algorithm>

namespace tree_menu {

struct Point {
    int16_t x = 0;
    int16_t y = 0;

    constexpr Point() noexcept = default;
    constexpr Point(int16_t px, int16_t py) noexcept : x(px), y(py) {}

    constexpr Point operator+(const Point& other) const noexcept {
        return Point(static_cast<int16_t>(x + other.x), static_cast<int16_t>(y + other.y));
    }
    Point& operator+=(const Point& other) noexcept {
        x = static_cast<int16_t>(x + other.x);
        y = static_cast<int16_t>(y + other.y);
        return *this;
    }
    constexpr bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const Point& other) const noexcept {
        return !(*this == other);
    }
};

enum class AnchorX {
    Left,
    Right
};

enum class AnchorY {
    Top,
    Bottom
};

struct Rect {
    int16_t  x      = 0;
    int16_t  y      = 0;
    uint16_t width  = 0;
    uint16_t height = 0;

    constexpr Rect() noexcept = default;
    constexpr Rect(int16_t px, int16_t py, uint16_t w, uint16_t h) noexcept
        : x(px), y(py), width(w), height(h) {}

    constexpr Point TopLeft() const noexcept { return Point(x, y); }

    // One past the last column / row
    constexpr int32_t Right() const noexcept { return static_cast<int32_t>(x) + width; }
    constexpr int32_t Bottom() const noexcept { return static_cast<int32_t>(y) + height; }

    constexpr bool IsEmpty() const noexcept { return width == 0 || height == 0; }

    constexpr bool Contains(int16_t px, int16_t py) const noexcept {
        return px >= x && py >= y && px < Right() && py < Bottom();
    }

    /**
     * @brief Same rectangle with a new height, keeping the given edge in place
     */
    Rect ResizedHeight(uint16_t new_height, AnchorY anchor) const noexcept {
        if (anchor == AnchorY::Top) {
            return Rect(x, y, width, new_height);
        }
        return Rect(x, static_cast<int16_t>(Bottom() - new_height), width, new_height);
    }

    /**
     * @brief Same rectangle with a new width, keeping the given edge in place
     */
    Rect ResizedWidth(uint16_t new_width, AnchorX anchor) const noexcept {
        if (anchor == AnchorX::Left) {
            return Rect(x, y, new_width, height);
        }
        return Rect(static_cast<int16_t>(Right() - new_width), y, new_width, height);
    }

    /**
     * @brief Overlap of two rectangles (zero-sized when they do not overlap)
     */
    Rect Intersection(const Rect& other) const noexcept {
        const int32_t left   = std::max<int32_t>(x, other.x);
        const int32_t top    = std::max<int32_t>(y, other.y);
        const int32_t right  = std::min(Right(), other.Right());
        const int32_t bottom = std::min(Bottom(), other.Bottom());
        if (right <= left || bottom <= top) {
            return Rect(static_cast<int16_t>(left), static_cast<int16_t>(top), 0, 0);
        }
        return Rect(static_cast<int16_t>(left), static_cast<int16_t>(top),
                    static_cast<uint16_t>(right - left), static_cast<uint16_t>(bottom - top));
    }

    constexpr bool operator==(const Rect& other) const noexcept {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    constexpr bool operator!=(const Rect& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace tree_menu
