/**
 * @file gfx_surface.hpp
 * @brief DrawTarget / TextMetrics adapter for Adafruit GFX displays
 *
 * Wraps any Adafruit_GFX device (Adafruit_SH1106G, GFXcanvas1/8/16, ...).
 * Adafruit GFX has no clip rectangle, so primitives and text are routed
 * through an internal Adafruit_GFX whose drawPixel drops pixels outside
 * the current clip before forwarding them to the real device.
 *
 * Nothing is flushed here: call display() on the device after Menu::Draw.
 */

#pragma once

#include <cstdint>
#include <Adafruit_GFX.h>
#include "draw_target.hpp"

namespace tree_menu {

class GfxSurface : public DrawTarget, public TextMetrics {
public:
    explicit GfxSurface(Adafruit_GFX& display) noexcept;

    // DrawTarget
    Rect Bounds() const noexcept override;
    esp_err_t FillRect(const Rect& rect, uint16_t color, const Rect& clip) noexcept override;
    esp_err_t FillTriangle(Point p0, Point p1, Point p2, uint16_t color,
                           const Rect& clip) noexcept override;
    esp_err_t DrawText(const char* text, Point origin, const TextStyle& style,
                       TextBaseline baseline, TextAlignment alignment,
                       const Rect& clip) noexcept override;

    // TextMetrics
    Rect MeasureString(const char* text, const TextStyle& style,
                       Point origin, TextBaseline baseline) const noexcept override;
    uint16_t LineHeight(const TextStyle& style) const noexcept override;

private:
    /**
     * @brief Adafruit_GFX front end that clips before forwarding pixels
     */
    class ClippedGfx : public Adafruit_GFX {
    public:
        explicit ClippedGfx(Adafruit_GFX& parent) noexcept;
        void drawPixel(int16_t x, int16_t y, uint16_t color) override;
        // Also picks up the parent's current size, which changes with setRotation()
        void setClip(const Rect& clip) noexcept;

    private:
        Adafruit_GFX& parent_;
        Rect clip_;
    };

    // Private functions: camelCase
    void applyStyle(const TextStyle& style) const noexcept;
    Rect textBox(const char* text, const TextStyle& style, int16_t* x1, int16_t* y1) const noexcept;

    // Member variables: snake_case + trailing underscore
    Adafruit_GFX& display_;
    mutable ClippedGfx clipped_;   // getTextBounds() is not const in Adafruit GFX
};

} // namespace tree_menu
