/**
 * @file gfx_surface.cpp
 * @brief Adafruit GFX adapter implementation
 */

#include "gfx_surface.hpp"
#include "menu_config.hpp"
#include "esp_log.h"

namespace tree_menu {

static const char* TAG_GFX_ = "GfxSurface";

GfxSurface::ClippedGfx::ClippedGfx(Adafruit_GFX& parent) noexcept
    : Adafruit_GFX(parent.width(), parent.height())
    , parent_(parent)
    , clip_(0, 0, static_cast<uint16_t>(parent.width()), static_cast<uint16_t>(parent.height()))
{
    setTextWrap(false);
}

void GfxSurface::ClippedGfx::drawPixel(int16_t x, int16_t y, uint16_t color)
{
    if (clip_.Contains(x, y)) {
        parent_.drawPixel(x, y, color);
    }
}

void GfxSurface::ClippedGfx::setClip(const Rect& clip) noexcept
{
    _width = parent_.width();
    _height = parent_.height();
    clip_ = clip;
}

GfxSurface::GfxSurface(Adafruit_GFX& display) noexcept
    : display_(display)
    , clipped_(display)
{
}

Rect GfxSurface::Bounds() const noexcept
{
    return Rect(0, 0, static_cast<uint16_t>(display_.width()),
                static_cast<uint16_t>(display_.height()));
}

esp_err_t GfxSurface::FillRect(const Rect& rect, uint16_t color, const Rect& clip) noexcept
{
    const Rect area = rect.Intersection(clip).Intersection(Bounds());
    if (area.IsEmpty()) {
        return ESP_OK;
    }
    display_.fillRect(area.x, area.y, static_cast<int16_t>(area.width),
                      static_cast<int16_t>(area.height), color);
    return ESP_OK;
}

esp_err_t GfxSurface::FillTriangle(Point p0, Point p1, Point p2, uint16_t color,
                                   const Rect& clip) noexcept
{
    if (clip.IsEmpty()) {
        return ESP_OK;
    }
    clipped_.setClip(clip);
    clipped_.fillTriangle(p0.x, p0.y, p1.x, p1.y, p2.x, p2.y, color);
    return ESP_OK;
}

esp_err_t GfxSurface::DrawText(const char* text, Point origin, const TextStyle& style,
                               TextBaseline baseline, TextAlignment alignment,
                               const Rect& clip) noexcept
{
    if (text == nullptr) {
        ESP_LOGE(TAG_GFX_, "DrawText called with null text");
        return ESP_ERR_INVALID_ARG;
    }
    if (clip.IsEmpty() || text[0] == '\0') {
        return ESP_OK;
    }

    int16_t x1 = 0;
    int16_t y1 = 0;
    const Rect box = textBox(text, style, &x1, &y1);

    int32_t left = origin.x;
    if (alignment == TextAlignment::Center) {
        left -= box.width / 2;
    } else if (alignment == TextAlignment::Right) {
        left -= box.width;
    }

    int32_t top = origin.y;
    if (box.height > 0) {
        if (baseline == TextBaseline::Middle) {
            top -= (box.height - 1) / 2;
        } else if (baseline == TextBaseline::Bottom) {
            top -= box.height - 1;
        }
    }

    // getTextBounds reports the box relative to the cursor; undo that offset
    clipped_.setClip(clip);
    clipped_.setTextColor(style.color);
    clipped_.setCursor(static_cast<int16_t>(left - x1), static_cast<int16_t>(top - y1));
    clipped_.print(text);
    return ESP_OK;
}

Rect GfxSurface::MeasureString(const char* text, const TextStyle& style,
                               Point origin, TextBaseline baseline) const noexcept
{
    if (text == nullptr) {
        return Rect(origin.x, origin.y, 0, 0);
    }

    int16_t x1 = 0;
    int16_t y1 = 0;
    Rect box = textBox(text, style, &x1, &y1);
    box.x = origin.x;
    box.y = origin.y;
    if (box.height > 0) {
        if (baseline == TextBaseline::Middle) {
            box.y = static_cast<int16_t>(origin.y - (box.height - 1) / 2);
        } else if (baseline == TextBaseline::Bottom) {
            box.y = static_cast<int16_t>(origin.y - (box.height - 1));
        }
    }
    return box;
}

uint16_t GfxSurface::LineHeight(const TextStyle& style) const noexcept
{
    const uint16_t size = style.size > 0 ? style.size : 1;
    if (style.font != nullptr) {
        return static_cast<uint16_t>(style.font->yAdvance * size);
    }
    return static_cast<uint16_t>(CLASSIC_FONT_CELL_HEIGHT_ * size);
}

void GfxSurface::applyStyle(const TextStyle& style) const noexcept
{
    clipped_.setFont(style.font);
    clipped_.setTextSize(style.size > 0 ? style.size : 1);
}

Rect GfxSurface::textBox(const char* text, const TextStyle& style,
                         int16_t* x1, int16_t* y1) const noexcept
{
    applyStyle(style);
    uint16_t w = 0;
    uint16_t h = 0;
    clipped_.getTextBounds(text, 0, 0, x1, y1, &w, &h);
    return Rect(0, 0, w, h);
}

} // namespace tree_menu
