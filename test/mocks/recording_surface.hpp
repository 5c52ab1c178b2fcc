/**
 * @file recording_surface.hpp
 * @brief Test doubles for the drawing surface and font metrics
 *
 * RecordingSurface stores every drawing call instead of rasterising it and
 * can be told to fail a given call. FixedCellMetrics measures text like the
 * Adafruit GFX classic font: 6x8 pixels per character and size step.
 */

#pragma once

#include <cstddef>
#include <cstring>
#include <string>
#include <vector>
#include "draw_target.hpp"

namespace tree_menu_test {

using tree_menu::Point;
using tree_menu::Rect;
using tree_menu::TextAlignment;
using tree_menu::TextBaseline;
using tree_menu::TextStyle;

static constexpr uint16_t CELL_WIDTH_  = 6;
static constexpr uint16_t CELL_HEIGHT_ = 8;

inline uint16_t TextWidth(const char* text, const TextStyle& style)
{
    return static_cast<uint16_t>(std::strlen(text) * CELL_WIDTH_ * style.size);
}

inline uint16_t TextHeight(const char* text, const TextStyle& style)
{
    return text[0] == '\0' ? 0 : static_cast<uint16_t>(CELL_HEIGHT_ * style.size);
}

class FixedCellMetrics : public tree_menu::TextMetrics {
public:
    Rect MeasureString(const char* text, const TextStyle& style,
                       Point origin, TextBaseline baseline) const noexcept override
    {
        const uint16_t w = TextWidth(text, style);
        const uint16_t h = TextHeight(text, style);
        int16_t y = origin.y;
        if (h > 0 && baseline == TextBaseline::Bottom) {
            y = static_cast<int16_t>(origin.y - (h - 1));
        } else if (h > 0 && baseline == TextBaseline::Middle) {
            y = static_cast<int16_t>(origin.y - (h - 1) / 2);
        }
        return Rect(origin.x, y, w, h);
    }

    uint16_t LineHeight(const TextStyle& style) const noexcept override
    {
        return static_cast<uint16_t>(CELL_HEIGHT_ * style.size);
    }
};

enum class OpKind {
    FillRect,
    FillTriangle,
    DrawText
};

struct DrawOp {
    OpKind kind;
    Rect clip;
    uint16_t color = 0;

    // FillRect
    Rect rect;

    // FillTriangle
    Point p0, p1, p2;

    // DrawText
    std::string text;
    Point origin;
    TextStyle style;
    TextBaseline baseline = TextBaseline::Top;
    TextAlignment alignment = TextAlignment::Left;
    Rect box;   // where the text lands after alignment and baseline
};

class RecordingSurface : public tree_menu::DrawTarget {
public:
    RecordingSurface(uint16_t width, uint16_t height)
        : bounds_(0, 0, width, height)
    {
    }

    /**
     * @brief Make the call number @p call_index (0-based, all kinds) return @p error
     */
    void FailAtCall(size_t call_index, esp_err_t error = ESP_FAIL)
    {
        fail_at_ = call_index;
        fail_error_ = error;
    }

    Rect Bounds() const noexcept override { return bounds_; }

    esp_err_t FillRect(const Rect& rect, uint16_t color, const Rect& clip) noexcept override
    {
        DrawOp op;
        op.kind = OpKind::FillRect;
        op.rect = rect;
        op.color = color;
        op.clip = clip;
        return record(op);
    }

    esp_err_t FillTriangle(Point p0, Point p1, Point p2, uint16_t color,
                           const Rect& clip) noexcept override
    {
        DrawOp op;
        op.kind = OpKind::FillTriangle;
        op.p0 = p0;
        op.p1 = p1;
        op.p2 = p2;
        op.color = color;
        op.clip = clip;
        return record(op);
    }

    esp_err_t DrawText(const char* text, Point origin, const TextStyle& style,
                       TextBaseline baseline, TextAlignment alignment,
                       const Rect& clip) noexcept override
    {
        DrawOp op;
        op.kind = OpKind::DrawText;
        op.text = text;
        op.origin = origin;
        op.style = style;
        op.baseline = baseline;
        op.alignment = alignment;
        op.clip = clip;
        op.color = style.color;

        const uint16_t w = TextWidth(text, style);
        int32_t left = origin.x;
        if (alignment == TextAlignment::Center) {
            left -= w / 2;
        } else if (alignment == TextAlignment::Right) {
            left -= w;
        }
        const Rect measured = metrics_.MeasureString(text, style, origin, baseline);
        op.box = Rect(static_cast<int16_t>(left), measured.y, measured.width, measured.height);
        return record(op);
    }

    const std::vector<DrawOp>& Ops() const { return ops_; }
    size_t CallCount() const { return calls_; }

    std::vector<DrawOp> OpsOfKind(OpKind kind) const
    {
        std::vector<DrawOp> out;
        for (const DrawOp& op : ops_) {
            if (op.kind == kind) {
                out.push_back(op);
            }
        }
        return out;
    }

    // nullptr when no text op drew @p text
    const DrawOp* FindText(const std::string& text) const
    {
        for (const DrawOp& op : ops_) {
            if (op.kind == OpKind::DrawText && op.text == text) {
                return &op;
            }
        }
        return nullptr;
    }

private:
    esp_err_t record(const DrawOp& op)
    {
        const size_t index = calls_++;
        if (index == fail_at_) {
            return fail_error_;
        }
        ops_.push_back(op);
        return ESP_OK;
    }

    Rect bounds_;
    FixedCellMetrics metrics_;
    std::vector<DrawOp> ops_;
    size_t calls_ = 0;
    size_t fail_at_ = static_cast<size_t>(-1);
    esp_err_t fail_error_ = ESP_FAIL;
};

} // namespace tree_menu_test
