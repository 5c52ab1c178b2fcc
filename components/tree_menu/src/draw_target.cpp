/**
 * @file draw_target.cpp
 * @brief DrawRegion implementation
 */

#include "draw_target.hpp"

namespace tree_menu {

DrawRegion::DrawRegion(DrawTarget& target) noexcept
    : target_(&target)
    , area_(target.Bounds())
{
}

DrawRegion::DrawRegion(DrawTarget& target, const Rect& area) noexcept
    : target_(&target)
    , area_(area.Intersection(target.Bounds()))
{
}

Rect DrawRegion::Bounds() const noexcept
{
    return Rect(0, 0, area_.width, area_.height);
}

DrawRegion DrawRegion::Cropped(const Rect& local) const noexcept
{
    const Point origin = toAbsolute(local.TopLeft());
    const Rect absolute(origin.x, origin.y, local.width, local.height);
    return DrawRegion(*target_, absolute.Intersection(area_));
}

esp_err_t DrawRegion::Clear(uint16_t color) noexcept
{
    return target_->FillRect(area_, color, area_);
}

esp_err_t DrawRegion::FillTriangle(Point p0, Point p1, Point p2, uint16_t color) noexcept
{
    return target_->FillTriangle(toAbsolute(p0), toAbsolute(p1), toAbsolute(p2), color, area_);
}

esp_err_t DrawRegion::DrawText(const char* text, Point origin, const TextStyle& style,
                               TextBaseline baseline, TextAlignment alignment) noexcept
{
    return target_->DrawText(text, toAbsolute(origin), style, baseline, alignment, area_);
}

Point DrawRegion::toAbsolute(Point local) const noexcept
{
    return local + area_.TopLeft();
}

} // namespace tree_menu
