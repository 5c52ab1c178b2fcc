/**
 * @file main.cpp
 * @brief Menu demo: builds a settings menu and logs rendered frames
 */

#include "esp_log.h"
#include <Adafruit_GFX.h>

#include "config.hpp"
#include "gfx_surface.hpp"
#include "menu.hpp"

static const char* TAG_MAIN_ = "Main";

namespace {

const char* const CONTRAST_OPTIONS_[] = { "Low", "Mid", "High" };

tree_menu::Menu BuildDisplayMenu(const tree_menu::MenuStyle& style)
{
    tree_menu::Menu display_menu("Display", style);
    display_menu.AddCheckbox("Flip");
    display_menu.AddSelector("Contrast", { CONTRAST_OPTIONS_[0], CONTRAST_OPTIONS_[1],
                                           CONTRAST_OPTIONS_[2] });
    return display_menu;
}

void LogCanvas(const GFXcanvas1& canvas)
{
    char line[OLED_WIDTH_ + 1];
    for (int16_t y = 0; y < canvas.height(); ++y) {
        for (int16_t x = 0; x < canvas.width(); ++x) {
            line[x] = canvas.getPixel(x, y) ? PIXEL_ON_CHAR_ : PIXEL_OFF_CHAR_;
        }
        line[canvas.width()] = '\0';
        ESP_LOGI(TAG_MAIN_, "%s", line);
    }
}

bool RenderFrame(const tree_menu::Menu& menu, GFXcanvas1& canvas, tree_menu::GfxSurface& surface)
{
    esp_err_t ret = menu.Draw(surface, surface);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG_MAIN_, "Frame failed: %s", esp_err_to_name(ret));
        return false;
    }
    ESP_LOGI(TAG_MAIN_, "Frame with cursor at %u", static_cast<unsigned>(menu.GetHighlightedItem()));
    LogCanvas(canvas);
    return true;
}

} // namespace

int main()
{
    const tree_menu::MenuStyle style = tree_menu::MakeMonochromeStyle();

    tree_menu::Menu menu("Settings", style);
    menu.AddCheckbox("Sound");
    menu.AddSubmenu(BuildDisplayMenu(style));
    menu.AddSection("About");
    menu.LogTree();

    GFXcanvas1 canvas(OLED_WIDTH_, OLED_HEIGHT_);
    if (canvas.getBuffer() == nullptr) {
        ESP_LOGE(TAG_MAIN_, "Failed to allocate %ux%u canvas", OLED_WIDTH_, OLED_HEIGHT_);
        return 1;
    }
    tree_menu::GfxSurface surface(canvas);

    if (!RenderFrame(menu, canvas, surface)) {
        return 1;
    }

    // Walk the cursor down through the entries and past the wrap point
    for (uint8_t step = 0; step < DEMO_NAVIGATION_STEPS_; ++step) {
        menu.NavigateDown();
        if (menu.AdvanceSelection() == ESP_OK) {
            ESP_LOGI(TAG_MAIN_, "Advanced selector at cursor %u",
                     static_cast<unsigned>(menu.GetHighlightedItem()));
        }
        if (!RenderFrame(menu, canvas, surface)) {
            return 1;
        }
    }

    return 0;
}
