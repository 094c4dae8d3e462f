// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_test_fixture.h"

#include "lvgl_log_handler.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

bool g_lvgl_initialized = false;
lv_display_t* g_display = nullptr;
lv_color_t g_display_buf[800 * 10];

void ensure_lvgl_init() {
    if (g_lvgl_initialized) {
        return;
    }
    lv_init();
    dashgrid::logging::register_lvgl_log_handler();
    g_display = lv_display_create(800, 480);
    lv_display_set_buffers(g_display, g_display_buf, nullptr, sizeof(g_display_buf),
                           LV_DISPLAY_RENDER_MODE_PARTIAL);
    g_lvgl_initialized = true;
    spdlog::info("[Test] LVGL initialized with 800x480 display (once)");
}

} // namespace

LVGLTestFixture::LVGLTestFixture() {
    spdlog::set_level(spdlog::level::warn);
    ensure_lvgl_init();
    screen = lv_screen_active();
    lv_obj_clean(screen);
}

LVGLTestFixture::~LVGLTestFixture() {
    if (screen) {
        lv_obj_clean(screen);
    }
}

void LVGLTestFixture::process_lvgl(uint32_t ms) {
    constexpr uint32_t STEP_MS = 5;
    uint32_t elapsed = 0;
    while (elapsed < ms) {
        uint32_t step = std::min(STEP_MS, ms - elapsed);
        lv_tick_inc(step);
        lv_timer_handler();
        elapsed += step;
    }
}
