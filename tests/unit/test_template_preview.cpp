// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "template_engine.h"
#include "template_preview.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

#include <cstring>
#include <stdexcept>

using namespace dashgrid;

namespace {

const WidgetTemplate& seed(const std::string& id) {
    for (const auto& t : TemplateEngine::seed_templates()) {
        if (t.id == id) {
            return t;
        }
    }
    FAIL("no built-in template " << id);
    throw std::logic_error("unreachable");
}

WidgetConfig raw(const std::string& id, const std::string& type, int x, int y, int w, int h,
                 bool enabled = true) {
    WidgetConfig c;
    c.id = id;
    c.type = type;
    c.enabled = enabled;
    c.position = {x, y, w, h};
    return c;
}

} // namespace

TEST_CASE("compute_template_preview: scales grid cells to pixels", "[template_preview]") {
    auto preview = compute_template_preview(seed("minimalist"), 240, 10);
    CHECK(preview.width == 240);
    CHECK(preview.height == 120);
    REQUIRE(preview.rects.size() == 3);

    const auto& schedule = preview.rects[0];
    CHECK(schedule.id == "today_schedule");
    CHECK(schedule.label == "Today's Schedule");
    CHECK(schedule.x == 0);
    CHECK(schedule.w == 240);
    CHECK(schedule.y == 0);
    CHECK(schedule.h == 60);

    const auto& links = preview.rects[1];
    CHECK(links.label == "Quick Links");
    CHECK(links.x == 0);
    CHECK(links.w == 120);
    CHECK(links.y == 60);
    CHECK(links.h == 40);

    const auto& notes = preview.rects[2];
    CHECK(notes.x == 120);
    CHECK(notes.w == 120);
    CHECK(notes.h == 60);
}

TEST_CASE("compute_template_preview: adjacent cells share an edge at odd widths",
          "[template_preview]") {
    WidgetTemplate t;
    t.layout.widgets = {raw("a", "weather", 0, 0, 4, 5), raw("b", "weather", 4, 0, 4, 5),
                        raw("c", "weather", 8, 0, 4, 5)};
    auto preview = compute_template_preview(t, 100, 4);
    REQUIRE(preview.rects.size() == 3);
    CHECK(preview.rects[0].x + preview.rects[0].w == preview.rects[1].x);
    CHECK(preview.rects[1].x + preview.rects[1].w == preview.rects[2].x);
    CHECK(preview.rects[2].x + preview.rects[2].w == 100);
}

TEST_CASE("compute_template_preview: disabled and unknown widgets", "[template_preview]") {
    WidgetTemplate t;
    t.layout.widgets = {raw("hidden", "weather", 0, 0, 4, 5, false),
                        raw("old", "legacy_widget", 0, 5, 6, 4)};
    auto preview = compute_template_preview(t, 120, 5);
    REQUIRE(preview.rects.size() == 1);
    CHECK(preview.rects[0].id == "old");
    CHECK(preview.rects[0].label == "legacy_widget");
    CHECK(preview.height == 45);
}

TEST_CASE("compute_template_preview: empty template", "[template_preview]") {
    WidgetTemplate t;
    auto preview = compute_template_preview(t, 200, 8);
    CHECK(preview.rects.empty());
    CHECK(preview.height == 0);
    CHECK(preview.width == 200);
}

TEST_CASE_METHOD(LVGLTestFixture, "create_template_preview: non-interactive miniature",
                 "[template_preview][lvgl]") {
    const auto& tmpl = seed("minimalist");
    lv_obj_t* frame = create_template_preview(screen, tmpl, 240);
    REQUIRE(frame != nullptr);
    lv_obj_update_layout(frame);

    CHECK(lv_obj_get_width(frame) == 240);
    CHECK(lv_obj_get_height(frame) == 120); // 12 rows of 10px
    CHECK_FALSE(lv_obj_has_flag(frame, LV_OBJ_FLAG_CLICKABLE));
    CHECK_FALSE(lv_obj_has_flag(frame, LV_OBJ_FLAG_SCROLLABLE));

    REQUIRE(lv_obj_get_child_count(frame) == 3);
    for (uint32_t i = 0; i < 3; ++i) {
        lv_obj_t* cell = lv_obj_get_child(frame, static_cast<int32_t>(i));
        CHECK_FALSE(lv_obj_has_flag(cell, LV_OBJ_FLAG_CLICKABLE));
        CHECK_FALSE(lv_obj_has_flag(cell, LV_OBJ_FLAG_SCROLLABLE));
    }
    CHECK(std::strcmp(lv_obj_get_name(lv_obj_get_child(frame, 0)), "today_schedule") == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "create_template_preview: does not touch the template",
                 "[template_preview][lvgl]") {
    WidgetTemplate t = seed("analytics");
    auto before = t.layout.widgets;
    lv_obj_t* frame = create_template_preview(screen, t, 180);
    REQUIRE(frame != nullptr);
    CHECK(t.layout.widgets == before);
    CHECK(lv_obj_get_child_count(frame) == 4);
}
