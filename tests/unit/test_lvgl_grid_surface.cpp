// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_synchronizer.h"
#include "layout_persistence.h"
#include "lvgl_grid_surface.h"

#include "../lvgl_test_fixture.h"
#include "../mocks/mock_layout_storage.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

using namespace dashgrid;

namespace {

PanelElement element(const std::string& id, const std::string& type = "notices") {
    PanelElement el;
    el.id = id;
    el.type = type;
    el.title = id;
    el.render_unit = "NoticesPane";
    el.bounds.min_w = 6;
    el.bounds.min_h = 4;
    el.bounds.max_w = 12;
    el.bounds.max_h = 10;
    return el;
}

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

// =============================================================================
// Pure helpers
// =============================================================================

TEST_CASE("LvglGridSurface screen_to_grid_cell: maps into the content area",
          "[grid_surface][coords]") {
    auto [col, row] = LvglGridSurface::screen_to_grid_cell(350, 130, 50, 10, 600, 48, 12);
    CHECK(col == 6);
    CHECK(row == 2);
}

TEST_CASE("LvglGridSurface screen_to_grid_cell: clamps columns, rows unbounded below",
          "[grid_surface][coords]") {
    auto right = LvglGridSurface::screen_to_grid_cell(5000, 10, 50, 10, 600, 48, 12);
    CHECK(right.first == 11);

    auto left = LvglGridSurface::screen_to_grid_cell(0, 0, 50, 10, 600, 48, 12);
    CHECK(left.first == 0);
    CHECK(left.second == 0);

    auto deep = LvglGridSurface::screen_to_grid_cell(60, 10 + 48 * 200, 50, 10, 600, 48, 12);
    CHECK(deep.second == 200);

    auto degenerate = LvglGridSurface::screen_to_grid_cell(100, 100, 0, 0, 0, 0, 12);
    CHECK(degenerate.first == 0);
    CHECK(degenerate.second == 0);
}

TEST_CASE("LvglGridSurface compute_resize_span: rounds to the nearest cell",
          "[grid_surface][resize]") {
    auto grow = LvglGridSurface::compute_resize_span(4, 4, 70, -100, 50, 48);
    CHECK(grow.first == 5);
    CHECK(grow.second == 2);

    auto small = LvglGridSurface::compute_resize_span(4, 4, 20, 20, 50, 48);
    CHECK(small.first == 4);
    CHECK(small.second == 4);

    auto floor = LvglGridSurface::compute_resize_span(1, 1, -500, -500, 50, 48);
    CHECK(floor.first == 1);
    CHECK(floor.second == 1);
}

// =============================================================================
// Elements
// =============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: attach, update and detach cards",
                 "[grid_surface]") {
    LvglGridSurface surface(screen);
    lv_obj_t* container = surface.container();
    REQUIRE(container != nullptr);

    surface.attach(element("notices"), {0, 0, 12, 4});
    surface.attach(element("news"), {0, 4, 6, 5});
    CHECK(lv_obj_get_child_count(container) == 2);

    lv_obj_t* card = surface.card("notices");
    REQUIRE(card != nullptr);
    CHECK(std::strcmp(lv_obj_get_name(card), "notices") == 0);
    CHECK(surface.has_element("news"));
    CHECK(*surface.element_geometry("news") == GridRect{0, 4, 6, 5});

    surface.update("news", {6, 9, 6, 5});
    CHECK(*surface.element_geometry("news") == GridRect{6, 9, 6, 5});

    surface.detach("notices");
    CHECK_FALSE(surface.has_element("notices"));
    CHECK(surface.card("notices") == nullptr);
    CHECK(lv_obj_get_child_count(container) == 1);

    // Unknown ids are ignored
    surface.update("ghost", {0, 0, 6, 4});
    surface.detach("ghost");
    CHECK(surface.element_ids().size() == 1);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: re-attach replaces the card",
                 "[grid_surface]") {
    LvglGridSurface surface(screen);
    surface.attach(element("news"), {0, 0, 6, 4});
    surface.attach(element("news"), {6, 0, 6, 4});
    CHECK(lv_obj_get_child_count(surface.container()) == 1);
    CHECK(surface.element_geometry("news")->x == 6);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: cards follow grid columns",
                 "[grid_surface][layout]") {
    LvglGridSurface surface(screen);
    surface.attach(element("left"), {0, 0, 6, 4});
    surface.attach(element("right"), {6, 0, 6, 4});
    surface.settle();

    lv_obj_t* left = surface.card("left");
    lv_obj_t* right = surface.card("right");
    CHECK(lv_obj_get_x(right) > lv_obj_get_x(left));
    CHECK(lv_obj_get_y(right) == lv_obj_get_y(left));
    CHECK(lv_obj_get_width(left) == lv_obj_get_width(right));
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: placeholder and content factory",
                 "[grid_surface][content]") {
    LvglGridSurface surface(screen);

    std::vector<std::string> built;
    surface.set_content_factory([&built](lv_obj_t* card, const PanelElement& el) {
        built.push_back(el.render_unit);
        lv_label_create(card);
    });

    surface.attach(element("notices"), {0, 0, 12, 4});
    REQUIRE(built.size() == 1);
    CHECK(built[0] == "NoticesPane");

    PanelElement unknown = element("old", "legacy_widget");
    unknown.placeholder = true;
    unknown.render_unit.clear();
    surface.attach(unknown, {0, 4, 6, 4});
    CHECK(built.size() == 1); // factory not used for placeholders

    lv_obj_t* card = surface.card("old");
    REQUIRE(card != nullptr);
    REQUIRE(lv_obj_get_child_count(card) == 1);
    lv_obj_t* label = lv_obj_get_child(card, 0);
    CHECK(std::strcmp(lv_label_get_text(label), "Unknown widget: legacy_widget") == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: named children are discovered",
                 "[grid_surface][discovery]") {
    LvglGridSurface surface(screen);
    std::vector<SurfaceItem> reported;
    surface.set_change_listener([&reported](const std::vector<SurfaceItem>& items) {
        reported.insert(reported.end(), items.begin(), items.end());
    });

    surface.attach(element("notices"), {0, 0, 12, 4});

    lv_obj_t* host = lv_obj_create(surface.container());
    lv_obj_set_name(host, "host_panel");
    lv_obj_create(surface.container()); // unnamed: not an element

    auto ids = surface.element_ids();
    CHECK(ids.size() == 2);
    CHECK(contains(ids, "host_panel"));

    REQUIRE(reported.size() == 1);
    CHECK(reported[0].id == "host_panel");
    CHECK(reported[0].x == 0);
    CHECK(reported[0].y == 4);
    CHECK(reported[0].w == LvglGridSurface::DISCOVERED_W);
    CHECK(reported[0].h == LvglGridSurface::DISCOVERED_H);

    // Discovered once only
    surface.settle();
    CHECK(reported.size() == 1);
    CHECK(surface.card("host_panel") == host);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: interactive flag", "[grid_surface]") {
    LvglGridSurface surface(screen);
    surface.attach(element("notices"), {0, 0, 12, 4});
    CHECK_FALSE(surface.is_interactive());
    surface.set_interactive(true);
    CHECK(surface.is_interactive());
    surface.set_interactive(false);
    CHECK_FALSE(surface.is_interactive());
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: scrolling helpers are safe",
                 "[grid_surface][scroll]") {
    LvglGridSurface surface(screen);
    for (int i = 0; i < 8; ++i) {
        surface.attach(element("w" + std::to_string(i)), {0, i * 5, 12, 5});
    }
    surface.settle();
    surface.scroll_to("w7");
    surface.scroll_to("ghost");
    process_lvgl(1000);
    CHECK(lv_obj_get_scroll_y(surface.container()) > 0);

    surface.scroll_to_top();
    process_lvgl(1000);
    CHECK(lv_obj_get_scroll_y(surface.container()) == 0);
}

// =============================================================================
// Lifetime
// =============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: destructor removes the container",
                 "[grid_surface][lifetime]") {
    {
        LvglGridSurface surface(screen);
        surface.attach(element("notices"), {0, 0, 12, 4});
        CHECK(lv_obj_get_child_count(screen) == 1);
    }
    CHECK(lv_obj_get_child_count(screen) == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: survives its parent being cleaned first",
                 "[grid_surface][lifetime]") {
    auto surface = std::make_unique<LvglGridSurface>(screen);
    surface->attach(element("notices"), {0, 0, 12, 4});

    lv_obj_clean(screen);
    CHECK(surface->container() == nullptr);
    CHECK(surface->card("notices") == nullptr);

    surface->attach(element("news"), {0, 0, 6, 4}); // no container: ignored
    surface->settle();
    surface.reset();
    SUCCEED("Destroyed after parent cleanup without crash");
}

// =============================================================================
// With the synchronizer
// =============================================================================

TEST_CASE_METHOD(LVGLTestFixture, "LvglGridSurface: synchronizer renders the default board",
                 "[grid_surface][integration]") {
    MockLayoutStorage storage;
    LayoutPersistence persistence(storage);
    LvglGridSurface surface(screen);
    GridSynchronizer sync(surface, persistence, 50);

    sync.mount();
    CHECK(lv_obj_get_child_count(surface.container()) == 10);
    CHECK(*surface.element_geometry("welcome_portal") == GridRect{0, 21, 12, 4});

    sync.set_interactive(true);
    CHECK(surface.is_interactive());

    sync.remove_widget("news");
    CHECK(lv_obj_get_child_count(surface.container()) == 9);
    CHECK_FALSE(sync.save_pending());
}

TEST_CASE_METHOD(LVGLTestFixture,
                 "LvglGridSurface: host-added child at a wrong position is corrected",
                 "[grid_surface][integration]") {
    MockLayoutStorage storage;
    LayoutPersistence persistence(storage);
    LvglGridSurface surface(screen);
    GridSynchronizer sync(surface, persistence, 50);

    lv_obj_t* early = lv_obj_create(surface.container());
    lv_obj_set_name(early, "news");

    sync.mount();
    CHECK(*surface.element_geometry("news") == GridRect{0, 17, 12, 4});
    CHECK(lv_obj_get_child_count(surface.container()) == 10);
    CHECK(surface.card("news") != nullptr);
}
