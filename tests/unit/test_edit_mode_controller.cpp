// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "edit_mode_controller.h"
#include "grid_synchronizer.h"
#include "layout_persistence.h"
#include "widget_registry.h"

#include "../lvgl_test_fixture.h"
#include "../mocks/mock_grid_surface.h"
#include "../mocks/mock_layout_storage.h"

#include <catch2/catch_test_macros.hpp>

using namespace dashgrid;

namespace {

constexpr uint32_t TEST_DEBOUNCE_MS = 50;

class EditModeFixture : public LVGLTestFixture {
  public:
    EditModeFixture()
        : persistence(storage), sync(surface, persistence, TEST_DEBOUNCE_MS),
          engine(persistence, sync), controller(sync, engine) {
        sync.mount();
    }

    int layout_writes() const {
        return storage.writes_for(LAYOUT_STORAGE_KEY);
    }

    MockLayoutStorage storage;
    LayoutPersistence persistence;
    MockGridSurface surface;
    GridSynchronizer sync;
    TemplateEngine engine;
    EditModeController controller;
};

WidgetConfig widget(const std::string& id, const std::string& type, int x, int y, int w, int h) {
    const auto* def = find_widget_def(std::string_view(type));
    REQUIRE(def != nullptr);
    return make_widget_config(*def, id, x, y, w, h);
}

} // namespace

// =============================================================================
// Edit mode
// =============================================================================

TEST_CASE_METHOD(EditModeFixture, "EditModeController: toggles surface interaction",
                 "[edit_mode]") {
    CHECK_FALSE(controller.is_editing());
    CHECK_FALSE(surface.is_interactive());

    controller.set_editing(true);
    CHECK(controller.is_editing());
    CHECK(surface.is_interactive());

    controller.toggle_editing();
    CHECK_FALSE(controller.is_editing());
    CHECK_FALSE(surface.is_interactive());
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: leaving edit mode writes pending changes",
                 "[edit_mode]") {
    controller.set_editing(true);
    int writes = layout_writes();

    surface.user_move("news", {0, 30, 12, 4});
    REQUIRE(sync.save_pending());

    controller.set_editing(false);
    CHECK_FALSE(sync.save_pending());
    CHECK(layout_writes() == writes + 1);
}

// =============================================================================
// Add / remove
// =============================================================================

TEST_CASE_METHOD(EditModeFixture, "EditModeController: add allocates the first free slot",
                 "[edit_mode][add]") {
    int writes = layout_writes();

    std::string id = controller.add_widget(WidgetType::Weather);
    REQUIRE_FALSE(id.empty());
    CHECK(id.rfind("weather_", 0) == 0);

    const auto* added = sync.layout().find(id);
    REQUIRE(added != nullptr);
    CHECK(added->type == "weather");
    CHECK(added->enabled);
    // Default board is full down to row 29
    CHECK(added->position.same_rect({0, 29, 4, 5}));
    CHECK(added->position.min_w == 3);
    CHECK(added->settings["units"] == "celsius");

    CHECK(surface.has_element(id));
    REQUIRE_FALSE(surface.scrolled_to.empty());
    CHECK(surface.scrolled_to.back() == id);
    CHECK(layout_writes() == writes + 1);
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: repeated adds get distinct ids and slots",
                 "[edit_mode][add]") {
    std::string first = controller.add_widget(WidgetType::Weather);
    std::string second = controller.add_widget(WidgetType::Weather);
    REQUIRE_FALSE(first.empty());
    REQUIRE_FALSE(second.empty());
    CHECK(first != second);
    CHECK(sync.layout().find(second)->position.same_rect({4, 29, 4, 5}));
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: add by type name", "[edit_mode][add]") {
    std::string id = controller.add_widget(std::string_view("quick_notes"));
    REQUIRE_FALSE(id.empty());
    CHECK(sync.layout().find(id)->type == "quick_notes");

    auto before = sync.layout().widgets.size();
    CHECK(controller.add_widget(std::string_view("not_a_widget")).empty());
    CHECK(sync.layout().widgets.size() == before);
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: add lands beside a lone widget",
                 "[edit_mode][add]") {
    sync.replace_widgets({widget("a", "upcoming_assessments", 0, 0, 6, 4)});
    std::string id = controller.add_widget(WidgetType::MessagesPreview);
    REQUIRE_FALSE(id.empty());
    CHECK(sync.layout().find(id)->position.same_rect({6, 0, 6, 4}));
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: search height comes from settings",
                 "[edit_mode][add]") {
    sync.replace_widgets({widget("a", "grade_trends", 0, 0, 8, 4)});

    DashboardSettings tight;
    tight.search_rows = 0;
    EditModeController tight_controller(sync, engine, tight);
    std::string squeezed = tight_controller.add_widget(WidgetType::Weather);
    // Preferred 4x5 does not fit beside "a" without extra rows; the 3x4 minimum does
    CHECK(sync.layout().find(squeezed)->position.same_rect({8, 0, 3, 4}));

    sync.replace_widgets({widget("a", "grade_trends", 0, 0, 8, 4)});
    std::string roomy = controller.add_widget(WidgetType::Weather);
    CHECK(sync.layout().find(roomy)->position.same_rect({8, 0, 4, 5}));
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: remove, settings and visibility",
                 "[edit_mode]") {
    CHECK(controller.remove_widget("news"));
    CHECK_FALSE(controller.remove_widget("news"));
    CHECK_FALSE(surface.has_element("news"));

    CHECK(controller.update_widget_settings("notices", {{"maxItems", 7}}));
    CHECK(sync.layout().find("notices")->settings["maxItems"] == 7);

    CHECK(controller.set_widget_enabled("homework", false));
    CHECK_FALSE(surface.has_element("homework"));
    CHECK(sync.layout().find("homework") != nullptr);
}

// =============================================================================
// Reset / reload
// =============================================================================

TEST_CASE_METHOD(EditModeFixture, "EditModeController: reset without confirmation",
                 "[edit_mode][reset]") {
    sync.replace_widgets({widget("a", "weather", 0, 0, 4, 5)});
    surface.scroll_to_top_count = 0;

    controller.request_reset();
    CHECK(sync.layout().widgets.size() == 10);
    CHECK(surface.has_element("news"));
    CHECK_FALSE(surface.has_element("a"));
    CHECK(surface.scroll_to_top_count == 1);
    CHECK(persistence.load().widgets.size() == 10);
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: reset waits for confirmation",
                 "[edit_mode][reset]") {
    sync.replace_widgets({widget("a", "weather", 0, 0, 4, 5)});

    std::string asked;
    std::function<void(bool)> answer;
    controller.set_confirm_callback(
        [&](const std::string& message, std::function<void(bool)> on_result) {
            asked = message;
            answer = std::move(on_result);
        });

    controller.request_reset();
    CHECK_FALSE(asked.empty());
    REQUIRE(answer);
    CHECK(sync.layout().widgets.size() == 1); // nothing yet

    SECTION("declined") {
        answer(false);
        CHECK(sync.layout().widgets.size() == 1);
        CHECK(surface.has_element("a"));
    }

    SECTION("confirmed") {
        answer(true);
        CHECK(sync.layout().widgets.size() == 10);
        CHECK_FALSE(surface.has_element("a"));
    }
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: reload picks up stored changes",
                 "[edit_mode][reload]") {
    WidgetLayout stored;
    stored.widgets = {widget("w", "weather", 0, 0, 4, 5), widget("n", "notices", 0, 5, 12, 4)};
    REQUIRE(persistence.save(stored));

    controller.reload_layout("n");
    CHECK(sync.layout().widgets.size() == 2);
    CHECK(surface.has_element("w"));
    CHECK_FALSE(surface.has_element("news"));
    REQUIRE_FALSE(surface.scrolled_to.empty());
    CHECK(surface.scrolled_to.back() == "n");
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: reload writes pending geometry first",
                 "[edit_mode][reload]") {
    surface.user_move("news", {0, 30, 12, 4});
    controller.reload_layout();
    CHECK(sync.layout().find("news")->position.y == 30);
    CHECK(surface.scrolled_to.empty());
}

// =============================================================================
// Dialogs and templates
// =============================================================================

TEST_CASE_METHOD(EditModeFixture, "EditModeController: dialog callbacks", "[edit_mode][dialogs]") {
    int template_opens = 0;
    std::vector<std::string> settings_opens;
    controller.set_open_templates_callback([&]() { template_opens++; });
    controller.set_open_settings_callback(
        [&](const std::string& id) { settings_opens.push_back(id); });

    controller.open_templates();
    CHECK(template_opens == 1);

    controller.open_settings("notices");
    controller.open_settings("ghost");
    REQUIRE(settings_opens.size() == 1);
    CHECK(settings_opens[0] == "notices");
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: dialogs without callbacks are no-ops",
                 "[edit_mode][dialogs]") {
    controller.open_templates();
    controller.open_settings("notices");
    SUCCEED();
}

TEST_CASE_METHOD(EditModeFixture, "EditModeController: template operations",
                 "[edit_mode][templates]") {
    CHECK(controller.list_templates().size() == 7);

    auto saved = controller.save_current_as_template("Mine", "");
    REQUIRE(saved.success);
    CHECK(controller.list_templates().size() == 8);

    REQUIRE(controller.apply_template("productivity_hub").success);
    CHECK(sync.layout().widgets.size() == 4);

    REQUIRE(controller.apply_template(saved.template_id).success);
    CHECK(sync.layout().widgets.size() == 10);

    CHECK_FALSE(controller.delete_template("complete").success);
    CHECK(controller.delete_template(saved.template_id).success);
}
