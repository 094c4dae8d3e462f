// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "edit_mode_controller.h"

#include "grid_layout.h"
#include "grid_synchronizer.h"
#include "layout_persistence.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace dashgrid {

EditModeController::EditModeController(GridSynchronizer& sync, TemplateEngine& templates,
                                       DashboardSettings settings)
    : sync_(sync), templates_(templates), settings_(settings) {}

void EditModeController::set_editing(bool editing) {
    if (editing_ == editing) {
        return;
    }
    editing_ = editing;
    sync_.set_interactive(editing);
    if (!editing) {
        sync_.flush_pending_save();
    }
    spdlog::info("[EditModeController] Edit mode {}", editing ? "on" : "off");
}

void EditModeController::reload_layout(const std::string& focus_widget_id) {
    sync_.flush_pending_save();
    sync_.mount();
    if (!focus_widget_id.empty()) {
        sync_.scroll_to(focus_widget_id);
    }
}

std::string EditModeController::make_widget_id(const std::string& type) const {
    using namespace std::chrono;
    auto millis =
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    std::string base = fmt::format("{}_{}", type, millis);
    std::string id = base;
    for (int suffix = 1; sync_.layout().find(id); ++suffix) {
        id = fmt::format("{}_{}", base, suffix);
    }
    return id;
}

std::string EditModeController::add_widget(WidgetType type) {
    const auto* def = find_widget_def(type);
    if (!def) {
        return {};
    }

    auto b = def->bounds();
    int min_w = snap_within(def->min_size.w, WIDTH_PRESETS, b.min_w, b.max_w);
    int min_h = snap_within(def->min_size.h, HEIGHT_PRESETS, b.min_h, b.max_h);
    int pref_w = snap_within(def->default_size.w, WIDTH_PRESETS, b.min_w, b.max_w);
    int pref_h = snap_within(def->default_size.h, HEIGHT_PRESETS, b.min_h, b.max_h);

    GridRect rect = calculate_next_available_position(sync_.layout().widgets, min_w, min_h, pref_w,
                                                      pref_h, GRID_COLUMNS, settings_.search_rows);

    std::string id = make_widget_id(def->id);
    if (!sync_.append_widget(make_widget_config(*def, id, rect.x, rect.y, rect.w, rect.h))) {
        return {};
    }
    sync_.scroll_to(id);
    spdlog::info("[EditModeController] Added '{}' at ({},{}) {}x{}", id, rect.x, rect.y, rect.w,
                 rect.h);
    return id;
}

std::string EditModeController::add_widget(std::string_view type) {
    auto t = widget_type_from_string(type);
    if (!t) {
        spdlog::warn("[EditModeController] Cannot add unknown widget type '{}'", type);
        return {};
    }
    return add_widget(*t);
}

bool EditModeController::remove_widget(const std::string& id) {
    return sync_.remove_widget(id);
}

bool EditModeController::update_widget_settings(const std::string& id,
                                                const nlohmann::json& settings) {
    return sync_.update_widget_settings(id, settings);
}

bool EditModeController::set_widget_enabled(const std::string& id, bool enabled) {
    return sync_.set_widget_enabled(id, enabled);
}

void EditModeController::request_reset() {
    if (!confirm_cb_) {
        reset_layout();
        return;
    }
    confirm_cb_("Reset the dashboard to the default layout?", [this](bool confirmed) {
        if (confirmed) {
            reset_layout();
        } else {
            spdlog::debug("[EditModeController] Reset cancelled");
        }
    });
}

void EditModeController::reset_layout() {
    sync_.replace_widgets(LayoutPersistence::get_default_layout().widgets);
    sync_.scroll_to_top();
    spdlog::info("[EditModeController] Layout reset to default");
}

void EditModeController::open_templates() {
    if (open_templates_cb_) {
        open_templates_cb_();
    }
}

void EditModeController::open_settings(const std::string& widget_id) {
    if (!sync_.layout().find(widget_id)) {
        spdlog::debug("[EditModeController] open_settings: '{}' not found", widget_id);
        return;
    }
    if (open_settings_cb_) {
        open_settings_cb_(widget_id);
    }
}

} // namespace dashgrid
