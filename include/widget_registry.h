// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "widget_layout.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dashgrid {

/// Closed set of panel types the dashboard knows how to render.
enum class WidgetType {
    UpcomingAssessments,
    MessagesPreview,
    TodaySchedule,
    Shortcuts,
    Notices,
    News,
    WelcomePortal,
    Homework,
    TodoList,
    FocusTimer,
    GradeTrends,
    StudyTimeTracker,
    DeadlinesCalendar,
    QuickNotes,
    Weather,
    Timetable,
};

struct WidgetSize {
    int w = 0;
    int h = 0;
};

// Settings schema field payloads
struct NumberSetting {
    int min = 0;
    int max = 0;
    int default_value = 0;
};

struct BooleanSetting {
    bool default_value = false;
};

struct SelectSetting {
    std::vector<std::string> options;
    std::string default_value;
};

struct TextSetting {
    std::string default_value;
};

struct ColorSetting {
    std::string default_value; // "#rrggbb"
};

using SettingKind =
    std::variant<NumberSetting, BooleanSetting, SelectSetting, TextSetting, ColorSetting>;

struct SettingField {
    std::string key;
    std::string label;
    SettingKind kind;
};

struct WidgetDef {
    WidgetType type;
    const char* id;           // Stable string stored in layout documents
    const char* display_name; // For the add-widget picker
    const char* icon;         // Icon name
    const char* description;  // Short description for the picker
    const char* render_unit;  // Content component the host renders inside the card
    WidgetSize default_size;
    WidgetSize min_size;
    WidgetSize max_size;
    nlohmann::json default_settings = nlohmann::json::object(); // Overrides schema defaults
    std::vector<SettingField> schema;

    /// Position carrying this type's min/max bounds (x/y/w/h zero)
    WidgetPosition bounds() const {
        WidgetPosition p;
        p.min_w = min_size.w;
        p.min_h = min_size.h;
        p.max_w = max_size.w;
        p.max_h = max_size.h;
        return p;
    }
    bool is_scalable() const {
        return max_size.w > min_size.w || max_size.h > min_size.h;
    }
};

const std::vector<WidgetDef>& get_all_widget_defs();
const WidgetDef* find_widget_def(WidgetType type);
const WidgetDef* find_widget_def(std::string_view id);
size_t widget_def_count();

/// All known types, in picker order
std::vector<WidgetType> list_widget_types();

std::optional<WidgetType> widget_type_from_string(std::string_view id);
const char* to_string(WidgetType type);

/// Schema defaults overlaid by the definition's explicit default_settings
nlohmann::json default_settings_for(const WidgetDef& def);

/**
 * @brief Validate a settings object against the definition's schema
 *
 * Numbers are clamped into range, select values outside the option list and
 * values of the wrong JSON type are replaced by the field default. Keys the
 * schema does not describe are passed through untouched.
 */
nlohmann::json sanitize_settings(const WidgetDef& def, const nlohmann::json& settings);

/// New enabled instance of @p def at the given cell rectangle, with registry bounds and default settings
WidgetConfig make_widget_config(const WidgetDef& def, std::string id, int x, int y, int w, int h);

} // namespace dashgrid
