// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widget_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <regex>
#include <type_traits>

using nlohmann::json;

namespace dashgrid {

namespace {

SettingField number(const char* key, const char* label, int min, int max, int def) {
    return {key, label, NumberSetting{min, max, def}};
}

SettingField boolean(const char* key, const char* label, bool def) {
    return {key, label, BooleanSetting{def}};
}

SettingField select(const char* key, const char* label, std::vector<std::string> options,
                    const char* def) {
    return {key, label, SelectSetting{std::move(options), def}};
}

SettingField text(const char* key, const char* label, const char* def) {
    return {key, label, TextSetting{def}};
}

std::vector<WidgetDef> build_widget_defs() {
    // Vector order defines the order shown in the add-widget picker.
    // clang-format off
    std::vector<WidgetDef> defs = {
        //                                                                                                                                                                 default  min     max
        {WidgetType::UpcomingAssessments, "upcoming_assessments", "Upcoming Assessments", "DocumentText",        "View your upcoming assignments and assessments",           "UpcomingAssessments",     {6, 4}, {4, 3}, {12, 6}},
        {WidgetType::MessagesPreview,     "messages_preview",     "Messages Preview",     "ChatBubbleLeftRight", "Preview your recent messages",                             "MessagesPreview",         {6, 4}, {4, 4}, {12, 10}},
        {WidgetType::TodaySchedule,       "today_schedule",       "Today's Schedule",     "CalendarDays",        "View your schedule for today",                             "TodaySchedule",           {12, 6}, {6, 5}, {12, 10}},
        {WidgetType::Shortcuts,           "shortcuts",            "Quick Links",          "Link",                "Access your favorite shortcuts",                           "ShortcutsWidget",         {12, 4}, {4, 3}, {12, 6}},
        {WidgetType::Notices,             "notices",              "Notices",              "Bell",                "View school notices and announcements",                    "NoticesPane",             {12, 5}, {6, 4}, {12, 10}},
        {WidgetType::News,                "news",                 "Recent News",          "Newspaper",           "Latest news and updates",                                  "RecentNews",              {12, 5}, {6, 4}, {12, 10}},
        {WidgetType::WelcomePortal,       "welcome_portal",       "Welcome Portal",       "GlobeAlt",            "Access portal links",                                      "WelcomePortal",           {12, 5}, {6, 4}, {12, 8}},
        {WidgetType::Homework,            "homework",             "Homework",             "BookOpen",            "View your homework assignments",                           "Homework",                {4, 5}, {3, 4}, {6, 8}},
        {WidgetType::TodoList,            "todo_list",            "Todo List",            "CheckCircle",         "Manage your tasks",                                        "TodoList",                {4, 5}, {3, 4}, {6, 8}},
        {WidgetType::FocusTimer,          "focus_timer",          "Focus Timer",          "Clock",               "Pomodoro-style focus timer",                               "FocusTimer",              {4, 5}, {3, 4}, {6, 8}},
        {WidgetType::GradeTrends,         "grade_trends",         "Grade Trends",         "ChartBar",            "Visualize your grade trends over time",                    "GradeTrendsWidget",       {6, 6}, {4, 5}, {12, 10}},
        {WidgetType::StudyTimeTracker,    "study_time_tracker",   "Study Time Tracker",   "AcademicCap",         "Track your study time per subject",                        "StudyTimeTrackerWidget",  {6, 6}, {4, 5}, {12, 10}},
        {WidgetType::DeadlinesCalendar,   "deadlines_calendar",   "Deadlines Calendar",   "Calendar",            "View upcoming assessment deadlines",                       "DeadlinesCalendarWidget", {6, 6}, {4, 5}, {12, 10}},
        {WidgetType::QuickNotes,          "quick_notes",          "Quick Notes",          "PencilSquare",        "Take quick notes",                                         "QuickNotesWidget",        {6, 6}, {4, 5}, {12, 10}},
        {WidgetType::Weather,             "weather",              "Weather",              "Cloud",               "Current weather and forecast",                             "WeatherWidget",           {4, 5}, {3, 4}, {6, 8}},
        {WidgetType::Timetable,           "timetable",            "Timetable",            "CalendarDays",        "View your weekly class schedule with multiple view modes", "TimetableWidget",         {12, 8}, {6, 6}, {12, 12}},
    };
    // clang-format on

    auto def_for = [&defs](WidgetType t) -> WidgetDef& {
        return defs[static_cast<size_t>(t)];
    };

    def_for(WidgetType::UpcomingAssessments).schema = {
        number("maxItems", "Maximum items to show", 3, 20, 10),
        boolean("showFilters", "Show subject filters", true),
    };
    def_for(WidgetType::MessagesPreview).schema = {
        number("maxItems", "Maximum messages to show", 3, 10, 5),
    };
    def_for(WidgetType::TodaySchedule).schema = {
        select("defaultView", "Default view", {"today", "week"}, "today"),
    };
    def_for(WidgetType::Notices).schema = {
        number("maxItems", "Maximum notices to show", 3, 10, 5),
    };
    def_for(WidgetType::News).schema = {
        number("maxItems", "Maximum news items to show", 3, 10, 5),
    };
    def_for(WidgetType::StudyTimeTracker).schema = {
        select("timePeriod", "Time period", {"day", "week", "month"}, "week"),
        number("goalHours", "Goal hours per week", 1, 100, 20),
    };
    def_for(WidgetType::DeadlinesCalendar).schema = {
        select("daysToShow", "Days to show", {"7", "14", "30"}, "14"),
        boolean("showCompleted", "Show completed assessments", false),
    };
    def_for(WidgetType::QuickNotes).schema = {
        number("fontSize", "Font size", 10, 24, 14),
        boolean("autoSave", "Auto-save", true),
    };
    def_for(WidgetType::Weather).schema = {
        text("location", "Location", ""),
        select("units", "Temperature units", {"celsius", "fahrenheit"}, "celsius"),
        boolean("showForecast", "Show forecast", true),
    };

    auto& timetable = def_for(WidgetType::Timetable);
    timetable.default_settings = {
        {"viewMode", "week"},
        {"timeRange", {{"start", "08:00"}, {"end", "16:00"}}},
        {"showTeacher", true},
        {"showRoom", true},
        {"showAttendance", true},
        {"showEmptyPeriods", false},
        {"density", "normal"},
        {"defaultView", "week"},
    };
    timetable.schema = {
        select("viewMode", "Default view mode", {"week", "day", "month", "list"}, "week"),
        boolean("showTeacher", "Show teacher names", true),
        boolean("showRoom", "Show room numbers", true),
        boolean("showAttendance", "Show attendance status", true),
        select("density", "Display density", {"compact", "normal", "comfortable"}, "normal"),
    };

    return defs;
}

json default_value_of(const SettingKind& kind) {
    return std::visit([](const auto& field) -> json { return field.default_value; }, kind);
}

} // namespace

const std::vector<WidgetDef>& get_all_widget_defs() {
    static const std::vector<WidgetDef> s_widget_defs = build_widget_defs();
    return s_widget_defs;
}

const WidgetDef* find_widget_def(WidgetType type) {
    const auto& defs = get_all_widget_defs();
    auto it = std::find_if(defs.begin(), defs.end(),
                           [type](const WidgetDef& def) { return def.type == type; });
    return it != defs.end() ? &*it : nullptr;
}

const WidgetDef* find_widget_def(std::string_view id) {
    const auto& defs = get_all_widget_defs();
    auto it = std::find_if(defs.begin(), defs.end(),
                           [&id](const WidgetDef& def) { return id == def.id; });
    return it != defs.end() ? &*it : nullptr;
}

size_t widget_def_count() {
    return get_all_widget_defs().size();
}

std::vector<WidgetType> list_widget_types() {
    std::vector<WidgetType> types;
    for (const auto& def : get_all_widget_defs()) {
        types.push_back(def.type);
    }
    return types;
}

std::optional<WidgetType> widget_type_from_string(std::string_view id) {
    if (const auto* def = find_widget_def(id)) {
        return def->type;
    }
    return std::nullopt;
}

const char* to_string(WidgetType type) {
    const auto* def = find_widget_def(type);
    return def ? def->id : "unknown";
}

json default_settings_for(const WidgetDef& def) {
    json settings = json::object();
    for (const auto& field : def.schema) {
        settings[field.key] = default_value_of(field.kind);
    }
    if (def.default_settings.is_object()) {
        settings.update(def.default_settings);
    }
    return settings;
}

json sanitize_settings(const WidgetDef& def, const json& settings) {
    json out = settings.is_object() ? settings : json::object();

    for (const auto& field : def.schema) {
        auto it = out.find(field.key);
        if (it == out.end()) {
            continue;
        }
        json& value = *it;

        std::visit(
            [&](const auto& kind) {
                using T = std::decay_t<decltype(kind)>;
                bool valid = true;
                if constexpr (std::is_same_v<T, NumberSetting>) {
                    if (!value.is_number()) {
                        valid = false;
                    } else {
                        // Clamp in the stored type before narrowing to int
                        int clamped;
                        bool exact;
                        if (value.is_number_unsigned()) {
                            uint64_t v = value.get<uint64_t>();
                            clamped = v > static_cast<uint64_t>(std::max(kind.max, 0))
                                          ? kind.max
                                          : std::clamp(static_cast<int>(v), kind.min, kind.max);
                            exact = static_cast<uint64_t>(clamped) == v;
                        } else if (value.is_number_integer()) {
                            int64_t v = value.get<int64_t>();
                            clamped = static_cast<int>(std::clamp<int64_t>(v, kind.min, kind.max));
                            exact = clamped == v;
                        } else {
                            double v = value.get<double>();
                            clamped = std::isfinite(v)
                                          ? static_cast<int>(std::clamp<double>(
                                                std::trunc(v), kind.min, kind.max))
                                          : kind.default_value;
                            exact = false;
                        }
                        if (!exact) {
                            spdlog::debug("[WidgetRegistry] {}.{}: clamped {} to {}", def.id,
                                          field.key, dump_json(value), clamped);
                        }
                        value = clamped;
                    }
                } else if constexpr (std::is_same_v<T, BooleanSetting>) {
                    valid = value.is_boolean();
                } else if constexpr (std::is_same_v<T, SelectSetting>) {
                    valid = value.is_string() &&
                            std::find(kind.options.begin(), kind.options.end(),
                                      value.get<std::string>()) != kind.options.end();
                } else if constexpr (std::is_same_v<T, TextSetting>) {
                    valid = value.is_string();
                } else if constexpr (std::is_same_v<T, ColorSetting>) {
                    static const std::regex hex_color("^#[0-9a-fA-F]{6}$");
                    valid = value.is_string() &&
                            std::regex_match(value.get<std::string>(), hex_color);
                }
                if (!valid) {
                    spdlog::debug("[WidgetRegistry] {}.{}: invalid value {}, using default",
                                  def.id, field.key, dump_json(value));
                    value = kind.default_value;
                }
            },
            field.kind);
    }
    return out;
}

WidgetConfig make_widget_config(const WidgetDef& def, std::string id, int x, int y, int w, int h) {
    WidgetConfig widget;
    widget.id = std::move(id);
    widget.type = def.id;
    widget.position = def.bounds();
    widget.position.x = x;
    widget.position.y = y;
    widget.position.w = w;
    widget.position.h = h;
    widget.settings = default_settings_for(def);
    return widget;
}

} // namespace dashgrid
