// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "template_engine.h"

#include "grid_synchronizer.h"
#include "layout_persistence.h"
#include "widget_registry.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>

namespace dashgrid {

namespace {

struct SeedWidget {
    const char* type;
    int x, y, w, h;
};

WidgetTemplate make_seed(const char* id, const char* name, const char* description,
                         std::initializer_list<SeedWidget> widgets) {
    WidgetTemplate t;
    t.id = id;
    t.name = name;
    t.description = description;
    for (const auto& s : widgets) {
        if (const auto* def = find_widget_def(std::string_view(s.type))) {
            t.layout.widgets.push_back(make_widget_config(*def, s.type, s.x, s.y, s.w, s.h));
        }
    }
    t.layout.version = CURRENT_LAYOUT_VERSION;
    t.layout.last_modified = std::chrono::system_clock::now();
    return t;
}

std::vector<WidgetTemplate> build_seed_templates() {
    std::vector<WidgetTemplate> seeds;
    // clang-format off
    seeds.push_back(make_seed("student_focus", "Student Focus", "Assessments, Schedule, and Todo list", {
        {"upcoming_assessments", 0, 0, 6, 5},
        {"today_schedule",       6, 0, 6, 6},
        {"todo_list",            0, 5, 4, 5},
        {"messages_preview",     4, 5, 8, 5},
    }));
    seeds.push_back(make_seed("analytics", "Analytics Dashboard", "Grade trends, Study time, and Performance", {
        {"grade_trends",         0, 0, 8, 6},
        {"study_time_tracker",   8, 0, 4, 6},
        {"deadlines_calendar",   0, 6, 6, 6},
        {"upcoming_assessments", 6, 6, 6, 6},
    }));
    seeds.push_back(make_seed("quick_access", "Quick Access", "Shortcuts, Notes, and Weather", {
        {"shortcuts",            0, 0, 8, 4},
        {"weather",              8, 0, 4, 5},
        {"quick_notes",          0, 4, 6, 6},
        {"messages_preview",     6, 5, 6, 6},
    }));
    seeds.push_back(make_seed("productivity_hub", "Productivity Hub", "Focus Timer, Todo List, Quick Notes, and Study Tracker", {
        {"focus_timer",          0, 0, 4, 5},
        {"todo_list",            4, 0, 4, 5},
        {"study_time_tracker",   8, 0, 4, 5},
        {"quick_notes",          0, 5, 12, 6},
    }));
    seeds.push_back(make_seed("academic_overview", "Academic Overview", "Grade Trends, Assessments, Deadlines, and Schedule", {
        {"grade_trends",         0, 0, 6, 6},
        {"upcoming_assessments", 6, 0, 6, 6},
        {"deadlines_calendar",   0, 6, 6, 6},
        {"today_schedule",       6, 6, 6, 6},
    }));
    seeds.push_back(make_seed("minimalist", "Minimalist", "Clean, simple layout with Schedule, Shortcuts, and Notes", {
        {"today_schedule",       0, 0, 12, 6},
        {"shortcuts",            0, 6, 6, 4},
        {"quick_notes",          6, 6, 6, 6},
    }));
    // clang-format on

    WidgetTemplate complete;
    complete.id = "complete";
    complete.name = "Complete";
    complete.description = "All widgets enabled";
    complete.layout = LayoutPersistence::get_default_layout();
    complete.is_default = true;
    seeds.push_back(std::move(complete));

    for (auto& seed : seeds) {
        seed.layout = LayoutPersistence::normalize_layout(std::move(seed.layout));
    }
    return seeds;
}

bool is_seed_id(const std::string& id) {
    const auto& seeds = TemplateEngine::seed_templates();
    return std::any_of(seeds.begin(), seeds.end(),
                       [&id](const WidgetTemplate& t) { return t.id == id; });
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

TemplateEngine::TemplateEngine(LayoutPersistence& persistence, GridSynchronizer& sync)
    : persistence_(persistence), sync_(sync) {}

const std::vector<WidgetTemplate>& TemplateEngine::seed_templates() {
    static const std::vector<WidgetTemplate> s_seeds = build_seed_templates();
    return s_seeds;
}

void TemplateEngine::ensure_loaded() {
    if (loaded_) {
        return;
    }
    user_templates_.clear();
    for (auto& t : persistence_.load_user_templates()) {
        if (is_seed_id(t.id)) {
            spdlog::debug("[TemplateEngine] Ignoring stored template shadowing built-in '{}'",
                          t.id);
            continue;
        }
        t.is_default = false;
        user_templates_.push_back(std::move(t));
    }
    loaded_ = true;
    spdlog::debug("[TemplateEngine] Loaded {} user templates", user_templates_.size());
}

std::vector<WidgetTemplate> TemplateEngine::list_templates() {
    ensure_loaded();
    std::vector<WidgetTemplate> all = seed_templates();
    all.insert(all.end(), user_templates_.begin(), user_templates_.end());
    return all;
}

std::optional<WidgetTemplate> TemplateEngine::find_template(const std::string& id) {
    for (auto& t : list_templates()) {
        if (t.id == id) {
            return t;
        }
    }
    return std::nullopt;
}

std::string TemplateEngine::make_template_id() const {
    using namespace std::chrono;
    auto millis =
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    std::string id = fmt::format("custom_{}", millis);
    // Two saves within the same millisecond
    int suffix = 1;
    auto taken = [this](const std::string& candidate) {
        return std::any_of(user_templates_.begin(), user_templates_.end(),
                           [&candidate](const WidgetTemplate& t) { return t.id == candidate; });
    };
    std::string candidate = id;
    while (taken(candidate)) {
        candidate = fmt::format("{}_{}", id, suffix++);
    }
    return candidate;
}

TemplateResult TemplateEngine::save_current_as_template(const std::string& name,
                                                        const std::string& description) {
    if (is_blank(name)) {
        return {false, "Template name is required", {}};
    }
    ensure_loaded();

    WidgetTemplate t;
    t.id = make_template_id();
    t.name = name;
    t.description = description;
    t.layout = sync_.layout();
    t.is_default = false;
    return save_template(std::move(t));
}

TemplateResult TemplateEngine::save_template(WidgetTemplate tmpl) {
    if (tmpl.id.empty()) {
        return {false, "Template id is required", {}};
    }
    if (is_seed_id(tmpl.id)) {
        spdlog::warn("[TemplateEngine] Refusing to overwrite built-in template '{}'", tmpl.id);
        return {false, "Built-in templates cannot be modified", tmpl.id};
    }
    ensure_loaded();

    tmpl.is_default = false;
    auto previous = user_templates_;
    auto it = std::find_if(user_templates_.begin(), user_templates_.end(),
                           [&tmpl](const WidgetTemplate& t) { return t.id == tmpl.id; });
    std::string id = tmpl.id;
    if (it != user_templates_.end()) {
        *it = std::move(tmpl);
    } else {
        user_templates_.push_back(std::move(tmpl));
    }

    if (!persistence_.save_user_templates(user_templates_)) {
        user_templates_ = std::move(previous);
        return {false, "Failed to save template", id};
    }
    spdlog::info("[TemplateEngine] Saved template '{}'", id);
    return {true, {}, id};
}

TemplateResult TemplateEngine::apply_template(const std::string& id) {
    auto tmpl = find_template(id);
    if (!tmpl) {
        spdlog::warn("[TemplateEngine] Template not found: {}", id);
        return {false, "Template not found", id};
    }

    auto normalized = LayoutPersistence::normalize_layout(std::move(tmpl->layout));
    // A failed write is logged by the persistence layer; the board still shows the template
    sync_.replace_widgets(std::move(normalized.widgets));
    sync_.scroll_to_top();

    spdlog::info("[TemplateEngine] Applied template '{}' ({} widgets)", id,
                 sync_.layout().widgets.size());
    return {true, {}, id};
}

TemplateResult TemplateEngine::delete_template(const std::string& id) {
    for (const auto& seed : seed_templates()) {
        if (seed.id != id) {
            continue;
        }
        if (seed.is_default) {
            spdlog::warn("[TemplateEngine] Refusing to delete default template '{}'", id);
            return {false, "Default templates cannot be deleted", id};
        }
        return {false, "Built-in templates cannot be deleted", id};
    }

    ensure_loaded();
    auto it = std::find_if(user_templates_.begin(), user_templates_.end(),
                           [&id](const WidgetTemplate& t) { return t.id == id; });
    if (it == user_templates_.end()) {
        return {false, "Template not found", id};
    }

    auto previous = user_templates_;
    user_templates_.erase(it);
    if (!persistence_.save_user_templates(user_templates_)) {
        user_templates_ = std::move(previous);
        return {false, "Failed to delete template", id};
    }
    spdlog::info("[TemplateEngine] Deleted template '{}'", id);
    return {true, {}, id};
}

} // namespace dashgrid
