// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_persistence.h"

#include "grid_layout.h"
#include "widget_registry.h"

#include <spdlog/spdlog.h>

#include <set>

using nlohmann::json;

namespace dashgrid {

LayoutPersistence::LayoutPersistence(LayoutStorage& storage) : storage_(storage) {}

WidgetLayout LayoutPersistence::get_default_layout() {
    struct Anchor {
        const char* type;
        int x, y, w, h;
    };
    // clang-format off
    static const Anchor anchors[] = {
        {"upcoming_assessments", 0, 0,  6,  4},
        {"messages_preview",     6, 0,  6,  4},
        {"today_schedule",       0, 4,  12, 5},
        {"notices",              0, 9,  12, 4},
        {"shortcuts",            0, 13, 12, 4},
        {"news",                 0, 17, 12, 4},
        {"welcome_portal",       0, 21, 12, 4},
        {"homework",             0, 25, 4,  4},
        {"todo_list",            4, 25, 4,  4},
        {"focus_timer",          8, 25, 4,  4},
    };
    // clang-format on

    WidgetLayout layout;
    for (const auto& a : anchors) {
        const auto* def = find_widget_def(std::string_view(a.type));
        if (!def) {
            continue;
        }
        layout.widgets.push_back(make_widget_config(*def, a.type, a.x, a.y, a.w, a.h));
    }
    layout.version = CURRENT_LAYOUT_VERSION;
    layout.last_modified = std::chrono::system_clock::now();
    return layout;
}

WidgetLayout LayoutPersistence::normalize_layout(WidgetLayout layout, bool* changed) {
    bool dirty = false;
    std::set<std::string> seen;
    std::vector<WidgetConfig> out;
    out.reserve(layout.widgets.size());

    for (auto& w : layout.widgets) {
        if (!seen.insert(w.id).second) {
            spdlog::debug("[LayoutPersistence] Skipping duplicate widget ID: {}", w.id);
            dirty = true;
            continue;
        }

        WidgetConfig fixed = w;
        const auto* def = find_widget_def(std::string_view(fixed.type));
        if (def) {
            auto& p = fixed.position;
            if (p.min_w <= 0)
                p.min_w = def->min_size.w;
            if (p.min_h <= 0)
                p.min_h = def->min_size.h;
            if (p.max_w <= 0)
                p.max_w = def->max_size.w;
            if (p.max_h <= 0)
                p.max_h = def->max_size.h;

            json settings = default_settings_for(*def);
            if (fixed.settings.is_object()) {
                settings.update(fixed.settings);
            }
            fixed.settings = sanitize_settings(*def, settings);
        } else {
            spdlog::debug("[LayoutPersistence] Keeping widget '{}' of unknown type '{}'", w.id,
                          w.type);
        }

        GridRect r = snap_rect(rect_of(fixed.position), fixed.position);
        fixed.position.x = r.x;
        fixed.position.y = r.y;
        fixed.position.w = r.w;
        fixed.position.h = r.h;

        if (fixed != w) {
            spdlog::debug("[LayoutPersistence] Normalized widget '{}'", w.id);
            dirty = true;
        }
        out.push_back(std::move(fixed));
    }

    // Overlap at rest: later enabled widgets yield downward in document order
    std::vector<const WidgetConfig*> placed;
    for (auto& w : out) {
        if (!w.enabled) {
            continue;
        }
        bool moved = true;
        while (moved) {
            moved = false;
            for (const auto* other : placed) {
                if (rects_overlap(rect_of(w.position), rect_of(other->position))) {
                    w.position.y = other->position.y + other->position.h;
                    moved = true;
                    dirty = true;
                }
            }
        }
        placed.push_back(&w);
    }

    if (layout.version != CURRENT_LAYOUT_VERSION) {
        spdlog::info("[LayoutPersistence] Migrating layout version {} -> {}", layout.version,
                     CURRENT_LAYOUT_VERSION);
        layout.version = CURRENT_LAYOUT_VERSION;
        dirty = true;
    }

    layout.widgets = std::move(out);
    if (changed) {
        *changed = dirty;
    }
    return layout;
}

WidgetLayout LayoutPersistence::load() {
    auto bytes = storage_.read(LAYOUT_STORAGE_KEY);
    if (!bytes) {
        spdlog::info("[LayoutPersistence] No saved layout, creating default layout");
        auto layout = get_default_layout();
        save(layout);
        return layout;
    }

    json doc = json::parse(*bytes, nullptr, false);
    if (doc.is_discarded()) {
        spdlog::warn("[LayoutPersistence] Stored layout is not valid JSON, using default layout");
        return get_default_layout();
    }

    size_t dropped = 0;
    auto parsed = parse_layout(doc, &dropped);
    if (!parsed) {
        spdlog::warn("[LayoutPersistence] Stored layout has no widget list, using default layout");
        return get_default_layout();
    }

    if (parsed->widgets.empty()) {
        if (dropped > 0) {
            spdlog::warn("[LayoutPersistence] All {} stored widgets were malformed, using default "
                         "layout",
                         dropped);
            return get_default_layout();
        }
        spdlog::info("[LayoutPersistence] Saved layout is empty, creating default layout");
        auto layout = get_default_layout();
        save(layout);
        return layout;
    }

    if (dropped > 0) {
        spdlog::warn("[LayoutPersistence] Removed {} invalid widgets from stored layout", dropped);
    }

    bool changed = false;
    auto layout = normalize_layout(std::move(*parsed), &changed);
    if (changed || dropped > 0) {
        save(layout);
    }
    spdlog::debug("[LayoutPersistence] Loaded {} widgets (version {})", layout.widgets.size(),
                  layout.version);
    return layout;
}

bool LayoutPersistence::save(const WidgetLayout& layout) {
    json doc = layout;
    if (!storage_.write(LAYOUT_STORAGE_KEY, dump_json(doc))) {
        spdlog::error("[LayoutPersistence] Failed to save layout ({} widgets)",
                      layout.widgets.size());
        return false;
    }
    spdlog::debug("[LayoutPersistence] Saved layout ({} widgets)", layout.widgets.size());
    return true;
}

std::vector<WidgetTemplate> LayoutPersistence::load_user_templates() {
    std::vector<WidgetTemplate> templates;
    auto bytes = storage_.read(TEMPLATES_STORAGE_KEY);
    if (!bytes) {
        return templates;
    }

    json doc = json::parse(*bytes, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        spdlog::warn("[LayoutPersistence] Stored templates are unreadable, ignoring them");
        return templates;
    }

    for (const auto& item : doc) {
        auto t = parse_template(item);
        if (!t) {
            spdlog::debug("[LayoutPersistence] Skipping malformed template entry");
            continue;
        }
        templates.push_back(std::move(*t));
    }
    return templates;
}

bool LayoutPersistence::save_user_templates(const std::vector<WidgetTemplate>& templates) {
    json doc = json::array();
    for (const auto& t : templates) {
        doc.push_back(t);
    }
    if (!storage_.write(TEMPLATES_STORAGE_KEY, dump_json(doc))) {
        spdlog::error("[LayoutPersistence] Failed to save {} templates", templates.size());
        return false;
    }
    return true;
}

} // namespace dashgrid
