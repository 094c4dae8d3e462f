// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_synchronizer.h"

#include "grid_layout.h"
#include "widget_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dashgrid {

GridSynchronizer::GridSynchronizer(GridSurface& surface, LayoutPersistence& persistence,
                                   uint32_t save_debounce_ms)
    : surface_(surface), persistence_(persistence),
      save_timer_(save_debounce_ms, [this]() { write_layout(); }) {
    surface_.set_change_listener(
        [this](const std::vector<SurfaceItem>& items) { on_surface_change(items); });
}

GridSynchronizer::~GridSynchronizer() {
    surface_.set_change_listener(nullptr);
    if (save_timer_.pending() || unsaved_) {
        spdlog::debug("[GridSynchronizer] Final save of unsaved changes");
        flush_pending_save();
    }
}

void GridSynchronizer::mount() {
    layout_ = persistence_.load();
    spdlog::debug("[GridSynchronizer] Mounted layout with {} widgets", layout_.widgets.size());
    reconcile();
}

void GridSynchronizer::set_layout(WidgetLayout layout) {
    save_timer_.cancel();
    unsaved_ = false;
    layout_ = std::move(layout);
    reconcile();
}

// ---------------------------------------------------------------------------
// Push: model -> surface
// ---------------------------------------------------------------------------

void GridSynchronizer::reconcile() {
    if (bulk_load_) {
        spdlog::debug("[GridSynchronizer] Reconcile requested during a pass, deferring");
        reconcile_requested_ = true;
        return;
    }
    do {
        reconcile_requested_ = false;
        reconcile_pass();
    } while (reconcile_requested_);
}

void GridSynchronizer::reconcile_pass() {
    bulk_load_ = true;

    auto enabled = layout_.enabled_ids();
    std::set<std::string> new_ids(enabled.begin(), enabled.end());

    for (const auto& id : surface_.element_ids()) {
        if (new_ids.count(id) == 0) {
            surface_.detach(id);
        }
    }

    size_t attached = 0;
    for (const auto& widget : layout_.widgets) {
        if (!widget.enabled) {
            continue;
        }
        GridRect rect = rect_of(widget.position);
        bool truly_new = previous_widget_ids_.count(widget.id) == 0;

        if (truly_new) {
            // The surface may have picked the element up on its own at a default
            // position; start it over so the stored geometry wins
            if (surface_.has_element(widget.id)) {
                spdlog::debug("[GridSynchronizer] '{}' already on surface, re-attaching",
                              widget.id);
                surface_.detach(widget.id);
            }
            surface_.attach(element_for(widget), rect);
            ++attached;
        } else if (surface_.has_element(widget.id)) {
            surface_.update(widget.id, rect);
        } else {
            surface_.attach(element_for(widget), rect);
            ++attached;
        }
    }

    surface_.settle();
    bulk_load_ = false;
    previous_widget_ids_ = std::move(new_ids);

    spdlog::debug("[GridSynchronizer] Reconciled {} widgets ({} attached)",
                  previous_widget_ids_.size(), attached);
}

PanelElement GridSynchronizer::element_for(const WidgetConfig& widget) const {
    PanelElement el;
    el.id = widget.id;
    el.type = widget.type;
    el.bounds = widget.position;

    const auto* def = find_widget_def(std::string_view(widget.type));
    if (!def) {
        spdlog::warn("[GridSynchronizer] Unknown widget type '{}' for '{}', showing placeholder",
                     widget.type, widget.id);
        el.placeholder = true;
        el.title = widget.title.value_or(widget.type);
        return el;
    }
    el.title = widget.title.value_or(def->display_name);
    el.render_unit = def->render_unit;
    return el;
}

// ---------------------------------------------------------------------------
// Pull: surface -> model
// ---------------------------------------------------------------------------

void GridSynchronizer::on_surface_change(const std::vector<SurfaceItem>& items) {
    if (bulk_load_) {
        spdlog::trace("[GridSynchronizer] Ignoring {} surface changes during bulk load",
                      items.size());
        return;
    }

    bool changed = false;
    std::vector<std::pair<std::string, GridRect>> corrections;

    for (const auto& item : items) {
        WidgetConfig* widget = layout_.find(item.id);
        if (!widget || !widget->enabled) {
            spdlog::debug("[GridSynchronizer] Ignoring change for unknown widget '{}'", item.id);
            continue;
        }

        GridRect reported{item.x, item.y, item.w, item.h};
        GridRect snapped = snap_rect(reported, widget->position);
        if (snapped != reported) {
            corrections.emplace_back(item.id, snapped);
        }
        if (snapped == rect_of(widget->position)) {
            continue;
        }

        spdlog::debug("[GridSynchronizer] '{}' moved to ({},{}) {}x{}", item.id, snapped.x,
                      snapped.y, snapped.w, snapped.h);
        widget->position.x = snapped.x;
        widget->position.y = snapped.y;
        widget->position.w = snapped.w;
        widget->position.h = snapped.h;
        changed = true;
    }

    // Push snapped geometry back so the surface shows what was committed
    if (!corrections.empty()) {
        bulk_load_ = true;
        for (const auto& [id, rect] : corrections) {
            surface_.update(id, rect);
        }
        bulk_load_ = false;
    }

    if (changed) {
        layout_.touch();
        schedule_save();
    }
}

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

bool GridSynchronizer::append_widget(WidgetConfig widget) {
    if (layout_.find(widget.id)) {
        spdlog::warn("[GridSynchronizer] Widget id '{}' already in layout", widget.id);
        return false;
    }
    spdlog::debug("[GridSynchronizer] Adding '{}' ({})", widget.id, widget.type);
    layout_.widgets.push_back(std::move(widget));
    layout_.touch();
    reconcile();
    persist_now();
    return true;
}

bool GridSynchronizer::remove_widget(const std::string& id) {
    auto it = std::find_if(layout_.widgets.begin(), layout_.widgets.end(),
                           [&id](const WidgetConfig& w) { return w.id == id; });
    if (it == layout_.widgets.end()) {
        spdlog::debug("[GridSynchronizer] remove_widget: '{}' not found", id);
        return false;
    }
    layout_.widgets.erase(it);
    layout_.touch();
    reconcile();
    persist_now();
    spdlog::debug("[GridSynchronizer] Removed '{}'", id);
    return true;
}

bool GridSynchronizer::update_widget_settings(const std::string& id,
                                              const nlohmann::json& settings) {
    WidgetConfig* widget = layout_.find(id);
    if (!widget) {
        spdlog::debug("[GridSynchronizer] update_widget_settings: '{}' not found", id);
        return false;
    }
    if (const auto* def = find_widget_def(std::string_view(widget->type))) {
        widget->settings = sanitize_settings(*def, settings);
    } else {
        widget->settings = settings.is_object() ? settings : nlohmann::json::object();
    }
    layout_.touch();
    reconcile();
    persist_now();
    return true;
}

bool GridSynchronizer::set_widget_enabled(const std::string& id, bool enabled) {
    WidgetConfig* widget = layout_.find(id);
    if (!widget) {
        return false;
    }
    if (widget->enabled == enabled) {
        return true;
    }
    widget->enabled = enabled;
    layout_.touch();
    reconcile();
    persist_now();
    return true;
}

bool GridSynchronizer::replace_widgets(std::vector<WidgetConfig> widgets) {
    save_timer_.cancel();
    layout_.widgets = std::move(widgets);
    layout_.version = CURRENT_LAYOUT_VERSION;
    layout_.touch();
    reconcile();
    return persist_now();
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

void GridSynchronizer::schedule_save() {
    save_timer_.trigger();
}

bool GridSynchronizer::persist_now() {
    save_timer_.cancel();
    return write_layout();
}

void GridSynchronizer::flush_pending_save() {
    if (save_timer_.flush()) {
        return;
    }
    if (unsaved_) {
        spdlog::info("[GridSynchronizer] Retrying failed layout save");
        write_layout();
    }
}

bool GridSynchronizer::write_layout() {
    // A failed write keeps the live layout authoritative until a later write succeeds
    unsaved_ = !persistence_.save(layout_);
    return !unsaved_;
}

// ---------------------------------------------------------------------------
// Surface pass-throughs
// ---------------------------------------------------------------------------

void GridSynchronizer::set_interactive(bool enabled) {
    surface_.set_interactive(enabled);
}

bool GridSynchronizer::is_interactive() const {
    return surface_.is_interactive();
}

void GridSynchronizer::scroll_to_top() {
    surface_.scroll_to_top();
}

void GridSynchronizer::scroll_to(const std::string& id) {
    surface_.scroll_to(id);
}

} // namespace dashgrid
