// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dashboard_settings.h"
#include "grid_surface.h"
#include "layout_persistence.h"
#include "ui_debounce_timer.h"
#include "widget_layout.h"

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <vector>

namespace dashgrid {

/**
 * @brief Keeps the live WidgetLayout and a GridSurface consistent
 *
 * Two directional channels:
 *  - push (model -> surface): reconcile() attaches, updates and detaches
 *    elements. It runs with the bulk-load gate closed so that change events
 *    the surface fires as a side effect are dropped.
 *  - pull (surface -> model): on_surface_change() is the only path by which
 *    user drags and resizes reach the model. Geometry is snapped, compared
 *    and, if different, written and persisted after a debounce.
 *
 * Membership and settings changes are written immediately; geometry changes
 * are coalesced into one write per quiet period. After a failed write the
 * layout is written again by flush_pending_save() and on destruction.
 *
 * Thread safety: Single-threaded, main LVGL thread only.
 */
class GridSynchronizer {
  public:
    GridSynchronizer(GridSurface& surface, LayoutPersistence& persistence,
                     uint32_t save_debounce_ms = DashboardSettings::DEFAULT_SAVE_DEBOUNCE_MS);
    ~GridSynchronizer();

    GridSynchronizer(const GridSynchronizer&) = delete;
    GridSynchronizer& operator=(const GridSynchronizer&) = delete;

    /// Load the stored layout and render it
    void mount();

    /// Replace the live document (no write) and render it
    void set_layout(WidgetLayout layout);

    const WidgetLayout& layout() const {
        return layout_;
    }

    /**
     * @brief Make the surface's elements match the enabled widgets
     *
     * Passes never overlap: a call made while one is in flight is deferred
     * and run right after it.
     */
    void reconcile();

    /// Surface change stream. Ignored while a reconcile pass is in flight.
    void on_surface_change(const std::vector<SurfaceItem>& items);

    // Membership and settings. Each reconciles and saves immediately.
    bool append_widget(WidgetConfig widget);
    bool remove_widget(const std::string& id);
    bool update_widget_settings(const std::string& id, const nlohmann::json& settings);
    bool set_widget_enabled(const std::string& id, bool enabled);

    /// Replace all widgets at once (template apply, reset). Reconciles and saves.
    bool replace_widgets(std::vector<WidgetConfig> widgets);

    void set_interactive(bool enabled);
    bool is_interactive() const;

    /// Write the live layout now, dropping any pending debounced write
    bool persist_now();

    /// Run a pending debounced write immediately, or retry the last failed one
    void flush_pending_save();

    /// True while the most recent write failed and nothing has succeeded since
    bool has_unsaved_changes() const {
        return unsaved_;
    }

    bool is_bulk_load() const {
        return bulk_load_;
    }
    bool save_pending() const {
        return save_timer_.pending();
    }

    void scroll_to_top();
    void scroll_to(const std::string& id);

  private:
    void reconcile_pass();
    void schedule_save();
    bool write_layout();
    PanelElement element_for(const WidgetConfig& widget) const;

    GridSurface& surface_;
    LayoutPersistence& persistence_;
    WidgetLayout layout_;

    bool bulk_load_ = false;
    bool reconcile_requested_ = false;
    bool unsaved_ = false;
    std::set<std::string> previous_widget_ids_;

    ui::DebounceTimer save_timer_;
};

} // namespace dashgrid
