// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "dashboard_settings.h"
#include "template_engine.h"
#include "widget_registry.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dashgrid {

class GridSynchronizer;

/// Host-facing entry point for the dashboard: edit mode, add/remove/reset and templates.
/// Holds no geometry of its own; every change goes through the GridSynchronizer.
class EditModeController {
  public:
    using OpenTemplatesCallback = std::function<void()>;
    using OpenSettingsCallback = std::function<void(const std::string& widget_id)>;
    /**
     * Ask the user to confirm @p message, then call @p on_result with the answer.
     * @p on_result refers to this controller: the dialog holding it must be
     * closed, or must drop it without calling, before the controller is destroyed.
     */
    using ConfirmCallback =
        std::function<void(const std::string& message, std::function<void(bool)> on_result)>;

    EditModeController(GridSynchronizer& sync, TemplateEngine& templates,
                       DashboardSettings settings = {});

    bool is_editing() const {
        return editing_;
    }

    /// Enable/disable drag and resize. Leaving edit mode writes pending changes.
    void set_editing(bool editing);
    void toggle_editing() {
        set_editing(!editing_);
    }

    /// Re-read the layout from storage and re-render, optionally scrolling to one widget
    void reload_layout(const std::string& focus_widget_id = {});

    /**
     * @brief Add a widget of @p type at the first free slot and scroll to it
     * @return the new widget id, or an empty string for an unknown type
     */
    std::string add_widget(WidgetType type);
    std::string add_widget(std::string_view type);

    bool remove_widget(const std::string& id);
    bool update_widget_settings(const std::string& id, const nlohmann::json& settings);
    bool set_widget_enabled(const std::string& id, bool enabled);

    /// Reset behind the confirm callback (resets at once if none is set).
    /// The continuation captures this controller; see ConfirmCallback.
    void request_reset();

    /// Replace the board with the default layout and scroll to the top
    void reset_layout();

    // Templates
    std::vector<WidgetTemplate> list_templates() {
        return templates_.list_templates();
    }
    TemplateResult save_current_as_template(const std::string& name,
                                            const std::string& description) {
        return templates_.save_current_as_template(name, description);
    }
    TemplateResult apply_template(const std::string& id) {
        return templates_.apply_template(id);
    }
    TemplateResult delete_template(const std::string& id) {
        return templates_.delete_template(id);
    }

    // Dialogs
    void open_templates();
    void open_settings(const std::string& widget_id);

    void set_open_templates_callback(OpenTemplatesCallback cb) {
        open_templates_cb_ = std::move(cb);
    }
    void set_open_settings_callback(OpenSettingsCallback cb) {
        open_settings_cb_ = std::move(cb);
    }
    void set_confirm_callback(ConfirmCallback cb) {
        confirm_cb_ = std::move(cb);
    }

  private:
    std::string make_widget_id(const std::string& type) const;

    GridSynchronizer& sync_;
    TemplateEngine& templates_;
    DashboardSettings settings_;
    bool editing_ = false;

    OpenTemplatesCallback open_templates_cb_;
    OpenSettingsCallback open_settings_cb_;
    ConfirmCallback confirm_cb_;
};

} // namespace dashgrid
