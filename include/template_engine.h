// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "widget_layout.h"

#include <optional>
#include <string>
#include <vector>

namespace dashgrid {

class GridSynchronizer;
class LayoutPersistence;

struct TemplateResult {
    bool success = false;
    std::string error;       // User-facing message when !success
    std::string template_id; // Id of the saved/applied template
};

/**
 * @brief Named layout snapshots: the built-in seeds plus user templates
 *
 * Seeds live in code and are never written. User templates are stored as one
 * array through LayoutPersistence and are loaded on first use.
 */
class TemplateEngine {
  public:
    TemplateEngine(LayoutPersistence& persistence, GridSynchronizer& sync);

    /// Built-in templates in display order. Only "complete" is a default template.
    static const std::vector<WidgetTemplate>& seed_templates();

    /// Seeds followed by user templates
    std::vector<WidgetTemplate> list_templates();

    std::optional<WidgetTemplate> find_template(const std::string& id);

    /// Snapshot the live layout as a new user template with id "custom_<millis>"
    TemplateResult save_current_as_template(const std::string& name,
                                            const std::string& description);

    /// Insert or replace a user template by id. Seed ids are refused.
    TemplateResult save_template(WidgetTemplate tmpl);

    /**
     * @brief Replace the live widgets with the template's, wholesale
     *
     * The template is normalized first (bounds, presets, default settings).
     * The board is reconciled, saved and scrolled to the top.
     */
    TemplateResult apply_template(const std::string& id);

    /// Remove a user template. Default and other built-in templates are refused.
    TemplateResult delete_template(const std::string& id);

    /// Force the next access to re-read user templates from storage
    void reload() {
        loaded_ = false;
    }

  private:
    void ensure_loaded();
    std::string make_template_id() const;

    LayoutPersistence& persistence_;
    GridSynchronizer& sync_;
    std::vector<WidgetTemplate> user_templates_;
    bool loaded_ = false;
};

} // namespace dashgrid
