// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layout_storage.h"
#include "widget_layout.h"

#include <vector>

namespace dashgrid {

/**
 * @brief Loads and saves the dashboard layout document and user templates
 *
 * Never throws. A missing, empty or unreadable document is replaced by the
 * built-in default layout. Documents that needed repair on load (dropped
 * entries, off-preset sizes, old version) are written back once.
 */
class LayoutPersistence {
  public:
    explicit LayoutPersistence(LayoutStorage& storage);

    /**
     * @brief Load the stored layout
     *
     * First run (no document or no widgets) seeds the default layout and
     * persists it. Corrupt documents yield the default without overwriting
     * the stored bytes.
     */
    WidgetLayout load();

    /// Persist the full document. Logs and returns false on failure.
    bool save(const WidgetLayout& layout);

    /// Built-in layout used on first run, on corruption and by "Reset Layout"
    static WidgetLayout get_default_layout();

    /**
     * @brief Apply the repairs enforced on every load
     *
     * Drops duplicate ids (first wins), fills missing size bounds from the
     * registry, snaps w/h to presets within bounds, clamps x to the columns,
     * pushes overlapping enabled widgets down, merges registry default
     * settings under the stored ones and stamps the current version.
     * @param changed set to true if anything was altered
     */
    static WidgetLayout normalize_layout(WidgetLayout layout, bool* changed = nullptr);

    /// User templates from storage; malformed entries are skipped
    std::vector<WidgetTemplate> load_user_templates();

    bool save_user_templates(const std::vector<WidgetTemplate>& templates);

  private:
    LayoutStorage& storage_;
};

} // namespace dashgrid
