// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"
#include "widget_layout.h"

#include <string>
#include <vector>

namespace dashgrid {

/// One widget of a template, scaled to pixels
struct PreviewRect {
    std::string id;
    std::string label; // Registry display name, or the raw type for unknown types
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct TemplatePreview {
    int width = 0;
    int height = 0;
    std::vector<PreviewRect> rects;
};

/// Scale the enabled widgets of @p tmpl onto a @p width_px wide miniature
TemplatePreview compute_template_preview(const WidgetTemplate& tmpl, int width_px,
                                         int cell_height_px);

/**
 * @brief Build a non-interactive LVGL miniature of a template
 *
 * Reads only the template. Nothing in the miniature is clickable or
 * scrollable. The caller owns the returned object.
 */
lv_obj_t* create_template_preview(lv_obj_t* parent, const WidgetTemplate& tmpl, int32_t width_px);

} // namespace dashgrid
