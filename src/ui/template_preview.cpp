// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "template_preview.h"

#include "grid_layout.h"
#include "widget_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dashgrid {

namespace {

constexpr int MIN_CELL_HEIGHT = 2;
constexpr int32_t MINI_GAP = 2;
constexpr int32_t MINI_RADIUS = 3;

} // namespace

TemplatePreview compute_template_preview(const WidgetTemplate& tmpl, int width_px,
                                         int cell_height_px) {
    TemplatePreview preview;
    preview.width = std::max(width_px, 0);
    int cell_h = std::max(cell_height_px, 1);

    for (const auto& w : tmpl.layout.widgets) {
        if (!w.enabled) {
            continue;
        }
        const auto& p = w.position;
        int col = std::clamp(p.x, 0, GRID_COLUMNS);
        int col_end = std::clamp(p.x + p.w, col, GRID_COLUMNS);

        PreviewRect r;
        r.id = w.id;
        const auto* def = find_widget_def(std::string_view(w.type));
        r.label = def ? std::string(def->display_name) : w.type;
        // Edges are scaled independently so adjacent cells share a boundary
        r.x = col * preview.width / GRID_COLUMNS;
        r.w = col_end * preview.width / GRID_COLUMNS - r.x;
        r.y = std::max(p.y, 0) * cell_h;
        r.h = std::max(p.h, 0) * cell_h;
        preview.height = std::max(preview.height, r.y + r.h);
        preview.rects.push_back(std::move(r));
    }
    return preview;
}

lv_obj_t* create_template_preview(lv_obj_t* parent, const WidgetTemplate& tmpl, int32_t width_px) {
    int cell_h = std::max(static_cast<int>(width_px) / (GRID_COLUMNS * 2), MIN_CELL_HEIGHT);
    auto preview = compute_template_preview(tmpl, width_px, cell_h);

    lv_obj_t* frame = lv_obj_create(parent);
    lv_obj_set_size(frame, preview.width, std::max(preview.height, cell_h));
    lv_obj_set_style_pad_all(frame, 0, 0);
    lv_obj_set_style_border_width(frame, 0, 0);
    lv_obj_remove_flag(frame, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_remove_flag(frame, LV_OBJ_FLAG_SCROLLABLE);

    for (const auto& r : preview.rects) {
        lv_obj_t* cell = lv_obj_create(frame);
        lv_obj_set_pos(cell, r.x + MINI_GAP / 2, r.y + MINI_GAP / 2);
        lv_obj_set_size(cell, std::max(r.w - MINI_GAP, 1), std::max(r.h - MINI_GAP, 1));
        lv_obj_set_style_radius(cell, MINI_RADIUS, 0);
        lv_obj_set_style_pad_all(cell, 0, 0);
        lv_obj_set_style_bg_opa(cell, LV_OPA_30, 0);
        lv_obj_remove_flag(cell, LV_OBJ_FLAG_CLICKABLE);
        lv_obj_remove_flag(cell, LV_OBJ_FLAG_SCROLLABLE);
        lv_obj_set_name(cell, r.id.c_str());
    }

    spdlog::trace("[TemplatePreview] '{}': {} cells, {}x{}px", tmpl.id, preview.rects.size(),
                  preview.width, preview.height);
    return frame;
}

} // namespace dashgrid
