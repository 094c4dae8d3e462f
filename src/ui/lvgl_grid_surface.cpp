// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_grid_surface.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dashgrid {

namespace {

constexpr int32_t CARD_RADIUS = 8;
constexpr int32_t CARD_PAD = 8;
constexpr int PREVIEW_BORDER_WIDTH = 2;

int round_cells(int delta_px, int pitch) {
    if (pitch <= 0) {
        return 0;
    }
    return delta_px >= 0 ? (delta_px + pitch / 2) / pitch : -((-delta_px + pitch / 2) / pitch);
}

} // namespace

LvglGridSurface::LvglGridSurface(lv_obj_t* parent, int32_t row_height_px, int32_t gap_px)
    : row_height_(row_height_px), gap_(gap_px) {
    container_ = lv_obj_create(parent);
    lv_obj_set_name(container_, "dashboard_grid");
    lv_obj_set_size(container_, LV_PCT(100), LV_PCT(100));
    lv_obj_set_scroll_dir(container_, LV_DIR_VER);
    lv_obj_set_layout(container_, LV_LAYOUT_GRID);
    lv_obj_set_style_pad_column(container_, gap_, 0);
    lv_obj_set_style_pad_row(container_, gap_, 0);

    col_dsc_ = GridLayout::make_col_dsc(GRID_COLUMNS);
    row_dsc_ = GridLayout::make_row_dsc(1, row_height_);
    lv_obj_set_grid_dsc_array(container_, col_dsc_.data(), row_dsc_.data());

    // Parent may be cleaned before we are destroyed; forget every object then
    lv_obj_add_event_cb(
        container_,
        [](lv_event_t* e) {
            auto* self = static_cast<LvglGridSurface*>(lv_event_get_user_data(e));
            self->container_ = nullptr;
            self->snap_preview_ = nullptr;
            for (auto& [id, el] : self->elements_) {
                el.obj = nullptr;
            }
        },
        LV_EVENT_DELETE, this);
}

LvglGridSurface::~LvglGridSurface() {
    if (container_) {
        lv_obj_delete(container_); // DELETE handler clears container_ and card pointers
        container_ = nullptr;
    }
}

lv_obj_t* LvglGridSurface::card(const std::string& id) const {
    auto it = elements_.find(id);
    return it != elements_.end() ? it->second.obj : nullptr;
}

// ---------------------------------------------------------------------------
// GridSurface
// ---------------------------------------------------------------------------

void LvglGridSurface::attach(const PanelElement& element, const GridRect& rect) {
    if (!container_) {
        return;
    }

    auto existing = elements_.find(element.id);
    if (existing != elements_.end()) {
        spdlog::debug("[LvglGridSurface] attach: replacing existing element '{}'", element.id);
        detach(element.id);
    }

    Element el;
    el.info = element;
    el.rect = rect;
    el.obj = lv_obj_create(container_);
    lv_obj_set_name(el.obj, element.id.c_str());
    lv_obj_remove_flag(el.obj, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_style_radius(el.obj, CARD_RADIUS, 0);
    lv_obj_set_style_pad_all(el.obj, CARD_PAD, 0);
    lv_obj_add_event_cb(el.obj, card_event_cb, LV_EVENT_ALL, this);

    populate_card(el);
    auto [it, inserted] = elements_.emplace(element.id, std::move(el));
    (void)inserted;
    place_card(it->second);
    refresh_row_dsc();

    spdlog::debug("[LvglGridSurface] Attached '{}' at ({},{}) {}x{}", element.id, rect.x, rect.y,
                  rect.w, rect.h);
}

void LvglGridSurface::update(const std::string& id, const GridRect& rect) {
    auto it = elements_.find(id);
    if (it == elements_.end()) {
        spdlog::debug("[LvglGridSurface] update: no element '{}'", id);
        return;
    }
    it->second.rect = rect;
    place_card(it->second);
    refresh_row_dsc();
}

void LvglGridSurface::detach(const std::string& id) {
    auto it = elements_.find(id);
    if (it == elements_.end()) {
        return;
    }
    if (gesture_id_ == id) {
        cancel_gesture();
    }
    lv_obj_t* obj = it->second.obj;
    elements_.erase(it);
    if (obj && container_) {
        lv_obj_delete(obj);
    }
    refresh_row_dsc();
    spdlog::debug("[LvglGridSurface] Detached '{}'", id);
}

bool LvglGridSurface::has_element(const std::string& id) {
    discover_children();
    return elements_.count(id) > 0;
}

std::optional<GridRect> LvglGridSurface::element_geometry(const std::string& id) {
    discover_children();
    auto it = elements_.find(id);
    if (it == elements_.end()) {
        return std::nullopt;
    }
    return it->second.rect;
}

std::vector<std::string> LvglGridSurface::element_ids() {
    discover_children();
    std::vector<std::string> ids;
    ids.reserve(elements_.size());
    for (const auto& [id, el] : elements_) {
        ids.push_back(id);
    }
    return ids;
}

void LvglGridSurface::set_interactive(bool enabled) {
    if (interactive_ == enabled) {
        return;
    }
    interactive_ = enabled;
    if (!enabled) {
        cancel_gesture();
    }
    for (auto& [id, el] : elements_) {
        if (el.obj) {
            lv_obj_set_style_border_width(el.obj, enabled ? PREVIEW_BORDER_WIDTH : 0, 0);
        }
    }
    spdlog::debug("[LvglGridSurface] Interactive {}", enabled ? "on" : "off");
}

void LvglGridSurface::settle() {
    discover_children();
    if (container_) {
        lv_obj_update_layout(container_);
    }
}

void LvglGridSurface::scroll_to_top() {
    if (container_) {
        lv_obj_scroll_to_y(container_, 0, LV_ANIM_ON);
    }
}

void LvglGridSurface::scroll_to(const std::string& id) {
    lv_obj_t* obj = card(id);
    if (!obj || !container_) {
        return;
    }
    lv_obj_update_layout(container_);
    lv_obj_scroll_to_view(obj, LV_ANIM_ON);
}

// ---------------------------------------------------------------------------
// Pure helpers
// ---------------------------------------------------------------------------

std::pair<int, int> LvglGridSurface::screen_to_grid_cell(int screen_x, int screen_y,
                                                         int content_x, int content_y,
                                                         int content_w, int row_pitch,
                                                         int ncols) {
    // Convert screen coordinates to content-relative
    int rel_x = screen_x - content_x;
    int rel_y = screen_y - content_y;

    int col = content_w > 0 ? (rel_x * ncols) / content_w : 0;
    int row = row_pitch > 0 ? rel_y / row_pitch : 0;

    col = std::clamp(col, 0, ncols - 1);
    row = std::max(row, 0);
    return {col, row};
}

std::pair<int, int> LvglGridSurface::compute_resize_span(int orig_w, int orig_h, int dx, int dy,
                                                         int col_pitch, int row_pitch) {
    int w = orig_w + round_cells(dx, col_pitch);
    int h = orig_h + round_cells(dy, row_pitch);
    return {std::max(w, 1), std::max(h, 1)};
}

// ---------------------------------------------------------------------------
// Cards and descriptors
// ---------------------------------------------------------------------------

void LvglGridSurface::populate_card(Element& el) {
    if (el.info.placeholder) {
        lv_obj_t* label = lv_label_create(el.obj);
        lv_label_set_text_fmt(label, "Unknown widget: %s", el.info.type.c_str());
        lv_obj_set_style_text_opa(label, LV_OPA_60, 0);
        lv_obj_center(label);
        return;
    }
    if (content_factory_) {
        content_factory_(el.obj, el.info);
        return;
    }
    lv_obj_t* label = lv_label_create(el.obj);
    lv_label_set_text(label, el.info.title.c_str());
}

void LvglGridSurface::place_card(Element& el) {
    if (!el.obj) {
        return;
    }
    lv_obj_set_grid_cell(el.obj, LV_GRID_ALIGN_STRETCH, el.rect.x, el.rect.w,
                         LV_GRID_ALIGN_STRETCH, el.rect.y, el.rect.h);
}

void LvglGridSurface::refresh_row_dsc() {
    if (!container_) {
        return;
    }
    int rows = 1;
    for (const auto& [id, el] : elements_) {
        rows = std::max(rows, el.rect.bottom());
    }
    if (static_cast<size_t>(rows) + 1 == row_dsc_.size()) {
        return;
    }
    row_dsc_ = GridLayout::make_row_dsc(rows, row_height_);
    lv_obj_set_grid_dsc_array(container_, col_dsc_.data(), row_dsc_.data());
    spdlog::trace("[LvglGridSurface] Grid rows: {}", rows);
}

int LvglGridSurface::column_pitch() const {
    if (!container_) {
        return 0;
    }
    lv_area_t content_area;
    lv_obj_get_content_coords(container_, &content_area);
    int cw = lv_area_get_width(&content_area);
    return (cw + gap_) / GRID_COLUMNS;
}

int LvglGridSurface::row_pitch() const {
    return row_height_ + gap_;
}

void LvglGridSurface::discover_children() {
    if (!container_) {
        return;
    }

    int next_row = 0;
    for (const auto& [id, el] : elements_) {
        next_row = std::max(next_row, el.rect.bottom());
    }

    std::vector<SurfaceItem> found;
    uint32_t count = lv_obj_get_child_count(container_);
    for (uint32_t i = 0; i < count; ++i) {
        lv_obj_t* child = lv_obj_get_child(container_, static_cast<int32_t>(i));
        if (!child || child == snap_preview_ || lv_obj_has_flag(child, LV_OBJ_FLAG_FLOATING)) {
            continue;
        }
        const char* name = lv_obj_get_name(child);
        if (!name || name[0] == '\0' || elements_.count(name) > 0) {
            continue;
        }

        Element el;
        el.info.id = name;
        el.info.title = name;
        el.rect = {0, next_row, DISCOVERED_W, DISCOVERED_H};
        el.obj = child;
        el.discovered = true;
        next_row += DISCOVERED_H;
        lv_obj_add_event_cb(child, card_event_cb, LV_EVENT_ALL, this);

        auto [it, inserted] = elements_.emplace(el.info.id, std::move(el));
        (void)inserted;
        place_card(it->second);
        found.push_back({it->first, it->second.rect.x, it->second.rect.y, it->second.rect.w,
                         it->second.rect.h});
        spdlog::debug("[LvglGridSurface] Discovered unattached child '{}'", it->first);
    }

    if (!found.empty()) {
        refresh_row_dsc();
        emit_change(found);
    }
}

void LvglGridSurface::show_snap_preview(const GridRect& rect) {
    destroy_snap_preview();
    if (!container_) {
        return;
    }

    int col_w = column_pitch();
    int row_h = row_pitch();
    int pad_left = lv_obj_get_style_pad_left(container_, LV_PART_MAIN);
    int pad_top = lv_obj_get_style_pad_top(container_, LV_PART_MAIN);

    snap_preview_ = lv_obj_create(container_);
    lv_obj_add_flag(snap_preview_, LV_OBJ_FLAG_FLOATING);
    lv_obj_remove_flag(snap_preview_, LV_OBJ_FLAG_CLICKABLE);
    lv_obj_remove_flag(snap_preview_, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_set_pos(snap_preview_, pad_left + rect.x * col_w,
                   pad_top + rect.y * row_h - lv_obj_get_scroll_y(container_));
    lv_obj_set_size(snap_preview_, rect.w * col_w - gap_, rect.h * row_h - gap_);
    lv_obj_set_style_radius(snap_preview_, CARD_RADIUS, 0);
    lv_obj_set_style_bg_opa(snap_preview_, LV_OPA_10, 0);
    lv_obj_set_style_border_width(snap_preview_, PREVIEW_BORDER_WIDTH, 0);
    lv_obj_set_style_border_opa(snap_preview_, LV_OPA_70, 0);
}

void LvglGridSurface::destroy_snap_preview() {
    if (snap_preview_) {
        lv_obj_delete(snap_preview_);
        snap_preview_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// Gestures
// ---------------------------------------------------------------------------

void LvglGridSurface::card_event_cb(lv_event_t* e) {
    auto* self = static_cast<LvglGridSurface*>(lv_event_get_user_data(e));
    auto* card = static_cast<lv_obj_t*>(lv_event_get_current_target(e));
    if (self && card) {
        self->handle_card_event(e, card);
    }
}

void LvglGridSurface::handle_card_event(lv_event_t* e, lv_obj_t* card) {
    if (!interactive_ || !container_) {
        return;
    }
    switch (lv_event_get_code(e)) {
    case LV_EVENT_LONG_PRESSED:
        handle_long_press(card);
        break;
    case LV_EVENT_PRESSING:
        handle_pressing();
        break;
    case LV_EVENT_RELEASED:
    case LV_EVENT_PRESS_LOST:
        handle_released();
        break;
    default:
        break;
    }
}

void LvglGridSurface::handle_long_press(lv_obj_t* card) {
    if (gesture_ != Gesture::None) {
        return;
    }
    const char* name = lv_obj_get_name(card);
    if (!name) {
        return;
    }
    auto it = elements_.find(name);
    if (it == elements_.end()) {
        return;
    }
    lv_indev_t* indev = lv_indev_active();
    if (!indev) {
        return;
    }

    lv_point_t point;
    lv_indev_get_point(indev, &point);
    lv_area_t card_area;
    lv_obj_get_coords(card, &card_area);

    Element& el = it->second;
    gesture_id_ = it->first;
    gesture_orig_ = el.rect;
    gesture_target_ = el.rect;
    press_origin_ = point;

    // The board must not scroll under the finger while a card is held
    lv_obj_remove_flag(container_, LV_OBJ_FLAG_SCROLLABLE);

    const auto& b = el.info.bounds;
    bool scalable = b.max_w > b.min_w || b.max_h > b.min_h;
    int dx = point.x - card_area.x2;
    int dy = point.y - card_area.y2;
    if (scalable && dx * dx + dy * dy <= CORNER_HIT_RADIUS * CORNER_HIT_RADIUS) {
        gesture_ = Gesture::Resize;
        show_snap_preview(el.rect);
        spdlog::debug("[LvglGridSurface] Resize started: '{}' {}x{}", gesture_id_, el.rect.w,
                      el.rect.h);
        return;
    }

    gesture_ = Gesture::Drag;
    drag_offset_.x = point.x - card_area.x1;
    drag_offset_.y = point.y - card_area.y1;

    // FLOATING moves the reference frame from the content area to the outer
    // coords plus padding; compensate so the card does not jump
    lv_area_t cont_area;
    lv_obj_get_coords(container_, &cont_area);
    int pad_left = lv_obj_get_style_space_left(container_, LV_PART_MAIN);
    int pad_top = lv_obj_get_style_space_top(container_, LV_PART_MAIN);
    lv_obj_add_flag(card, LV_OBJ_FLAG_FLOATING);
    lv_obj_set_pos(card, card_area.x1 - cont_area.x1 - pad_left,
                   card_area.y1 - cont_area.y1 - pad_top);
    lv_obj_move_foreground(card);

    spdlog::debug("[LvglGridSurface] Drag started: '{}' from ({},{})", gesture_id_, el.rect.x,
                  el.rect.y);
}

void LvglGridSurface::handle_pressing() {
    if (gesture_ == Gesture::None) {
        return;
    }
    auto it = elements_.find(gesture_id_);
    lv_indev_t* indev = lv_indev_active();
    if (it == elements_.end() || !indev) {
        return;
    }
    Element& el = it->second;

    lv_point_t point;
    lv_indev_get_point(indev, &point);
    lv_area_t content_area;
    lv_obj_get_content_coords(container_, &content_area);
    int col_w = column_pitch();
    int row_h = row_pitch();

    GridRect target = gesture_target_;
    if (gesture_ == Gesture::Drag) {
        lv_area_t cont_area;
        lv_obj_get_coords(container_, &cont_area);
        int pad_left = lv_obj_get_style_space_left(container_, LV_PART_MAIN);
        int pad_top = lv_obj_get_style_space_top(container_, LV_PART_MAIN);
        int left = point.x - drag_offset_.x;
        int top = point.y - drag_offset_.y;
        if (el.obj) {
            lv_obj_set_pos(el.obj, left - cont_area.x1 - pad_left, top - cont_area.y1 - pad_top);
        }

        // Target cell comes from the card centre, not the grab point
        int cx = left + (col_w * gesture_orig_.w) / 2;
        int cy = top + (row_h * gesture_orig_.h) / 2;
        int scroll_y = lv_obj_get_scroll_y(container_);
        auto [col, row] =
            screen_to_grid_cell(cx, cy, content_area.x1, content_area.y1 - scroll_y,
                                lv_area_get_width(&content_area), row_h, GRID_COLUMNS);
        target.x = std::clamp(col - gesture_orig_.w / 2, 0, GRID_COLUMNS - gesture_orig_.w);
        target.y = std::max(0, row - gesture_orig_.h / 2);
        if (target == gesture_target_) {
            return;
        }
        gesture_target_ = target;
        show_snap_preview(target);
        return;
    }

    auto [w, h] = compute_resize_span(gesture_orig_.w, gesture_orig_.h, point.x - press_origin_.x,
                                      point.y - press_origin_.y, col_w, row_h);
    target.w = std::min(w, GRID_COLUMNS - gesture_orig_.x);
    target.h = h;
    if (target == gesture_target_) {
        return;
    }
    gesture_target_ = target;
    // Visual only: the committed size is snapped again on release
    show_snap_preview(snap_rect(target, el.info.bounds));
}

void LvglGridSurface::handle_released() {
    if (gesture_ == Gesture::None) {
        return;
    }
    std::string id = gesture_id_;
    auto it = elements_.find(id);
    GridRect target = gesture_target_;
    WidgetPosition bounds = it != elements_.end() ? it->second.info.bounds : WidgetPosition{};
    cancel_gesture();

    if (it == elements_.end()) {
        return;
    }
    GridRect committed = snap_rect(target, bounds);
    spdlog::debug("[LvglGridSurface] Gesture released: '{}' -> ({},{}) {}x{}", id, committed.x,
                  committed.y, committed.w, committed.h);
    commit(id, committed);
}

void LvglGridSurface::cancel_gesture() {
    if (gesture_ == Gesture::None) {
        return;
    }
    auto it = elements_.find(gesture_id_);
    if (it != elements_.end() && it->second.obj && gesture_ == Gesture::Drag) {
        lv_obj_remove_flag(it->second.obj, LV_OBJ_FLAG_FLOATING);
        place_card(it->second);
    }
    destroy_snap_preview();
    if (container_) {
        lv_obj_add_flag(container_, LV_OBJ_FLAG_SCROLLABLE);
    }
    gesture_ = Gesture::None;
    gesture_id_.clear();
    drag_offset_ = {0, 0};
}

void LvglGridSurface::commit(const std::string& moved_id, const GridRect& target) {
    std::vector<GridPlacement> items;
    items.reserve(elements_.size());
    for (const auto& [id, el] : elements_) {
        items.push_back({id, id == moved_id ? target : el.rect});
    }

    std::vector<SurfaceItem> changed;
    for (const auto& p : GridLayout::settle(std::move(items), moved_id)) {
        Element& el = elements_[p.widget_id];
        if (el.rect == p.rect) {
            continue;
        }
        el.rect = p.rect;
        place_card(el);
        changed.push_back({p.widget_id, p.rect.x, p.rect.y, p.rect.w, p.rect.h});
    }
    refresh_row_dsc();
    if (container_) {
        lv_obj_update_layout(container_);
    }
    emit_change(changed);
}

} // namespace dashgrid
