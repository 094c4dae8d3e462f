// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_surface.h"
#include "lvgl/lvgl.h"

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dashgrid {

/**
 * @brief GridSurface on an LVGL grid-layout container
 *
 * 12 equal columns, fixed-height rows grown to fit the content; the
 * container scrolls vertically. Each element is a card tagged with
 * lv_obj_set_name(id). Named children the host adds to container() without
 * calling attach() are picked up on the next discovery pass at a default
 * geometry and reported through the change listener.
 *
 * In interactive mode a long press on a card starts a drag (target cell from
 * the card centre); pressing near the bottom-right corner of a scalable card
 * resizes it. On release the geometry is snapped to the card's bounds, the
 * board is compacted upward and every moved card is reported.
 */
class LvglGridSurface : public GridSurface {
  public:
    using ContentFactory = std::function<void(lv_obj_t* card, const PanelElement& element)>;

    static constexpr int32_t DEFAULT_ROW_HEIGHT = 40;
    static constexpr int32_t DEFAULT_GAP = 8;

    /// Default geometry assigned to discovered (unattached) children
    static constexpr int DISCOVERED_W = 4;
    static constexpr int DISCOVERED_H = 4;

    explicit LvglGridSurface(lv_obj_t* parent, int32_t row_height_px = DEFAULT_ROW_HEIGHT,
                             int32_t gap_px = DEFAULT_GAP);
    ~LvglGridSurface() override;

    LvglGridSurface(const LvglGridSurface&) = delete;
    LvglGridSurface& operator=(const LvglGridSurface&) = delete;

    lv_obj_t* container() const {
        return container_;
    }

    /// Builds card contents; without one a title label is shown
    void set_content_factory(ContentFactory factory) {
        content_factory_ = std::move(factory);
    }

    lv_obj_t* card(const std::string& id) const;

    // GridSurface
    void attach(const PanelElement& element, const GridRect& rect) override;
    void update(const std::string& id, const GridRect& rect) override;
    void detach(const std::string& id) override;
    bool has_element(const std::string& id) override;
    std::optional<GridRect> element_geometry(const std::string& id) override;
    std::vector<std::string> element_ids() override;
    void set_interactive(bool enabled) override;
    bool is_interactive() const override {
        return interactive_;
    }
    void settle() override;
    void scroll_to_top() override;
    void scroll_to(const std::string& id) override;

    /// Map screen coordinates to grid cell (col, row). Rows are unbounded below.
    static std::pair<int, int> screen_to_grid_cell(int screen_x, int screen_y, int content_x,
                                                   int content_y, int content_w, int row_pitch,
                                                   int ncols);

    /// New span after dragging the bottom-right corner by (dx, dy) pixels. At least 1x1.
    static std::pair<int, int> compute_resize_span(int orig_w, int orig_h, int dx, int dy,
                                                   int col_pitch, int row_pitch);

    /// Pointer within this many pixels of a card's bottom-right corner starts a resize
    static constexpr int CORNER_HIT_RADIUS = 24;

  private:
    struct Element {
        PanelElement info;
        GridRect rect;
        lv_obj_t* obj = nullptr;
        bool discovered = false;
    };

    static void card_event_cb(lv_event_t* e);
    void handle_card_event(lv_event_t* e, lv_obj_t* card);

    void handle_long_press(lv_obj_t* card);
    void handle_pressing();
    void handle_released();
    void cancel_gesture();

    /// Register named children that were not attached, emitting their default geometry
    void discover_children();

    void place_card(Element& el);
    void populate_card(Element& el);
    void refresh_row_dsc();
    int column_pitch() const;
    int row_pitch() const;
    void show_snap_preview(const GridRect& rect);
    void destroy_snap_preview();

    /// Apply placements after a gesture and emit the ones that moved
    void commit(const std::string& moved_id, const GridRect& target);

    lv_obj_t* container_ = nullptr;
    int32_t row_height_;
    int32_t gap_;
    std::vector<int32_t> col_dsc_;
    std::vector<int32_t> row_dsc_;
    std::map<std::string, Element> elements_;
    ContentFactory content_factory_;
    bool interactive_ = false;

    // Gesture state
    enum class Gesture { None, Drag, Resize };
    Gesture gesture_ = Gesture::None;
    std::string gesture_id_;
    GridRect gesture_orig_;
    GridRect gesture_target_;
    lv_point_t press_origin_ = {0, 0};
    lv_point_t drag_offset_ = {0, 0};
    lv_obj_t* snap_preview_ = nullptr;
};

} // namespace dashgrid
