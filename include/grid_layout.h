// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "widget_layout.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dashgrid {

/// Fixed column count of the dashboard grid. Rows are unbounded (the board scrolls).
constexpr int GRID_COLUMNS = 12;

/// Allowed panel widths/heights in grid cells. Every committed size is one of these.
constexpr std::array<int, 5> WIDTH_PRESETS = {3, 4, 6, 8, 12};
constexpr std::array<int, 5> HEIGHT_PRESETS = {4, 5, 6, 8, 10};

/// Rectangle in grid cells
struct GridRect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    int right() const {
        return x + w;
    }
    int bottom() const {
        return y + h;
    }

    bool operator==(const GridRect& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
    bool operator!=(const GridRect& o) const {
        return !(*this == o);
    }
};

/// A widget placement on the grid
struct GridPlacement {
    std::string widget_id;
    GridRect rect;
};

inline GridRect rect_of(const WidgetPosition& p) {
    return {p.x, p.y, p.w, p.h};
}

/// True if the two rectangles share at least one cell
bool rects_overlap(const GridRect& a, const GridRect& b);

/// Nearest preset to @p value. Ties go to whichever preset comes first.
int snap_to_preset(int value, const int* presets, size_t count);

template <size_t N> int snap_to_preset(int value, const std::array<int, N>& presets) {
    return snap_to_preset(value, presets.data(), N);
}

/// Nearest preset inside [lo, hi] (0 = unbounded). Falls back to the unrestricted
/// nearest preset when no preset lies in the range.
int snap_within(int value, const int* presets, size_t count, int lo, int hi);

template <size_t N> int snap_within(int value, const std::array<int, N>& presets, int lo, int hi) {
    return snap_within(value, presets.data(), N, lo, hi);
}

/// Snap w/h to the presets within the position's bounds and keep x inside the columns.
GridRect snap_rect(const GridRect& rect, const WidgetPosition& bounds, int columns = GRID_COLUMNS);

/**
 * @brief Find the first free rectangle for a new widget
 *
 * Scans origins row-major (y outer, x inner). The preferred size is tried at
 * every origin where it ends within the search height (occupied height +
 * @p search_rows, default preferred_h) before the minimum size is tried. If neither fits
 * inside that bound the search keeps going downward; rows are unbounded so
 * a placement is always returned. Disabled widgets are ignored.
 */
GridRect calculate_next_available_position(const std::vector<WidgetConfig>& existing, int min_w,
                                           int min_h, int preferred_w, int preferred_h,
                                           int columns = GRID_COLUMNS, int search_rows = -1);

/// Tracks occupied cells on a fixed-width, vertically unbounded grid.
class GridLayout {
  public:
    explicit GridLayout(int cols = GRID_COLUMNS);

    /// Generate LVGL column descriptor array (cols x LV_GRID_FR(1)).
    /// Returns vector of int32_t values terminated by LV_GRID_TEMPLATE_LAST.
    static std::vector<int32_t> make_col_dsc(int cols);

    /// Generate LVGL row descriptor array with fixed-height rows.
    /// Returns vector of int32_t values terminated by LV_GRID_TEMPLATE_LAST.
    static std::vector<int32_t> make_row_dsc(int rows, int32_t row_height_px);

    int cols() const {
        return cols_;
    }

    /// One past the lowest occupied row (0 for an empty grid)
    int rows_used() const;

    /// Try to place a widget. Returns true if placed successfully.
    /// Fails if placement overlaps existing widgets or is out of bounds.
    bool place(const GridPlacement& placement);

    /// Remove a widget by ID. Returns true if found and removed.
    bool remove(const std::string& widget_id);

    /// Check if a placement would be valid (no collision, in column bounds)
    bool can_place(const GridRect& rect) const;

    /// Find first position for a w x h rectangle with origin row < max_row.
    /// Scans top-to-bottom, left-to-right (row-major order).
    std::optional<std::pair<int, int>> find_available(int w, int h, int max_row) const;

    const std::vector<GridPlacement>& placements() const {
        return placements_;
    }

    void clear();

    /// Check if a cell is occupied by any existing placement
    bool is_occupied(int col, int row) const;

    /**
     * @brief Resolve overlaps after @p moved_id was dropped, then float everything up
     *
     * Items colliding with the moved item (directly or by cascade) are pushed
     * below it; afterwards every item rises as far as it can without overlap,
     * in (y, x) order. Returns the resulting placements in input order.
     */
    static std::vector<GridPlacement> settle(std::vector<GridPlacement> items,
                                             const std::string& moved_id);

    /// Float items upward in (y, x) order until they touch something above.
    static std::vector<GridPlacement> compact(std::vector<GridPlacement> items);

  private:
    int cols_;
    std::vector<GridPlacement> placements_;
};

} // namespace dashgrid
