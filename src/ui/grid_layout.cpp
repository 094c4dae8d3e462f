// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_layout.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <numeric>

namespace dashgrid {

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

bool rects_overlap(const GridRect& a, const GridRect& b) {
    return !(a.right() <= b.x || a.x >= b.right() || a.bottom() <= b.y || a.y >= b.bottom());
}

int snap_to_preset(int value, const int* presets, size_t count) {
    if (count == 0) {
        return value;
    }
    int best = presets[0];
    int best_dist = std::abs(value - best);
    for (size_t i = 1; i < count; ++i) {
        int dist = std::abs(value - presets[i]);
        if (dist < best_dist) { // strict: earlier preset wins ties
            best = presets[i];
            best_dist = dist;
        }
    }
    return best;
}

int snap_within(int value, const int* presets, size_t count, int lo, int hi) {
    bool found = false;
    int best = 0;
    int best_dist = 0;
    for (size_t i = 0; i < count; ++i) {
        int p = presets[i];
        if ((lo > 0 && p < lo) || (hi > 0 && p > hi)) {
            continue;
        }
        int dist = std::abs(value - p);
        if (!found || dist < best_dist) {
            best = p;
            best_dist = dist;
            found = true;
        }
    }
    return found ? best : snap_to_preset(value, presets, count);
}

GridRect snap_rect(const GridRect& rect, const WidgetPosition& bounds, int columns) {
    GridRect out = rect;
    out.w = snap_within(rect.w, WIDTH_PRESETS, bounds.min_w, bounds.max_w);
    out.h = snap_within(rect.h, HEIGHT_PRESETS, bounds.min_h, bounds.max_h);
    out.w = std::min(out.w, columns);
    out.x = std::clamp(rect.x, 0, std::max(0, columns - out.w));
    out.y = std::max(0, rect.y);
    return out;
}

GridRect calculate_next_available_position(const std::vector<WidgetConfig>& existing, int min_w,
                                           int min_h, int preferred_w, int preferred_h,
                                           int columns, int search_rows) {
    int pref_w = std::clamp(preferred_w, 1, columns);
    int pref_h = std::max(preferred_h, 1);
    int minimum_w = std::clamp(min_w, 1, pref_w);
    int minimum_h = std::clamp(min_h, 1, pref_h);

    GridLayout grid(columns);
    for (const auto& w : existing) {
        if (!w.enabled) {
            continue;
        }
        // Existing rectangles may overlap each other mid-drag; track them regardless
        GridRect r = rect_of(w.position);
        if (r.w <= 0 || r.h <= 0) {
            continue;
        }
        if (!grid.place({w.id, r})) {
            spdlog::trace("[GridLayout] '{}' overlaps another widget, tracking anyway", w.id);
        }
    }

    if (grid.placements().empty()) {
        return {0, 0, pref_w, pref_h};
    }

    // Rectangles must end within the search height: occupied rows plus headroom
    int extra = search_rows >= 0 ? search_rows : pref_h;
    int bound = grid.rows_used() + extra;

    if (auto pos = grid.find_available(pref_w, pref_h, bound - pref_h + 1)) {
        return {pos->first, pos->second, pref_w, pref_h};
    }
    if (minimum_w != pref_w || minimum_h != pref_h) {
        if (auto pos = grid.find_available(minimum_w, minimum_h, bound - minimum_h + 1)) {
            spdlog::debug("[GridLayout] Preferred {}x{} does not fit, using minimum {}x{}", pref_w,
                          pref_h, minimum_w, minimum_h);
            return {pos->first, pos->second, minimum_w, minimum_h};
        }
    }

    // Soft condition: nothing fit inside the search height. The board scrolls,
    // so keep looking downward until the preferred size fits.
    spdlog::debug("[GridLayout] No space within {} rows, extending search", bound);
    for (int y = std::max(0, bound - pref_h + 1);; ++y) {
        for (int x = 0; x + pref_w <= columns; ++x) {
            if (grid.can_place({x, y, pref_w, pref_h})) {
                return {x, y, pref_w, pref_h};
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Static helpers
// ---------------------------------------------------------------------------

std::vector<int32_t> GridLayout::make_col_dsc(int cols) {
    std::vector<int32_t> dsc;
    dsc.reserve(static_cast<size_t>(std::max(cols, 0)) + 1);
    for (int i = 0; i < cols; ++i) {
        dsc.push_back(LV_GRID_FR(1));
    }
    dsc.push_back(LV_GRID_TEMPLATE_LAST);
    return dsc;
}

std::vector<int32_t> GridLayout::make_row_dsc(int rows, int32_t row_height_px) {
    std::vector<int32_t> dsc;
    dsc.reserve(static_cast<size_t>(std::max(rows, 0)) + 1);
    for (int i = 0; i < rows; ++i) {
        dsc.push_back(row_height_px);
    }
    dsc.push_back(LV_GRID_TEMPLATE_LAST);
    return dsc;
}

std::vector<GridPlacement> GridLayout::compact(std::vector<GridPlacement> items) {
    std::vector<size_t> order(items.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&items](size_t a, size_t b) {
        const auto& ra = items[a].rect;
        const auto& rb = items[b].rect;
        return ra.y != rb.y ? ra.y < rb.y : ra.x < rb.x;
    });

    std::vector<size_t> settled;
    settled.reserve(items.size());
    for (size_t idx : order) {
        GridRect& r = items[idx].rect;
        while (r.y > 0) {
            GridRect up = r;
            up.y -= 1;
            bool blocked = std::any_of(settled.begin(), settled.end(), [&](size_t other) {
                return rects_overlap(up, items[other].rect);
            });
            if (blocked) {
                break;
            }
            r = up;
        }
        settled.push_back(idx);
    }
    return items;
}

std::vector<GridPlacement> GridLayout::settle(std::vector<GridPlacement> items,
                                              const std::string& moved_id) {
    auto moved_it = std::find_if(items.begin(), items.end(),
                                 [&](const GridPlacement& p) { return p.widget_id == moved_id; });
    if (moved_it == items.end()) {
        return compact(std::move(items));
    }

    std::vector<size_t> order;
    order.reserve(items.size());
    size_t moved_idx = static_cast<size_t>(moved_it - items.begin());
    for (size_t i = 0; i < items.size(); ++i) {
        if (i != moved_idx) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&items](size_t a, size_t b) {
        const auto& ra = items[a].rect;
        const auto& rb = items[b].rect;
        return ra.y != rb.y ? ra.y < rb.y : ra.x < rb.x;
    });

    // The moved item keeps its drop position; everything else yields downward
    std::vector<size_t> fixed{moved_idx};
    for (size_t idx : order) {
        GridRect& r = items[idx].rect;
        bool moved = true;
        while (moved) {
            moved = false;
            for (size_t other : fixed) {
                const GridRect& o = items[other].rect;
                if (rects_overlap(r, o)) {
                    r.y = o.bottom();
                    moved = true;
                }
            }
        }
        fixed.push_back(idx);
    }
    return compact(std::move(items));
}

// ---------------------------------------------------------------------------
// Instance methods
// ---------------------------------------------------------------------------

GridLayout::GridLayout(int cols) : cols_(std::max(cols, 1)) {}

int GridLayout::rows_used() const {
    int rows = 0;
    for (const auto& p : placements_) {
        rows = std::max(rows, p.rect.bottom());
    }
    return rows;
}

bool GridLayout::is_occupied(int col, int row) const {
    for (const auto& p : placements_) {
        const auto& r = p.rect;
        if (col >= r.x && col < r.right() && row >= r.y && row < r.bottom()) {
            return true;
        }
    }
    return false;
}

bool GridLayout::can_place(const GridRect& rect) const {
    // Bounds check (rows are unbounded)
    if (rect.x < 0 || rect.y < 0 || rect.w <= 0 || rect.h <= 0)
        return false;
    if (rect.right() > cols_)
        return false;

    // Collision check
    return std::none_of(placements_.begin(), placements_.end(),
                        [&rect](const GridPlacement& p) { return rects_overlap(rect, p.rect); });
}

bool GridLayout::place(const GridPlacement& placement) {
    if (!can_place(placement.rect)) {
        spdlog::debug("[GridLayout] cannot place '{}' at ({},{}) span {}x{} in {}-column grid",
                      placement.widget_id, placement.rect.x, placement.rect.y, placement.rect.w,
                      placement.rect.h, cols_);
        // Still track in-bounds rectangles so later searches avoid them
        if (placement.rect.x >= 0 && placement.rect.y >= 0 && placement.rect.w > 0 &&
            placement.rect.h > 0) {
            placements_.push_back(placement);
        }
        return false;
    }
    placements_.push_back(placement);
    return true;
}

bool GridLayout::remove(const std::string& widget_id) {
    auto it = std::find_if(placements_.begin(), placements_.end(),
                           [&](const GridPlacement& p) { return p.widget_id == widget_id; });
    if (it == placements_.end())
        return false;
    placements_.erase(it);
    return true;
}

std::optional<std::pair<int, int>> GridLayout::find_available(int w, int h, int max_row) const {
    // Scan top-to-bottom, left-to-right
    for (int r = 0; r < max_row; ++r) {
        for (int c = 0; c + w <= cols_; ++c) {
            if (can_place({c, r, w, h})) {
                return std::make_pair(c, r);
            }
        }
    }
    return std::nullopt;
}

void GridLayout::clear() {
    placements_.clear();
}

} // namespace dashgrid
