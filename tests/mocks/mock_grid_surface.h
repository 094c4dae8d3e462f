// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_grid_surface.h
 * @brief In-memory GridSurface for testing GridSynchronizer and friends
 *
 * Records every attach/update/detach call and can imitate the behaviours of
 * a real grid library that the synchronizer has to cope with:
 * - firing change events as a side effect of attach/update
 * - picking up elements on its own (auto-discovery)
 * - user drags and resizes delivered through the change listener
 *
 * @example
 * MockGridSurface surface;
 * surface.echo_changes = true;            // attach() fires a change event
 * surface.discover("orphan", {0, 0, 4, 4}); // element the host added directly
 * surface.user_move("news", {0, 8, 6, 5}); // gesture result
 */

#include "grid_surface.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

class MockGridSurface : public dashgrid::GridSurface {
  public:
    struct Element {
        dashgrid::PanelElement info;
        dashgrid::GridRect rect;
        bool discovered = false;
    };

    // GridSurface
    void attach(const dashgrid::PanelElement& element, const dashgrid::GridRect& rect) override;
    void update(const std::string& id, const dashgrid::GridRect& rect) override;
    void detach(const std::string& id) override;
    bool has_element(const std::string& id) override;
    std::optional<dashgrid::GridRect> element_geometry(const std::string& id) override;
    std::vector<std::string> element_ids() override;
    void set_interactive(bool enabled) override {
        interactive_ = enabled;
    }
    bool is_interactive() const override {
        return interactive_;
    }
    void settle() override;
    void scroll_to_top() override {
        ++scroll_to_top_count;
    }
    void scroll_to(const std::string& id) override {
        scrolled_to.push_back(id);
    }

    /// Add an element the synchronizer never attached and report its geometry
    void discover(const std::string& id, const dashgrid::GridRect& rect);

    /// Simulate a finished user gesture on one element
    void user_move(const std::string& id, const dashgrid::GridRect& rect);

    /// Deliver an arbitrary change batch to the listener
    void emit(const std::vector<dashgrid::SurfaceItem>& items) {
        emit_change(items);
    }

    const Element* element(const std::string& id) const;

    void clear_log() {
        calls.clear();
        attach_count = 0;
        update_count = 0;
        detach_count = 0;
    }

    // When set, attach() and update() report the element's geometry back
    // through the change listener, like grid libraries that emit on every mutation
    bool echo_changes = false;

    // Invoked from inside attach(), after the element is stored
    std::function<void(const std::string& id)> on_attach;

    std::vector<std::string> calls; // "attach:<id>", "update:<id>", "detach:<id>"
    int attach_count = 0;
    int update_count = 0;
    int detach_count = 0;
    int settle_count = 0;
    int scroll_to_top_count = 0;
    std::vector<std::string> scrolled_to;

  private:
    static dashgrid::SurfaceItem item_of(const std::string& id, const dashgrid::GridRect& r) {
        return {id, r.x, r.y, r.w, r.h};
    }

    std::map<std::string, Element> elements_;
    bool interactive_ = false;
};
