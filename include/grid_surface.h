// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "grid_layout.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dashgrid {

/// Geometry of one element as reported by the surface after a user gesture
struct SurfaceItem {
    std::string id;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

/// What the surface needs to build a card for one widget
struct PanelElement {
    std::string id;
    std::string type;
    std::string title;
    std::string render_unit; // Empty for placeholders
    bool placeholder = false; // Type is not in the registry
    WidgetPosition bounds;    // Only min/max fields are meaningful
};

/**
 * @brief Imperative, stateful grid renderer the synchronizer drives
 *
 * The surface owns its elements. It may hold elements the synchronizer never
 * attached (host-created children it discovered itself); those are reported
 * by has_element() and element_ids() like any other.
 *
 * Change events are delivered synchronously through the listener, both for
 * user gestures and for geometry the surface assigns on its own.
 */
class GridSurface {
  public:
    using ChangeListener = std::function<void(const std::vector<SurfaceItem>&)>;

    virtual ~GridSurface() = default;

    virtual void attach(const PanelElement& element, const GridRect& rect) = 0;
    virtual void update(const std::string& id, const GridRect& rect) = 0;
    virtual void detach(const std::string& id) = 0;

    virtual bool has_element(const std::string& id) = 0;
    virtual std::optional<GridRect> element_geometry(const std::string& id) = 0;
    virtual std::vector<std::string> element_ids() = 0;

    /// Enable or disable drag/resize affordances
    virtual void set_interactive(bool enabled) = 0;
    virtual bool is_interactive() const = 0;

    /// Finish any pending layout work. Returns once attached elements have geometry.
    virtual void settle() = 0;

    virtual void scroll_to_top() = 0;
    virtual void scroll_to(const std::string& id) = 0;

    void set_change_listener(ChangeListener listener) {
        listener_ = std::move(listener);
    }

  protected:
    void emit_change(const std::vector<SurfaceItem>& items) {
        if (listener_ && !items.empty()) {
            listener_(items);
        }
    }

  private:
    ChangeListener listener_;
};

} // namespace dashgrid
