// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dashgrid {

/// Bumped when the persisted document shape changes; older documents are migrated on load.
constexpr int CURRENT_LAYOUT_VERSION = 1;

/// Grid-cell geometry of one panel plus its size bounds (0 = unbounded / not set).
struct WidgetPosition {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    int min_w = 0;
    int min_h = 0;
    int max_w = 0;
    int max_h = 0;

    bool same_rect(const WidgetPosition& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }

    bool operator==(const WidgetPosition& o) const {
        return same_rect(o) && min_w == o.min_w && min_h == o.min_h && max_w == o.max_w &&
               max_h == o.max_h;
    }
    bool operator!=(const WidgetPosition& o) const {
        return !(*this == o);
    }
};

/// One panel instance on the board.
struct WidgetConfig {
    std::string id;   // Stable for the panel's lifetime
    std::string type; // Registry id; may name a type that no longer exists
    bool enabled = true;
    WidgetPosition position;
    std::optional<std::string> title;
    nlohmann::json settings = nlohmann::json::object();

    bool operator==(const WidgetConfig& o) const {
        return id == o.id && type == o.type && enabled == o.enabled && position == o.position &&
               title == o.title && settings == o.settings;
    }
    bool operator!=(const WidgetConfig& o) const {
        return !(*this == o);
    }
};

/// The whole board for one user.
struct WidgetLayout {
    std::vector<WidgetConfig> widgets;
    int version = CURRENT_LAYOUT_VERSION;
    std::chrono::system_clock::time_point last_modified{};

    WidgetConfig* find(const std::string& id);
    const WidgetConfig* find(const std::string& id) const;

    /// Ids of enabled widgets, in document order
    std::vector<std::string> enabled_ids() const;

    /// Stamp last_modified with the current time
    void touch();
};

/// A named, reusable layout snapshot. Default (seed) templates cannot be deleted.
struct WidgetTemplate {
    std::string id;
    std::string name;
    std::string description;
    WidgetLayout layout;
    bool is_default = false;
};

/// Stored geometry outside these ranges is treated as malformed
constexpr int MAX_STORED_ORIGIN = 10000;
constexpr int MAX_STORED_SPAN = 100;

/// ISO-8601 UTC with milliseconds, e.g. "2026-01-31T09:15:00.250Z"
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Accepts ISO-8601 UTC strings (fraction and 'Z' optional) or epoch milliseconds.
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const nlohmann::json& value);

void to_json(nlohmann::json& j, const WidgetPosition& p);
void to_json(nlohmann::json& j, const WidgetConfig& w);
void to_json(nlohmann::json& j, const WidgetLayout& l);
void to_json(nlohmann::json& j, const WidgetTemplate& t);

/**
 * @brief Lenient parse of a single widget entry
 *
 * Requires a non-empty string id and type and a position object carrying
 * integer x/y in [0, MAX_STORED_ORIGIN] and w/h in [1, MAX_STORED_SPAN].
 * Out-of-range min/max bounds read as 0 (unset). Everything else is optional: enabled defaults to true,
 * bounds default to 0, settings to an empty object.
 * @return std::nullopt if a required field is missing or has the wrong type
 */
std::optional<WidgetConfig> parse_widget(const nlohmann::json& j);

/**
 * @brief Parse a layout document
 *
 * Malformed widget entries are dropped and counted in @p dropped.
 * @return std::nullopt if @p j is not an object with a "widgets" array
 */
std::optional<WidgetLayout> parse_layout(const nlohmann::json& j, size_t* dropped = nullptr);

/// @return std::nullopt if id/name or the embedded layout are unusable
std::optional<WidgetTemplate> parse_template(const nlohmann::json& j);

} // namespace dashgrid
