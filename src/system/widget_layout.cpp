// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widget_layout.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>

using nlohmann::json;

namespace dashgrid {

// ---------------------------------------------------------------------------
// WidgetLayout
// ---------------------------------------------------------------------------

WidgetConfig* WidgetLayout::find(const std::string& id) {
    auto it = std::find_if(widgets.begin(), widgets.end(),
                           [&id](const WidgetConfig& w) { return w.id == id; });
    return it != widgets.end() ? &*it : nullptr;
}

const WidgetConfig* WidgetLayout::find(const std::string& id) const {
    auto it = std::find_if(widgets.begin(), widgets.end(),
                           [&id](const WidgetConfig& w) { return w.id == id; });
    return it != widgets.end() ? &*it : nullptr;
}

std::vector<std::string> WidgetLayout::enabled_ids() const {
    std::vector<std::string> ids;
    ids.reserve(widgets.size());
    for (const auto& w : widgets) {
        if (w.enabled) {
            ids.push_back(w.id);
        }
    }
    return ids;
}

void WidgetLayout::touch() {
    last_modified = std::chrono::system_clock::now();
}

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ms_total = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms_total / 1000);
    auto ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const json& value) {
    using namespace std::chrono;
    if (value.is_number_integer()) {
        return system_clock::time_point(milliseconds(value.get<int64_t>()));
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const auto& s = value.get_ref<const std::string&>();
    std::tm tm{};
    int frac = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    // Optional ".sss" fraction; only the first three digits are significant
    if (static_cast<size_t>(consumed) < s.size() && s[static_cast<size_t>(consumed)] == '.') {
        int digits = 0;
        for (size_t i = static_cast<size_t>(consumed) + 1; i < s.size() && std::isdigit(
                                                              static_cast<unsigned char>(s[i]));
             ++i) {
            if (digits < 3) {
                frac = frac * 10 + (s[i] - '0');
            }
            ++digits;
        }
        for (; digits < 3; ++digits) {
            frac *= 10;
        }
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return system_clock::time_point(seconds(secs) + milliseconds(frac));
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void to_json(json& j, const WidgetPosition& p) {
    j = json{{"x", p.x}, {"y", p.y}, {"w", p.w}, {"h", p.h}};
    // Bounds are only written when set so hand-edited documents stay readable
    if (p.min_w > 0)
        j["minW"] = p.min_w;
    if (p.min_h > 0)
        j["minH"] = p.min_h;
    if (p.max_w > 0)
        j["maxW"] = p.max_w;
    if (p.max_h > 0)
        j["maxH"] = p.max_h;
}

void to_json(json& j, const WidgetConfig& w) {
    j = json{{"id", w.id}, {"type", w.type}, {"enabled", w.enabled}, {"position", w.position}};
    if (w.title) {
        j["title"] = *w.title;
    }
    j["settings"] = w.settings.is_object() ? w.settings : json::object();
}

void to_json(json& j, const WidgetLayout& l) {
    j = json{{"widgets", l.widgets},
             {"version", l.version},
             {"lastModified", format_timestamp(l.last_modified)}};
}

void to_json(json& j, const WidgetTemplate& t) {
    j = json{{"id", t.id},
             {"name", t.name},
             {"description", t.description},
             {"layout", t.layout},
             {"isDefault", t.is_default}};
}

static bool int_in_range(const json& value, int lo, int hi) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        return v >= static_cast<uint64_t>(std::max(lo, 0)) && v <= static_cast<uint64_t>(hi);
    }
    int64_t v = value.get<int64_t>();
    return v >= lo && v <= hi;
}

static int int_or(const json& obj, const char* key, int fallback) {
    auto it = obj.find(key);
    if (it != obj.end() && int_in_range(*it, 0, MAX_STORED_SPAN)) {
        return it->get<int>();
    }
    return fallback;
}

std::optional<WidgetConfig> parse_widget(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    auto id_it = j.find("id");
    auto type_it = j.find("type");
    auto pos_it = j.find("position");
    if (id_it == j.end() || !id_it->is_string() || type_it == j.end() || !type_it->is_string() ||
        pos_it == j.end() || !pos_it->is_object()) {
        return std::nullopt;
    }

    const json& pos = *pos_it;
    for (const char* key : {"x", "y"}) {
        if (!pos.contains(key) || !int_in_range(pos[key], 0, MAX_STORED_ORIGIN)) {
            return std::nullopt;
        }
    }
    for (const char* key : {"w", "h"}) {
        if (!pos.contains(key) || !int_in_range(pos[key], 1, MAX_STORED_SPAN)) {
            return std::nullopt;
        }
    }

    WidgetConfig w;
    w.id = id_it->get<std::string>();
    w.type = type_it->get<std::string>();
    if (w.id.empty() || w.type.empty()) {
        return std::nullopt;
    }

    auto enabled_it = j.find("enabled");
    if (enabled_it != j.end() && enabled_it->is_boolean()) {
        w.enabled = enabled_it->get<bool>();
    }

    w.position.x = pos["x"].get<int>();
    w.position.y = pos["y"].get<int>();
    w.position.w = pos["w"].get<int>();
    w.position.h = pos["h"].get<int>();
    w.position.min_w = int_or(pos, "minW", 0);
    w.position.min_h = int_or(pos, "minH", 0);
    w.position.max_w = int_or(pos, "maxW", 0);
    w.position.max_h = int_or(pos, "maxH", 0);

    auto title_it = j.find("title");
    if (title_it != j.end() && title_it->is_string()) {
        w.title = title_it->get<std::string>();
    }

    auto settings_it = j.find("settings");
    if (settings_it != j.end() && settings_it->is_object()) {
        w.settings = *settings_it;
    }
    return w;
}

std::optional<WidgetLayout> parse_layout(const json& j, size_t* dropped) {
    if (dropped) {
        *dropped = 0;
    }
    if (!j.is_object() || !j.contains("widgets") || !j["widgets"].is_array()) {
        return std::nullopt;
    }

    WidgetLayout layout;
    layout.version = int_or(j, "version", 0);
    if (auto ts = j.find("lastModified"); ts != j.end()) {
        layout.last_modified = parse_timestamp(*ts).value_or(std::chrono::system_clock::now());
    } else {
        layout.last_modified = std::chrono::system_clock::now();
    }

    for (const auto& item : j["widgets"]) {
        auto widget = parse_widget(item);
        if (!widget) {
            spdlog::debug("[WidgetLayout] Dropping malformed widget entry: {}", dump_json(item));
            if (dropped) {
                ++*dropped;
            }
            continue;
        }
        layout.widgets.push_back(std::move(*widget));
    }
    return layout;
}

std::optional<WidgetTemplate> parse_template(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto id_it = j.find("id");
    auto name_it = j.find("name");
    auto layout_it = j.find("layout");
    if (id_it == j.end() || !id_it->is_string() || name_it == j.end() || !name_it->is_string() ||
        layout_it == j.end()) {
        return std::nullopt;
    }

    auto layout = parse_layout(*layout_it);
    if (!layout) {
        return std::nullopt;
    }

    WidgetTemplate t;
    t.id = id_it->get<std::string>();
    t.name = name_it->get<std::string>();
    if (auto it = j.find("description"); it != j.end() && it->is_string()) {
        t.description = it->get<std::string>();
    }
    if (auto it = j.find("isDefault"); it != j.end() && it->is_boolean()) {
        t.is_default = it->get<bool>();
    }
    t.layout = std::move(*layout);
    if (t.id.empty()) {
        return std::nullopt;
    }
    return t;
}

} // namespace dashgrid
