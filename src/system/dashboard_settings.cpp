// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "dashboard_settings.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace dashgrid {

DashboardSettings DashboardSettings::from_config(const Config& config) {
    DashboardSettings s;

    int debounce = config.get<int>("/dashboard/save_debounce_ms",
                                   static_cast<int>(DEFAULT_SAVE_DEBOUNCE_MS));
    if (debounce < 0) {
        spdlog::warn("[DashboardSettings] save_debounce_ms {} is negative, using {}", debounce,
                     DEFAULT_SAVE_DEBOUNCE_MS);
        debounce = static_cast<int>(DEFAULT_SAVE_DEBOUNCE_MS);
    }
    s.save_debounce_ms = static_cast<uint32_t>(debounce);

    s.search_rows = config.get<int>("/dashboard/search_rows", -1);
    if (s.search_rows < -1) {
        s.search_rows = -1;
    }

    spdlog::debug("[DashboardSettings] save_debounce_ms={} search_rows={}", s.save_debounce_ms,
                  s.search_rows);
    return s;
}

} // namespace dashgrid
