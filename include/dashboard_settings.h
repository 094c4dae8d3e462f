// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>

namespace dashgrid {

class Config;

/// Engine tunables read from the "/dashboard" section of the settings file
struct DashboardSettings {
    static constexpr uint32_t DEFAULT_SAVE_DEBOUNCE_MS = 500;

    uint32_t save_debounce_ms = DEFAULT_SAVE_DEBOUNCE_MS;
    int search_rows = -1; // Extra rows the allocator scans; -1 = preferred height

    /// Missing or invalid values fall back to the defaults above
    static DashboardSettings from_config(const Config& config);
};

} // namespace dashgrid
