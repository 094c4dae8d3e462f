// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file lvgl_log_handler.h
 * @brief Custom LVGL log handler that routes through spdlog
 *
 * Routes all LVGL log messages through spdlog so grid layout and timer
 * diagnostics from LVGL appear in the same log as the dashboard engine.
 */

#pragma once

namespace dashgrid {
namespace logging {

/**
 * @brief Register the custom LVGL log handler
 *
 * Call this after spdlog initialization and lv_init() to route LVGL logs
 * through spdlog. Replaces printf-based LVGL logging.
 *
 * LVGL levels map as: TRACE -> trace, INFO -> debug, WARN -> warn,
 * ERROR -> error, USER -> info.
 */
void register_lvgl_log_handler();

} // namespace logging
} // namespace dashgrid
