// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_log_handler.h"

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <string_view>

namespace dashgrid {
namespace logging {

namespace {

void lvgl_log_cb(lv_log_level_t level, const char* buf) {
    if (!buf) {
        return;
    }
    std::string_view msg(buf);
    // LVGL terminates every line with a newline
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.remove_suffix(1);
    }

    switch (level) {
    case LV_LOG_LEVEL_TRACE:
        spdlog::trace("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_INFO:
        spdlog::debug("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_WARN:
        spdlog::warn("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_ERROR:
        spdlog::error("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_USER:
    default:
        spdlog::info("[LVGL] {}", msg);
        break;
    }
}

} // namespace

void register_lvgl_log_handler() {
    lv_log_register_print_cb(lvgl_log_cb);
    spdlog::debug("[Logging] LVGL log handler registered");
}

} // namespace logging
} // namespace dashgrid
