// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_debounce_timer.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace dashgrid::ui {

DebounceTimer::DebounceTimer(uint32_t period_ms, Action action)
    : period_ms_(period_ms), action_(std::move(action)) {}

DebounceTimer::~DebounceTimer() {
    cancel();
}

void DebounceTimer::trigger() {
    if (timer_) {
        lv_timer_reset(timer_);
        return;
    }
    timer_ = lv_timer_create(timer_cb, period_ms_, this);
    lv_timer_set_repeat_count(timer_, 1);
}

void DebounceTimer::cancel() {
    if (!timer_) {
        return;
    }
    lv_timer_delete(timer_);
    timer_ = nullptr;
}

bool DebounceTimer::flush() {
    if (!timer_) {
        return false;
    }
    lv_timer_delete(timer_);
    timer_ = nullptr;
    run();
    return true;
}

void DebounceTimer::run() {
    if (action_) {
        action_();
    } else {
        spdlog::warn("[DebounceTimer] Fired with no action");
    }
}

void DebounceTimer::timer_cb(lv_timer_t* t) {
    auto* self = static_cast<DebounceTimer*>(lv_timer_get_user_data(t));
    // repeat_count 1: LVGL deletes the timer after this returns
    self->timer_ = nullptr;
    self->run();
}

} // namespace dashgrid::ui
