// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"

#include <cstdint>
#include <functional>

namespace dashgrid::ui {

/**
 * @brief Runs a fixed action once a burst of triggers has gone quiet
 *
 * trigger() (re)starts an LVGL one-shot timer; the action runs after
 * period_ms with no further trigger. flush() runs a pending action right
 * away, cancel() drops it. The timer is deleted with the object.
 *
 * @code
 * DebounceTimer save_timer(500, [this]() { persistence_.save(layout_); });
 * // On every geometry change:
 * save_timer.trigger();
 * @endcode
 *
 * Main LVGL thread only.
 */
class DebounceTimer {
  public:
    using Action = std::function<void()>;

    DebounceTimer(uint32_t period_ms, Action action);
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    /// Start the quiet period, or restart it if already running
    void trigger();

    /// Drop the pending run, if any
    void cancel();

    /// Run the pending action now. Returns false if nothing was pending.
    bool flush();

    bool pending() const {
        return timer_ != nullptr;
    }

    uint32_t period_ms() const {
        return period_ms_;
    }

  private:
    static void timer_cb(lv_timer_t* t);
    void run();

    lv_timer_t* timer_ = nullptr;
    uint32_t period_ms_;
    Action action_;
};

} // namespace dashgrid::ui
