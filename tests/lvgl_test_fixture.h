// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"

#include <cstdint>

/**
 * @brief Test fixture that initializes LVGL with a headless display
 *
 * LVGL is initialized once per test run (800x480, partial render buffer).
 * Each test gets a clean active screen; children are removed again when the
 * fixture is destroyed.
 */
class LVGLTestFixture {
  public:
    LVGLTestFixture();
    virtual ~LVGLTestFixture();

    LVGLTestFixture(const LVGLTestFixture&) = delete;
    LVGLTestFixture& operator=(const LVGLTestFixture&) = delete;

    /// Advance the LVGL tick by @p ms and run due timers, in 5ms steps
    void process_lvgl(uint32_t ms);

    lv_obj_t* screen = nullptr;
};
