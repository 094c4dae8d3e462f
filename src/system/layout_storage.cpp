// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_storage.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace dashgrid {

ConfigLayoutStorage::ConfigLayoutStorage(Config& config) : config_(config) {}

std::optional<std::string> ConfigLayoutStorage::read(const std::string& key) {
    if (!config_.exists(key)) {
        return std::nullopt;
    }
    auto value = config_.get<json>(key, json());
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return dump_json(value);
}

bool ConfigLayoutStorage::write(const std::string& key, const std::string& bytes) {
    json value = json::parse(bytes, nullptr, false);
    if (value.is_discarded()) {
        spdlog::debug("[LayoutStorage] '{}' is not JSON, storing as text", key);
        value = bytes;
    }
    if (!config_.set(key, value)) {
        return false;
    }
    return config_.save();
}

} // namespace dashgrid
