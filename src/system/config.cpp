// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace dashgrid {

std::string dump_json(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

Config::Config(std::string path) : path_(std::move(path)) {}

Config* Config::get_instance() {
    static Config* instance = [] {
        const char* env_path = std::getenv("DASHGRID_CONFIG");
        auto* cfg = new Config(env_path && env_path[0] != '\0' ? env_path : DEFAULT_PATH);
        cfg->load();
        return cfg;
    }();
    return instance;
}

bool Config::load() {
    data = json::object();
    if (path_.empty()) {
        return true;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::debug("[Config] No config file at '{}', starting empty", path_);
        return true;
    }

    try {
        json parsed = json::parse(in);
        if (!parsed.is_object()) {
            spdlog::warn("[Config] '{}' is not a JSON object, starting empty", path_);
            return false;
        }
        data = std::move(parsed);
        spdlog::debug("[Config] Loaded '{}'", path_);
        return true;
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Failed to parse '{}': {}", path_, e.what());
        return false;
    }
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::error("[Config] save() with no backing path");
        return false;
    }

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            spdlog::error("[Config] Cannot create '{}': {}", target.parent_path().string(),
                          ec.message());
            return false;
        }
    }

    // Write to a sibling temp file first so a crash never leaves a truncated config
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("[Config] Cannot open '{}' for writing", tmp.string());
            return false;
        }
        out << dump_json(data, 2);
        out.flush();
        if (!out) {
            spdlog::error("[Config] Write to '{}' failed", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        spdlog::error("[Config] Rename '{}' -> '{}' failed: {}", tmp.string(), path_,
                      ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool Config::exists(const std::string& path) const {
    try {
        return data.contains(json::json_pointer(path));
    } catch (const json::exception&) {
        return false;
    }
}

json& Config::get_json(const std::string& path) {
    return data[json::json_pointer(path)];
}

bool Config::erase(const std::string& path) {
    try {
        json::json_pointer ptr(path);
        if (ptr.empty() || !data.contains(ptr)) {
            return false;
        }
        json& parent = data.at(ptr.parent_pointer());
        if (parent.is_object()) {
            return parent.erase(ptr.back()) > 0;
        }
        if (parent.is_array()) {
            parent.erase(static_cast<size_t>(std::stoul(ptr.back())));
            return true;
        }
    } catch (const std::exception& e) {
        spdlog::debug("[Config] erase '{}' failed: {}", path, e.what());
    }
    return false;
}

} // namespace dashgrid
