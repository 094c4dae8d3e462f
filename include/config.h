// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace dashgrid {

using json = nlohmann::json;

/// Serialize without throwing; invalid UTF-8 is replaced with U+FFFD
std::string dump_json(const json& j, int indent = -1);

/**
 * @brief JSON-file backed settings store addressed with JSON pointers
 *
 * Paths follow RFC 6901 ("/dashboard/widget_layout"). Reads never throw:
 * a missing key or a type mismatch yields the supplied default. The file is
 * written atomically (temp file + rename) by save().
 *
 * Thread safety: Single-threaded, main LVGL thread only.
 */
class Config {
  public:
    Config() = default;
    explicit Config(std::string path);

    /// Process-wide instance. Path comes from $DASHGRID_CONFIG or DEFAULT_PATH.
    static Config* get_instance();

    static constexpr const char* DEFAULT_PATH = "config/dashgrid.json";

    /// Read the backing file. A missing file yields an empty document (true);
    /// an unparseable one yields an empty document and returns false.
    bool load();

    /// Write the document to disk. Returns false (and logs) on I/O failure.
    bool save();

    const std::string& path() const {
        return path_;
    }

    bool exists(const std::string& path) const;

    template <typename T> T get(const std::string& path, const T& default_value) const {
        try {
            json::json_pointer ptr(path);
            if (!data.contains(ptr)) {
                return default_value;
            }
            return data.at(ptr).get<T>();
        } catch (const json::exception& e) {
            spdlog::debug("[Config] get '{}' failed: {}", path, e.what());
            return default_value;
        }
    }

    template <typename T> bool set(const std::string& path, const T& value) {
        try {
            data[json::json_pointer(path)] = value;
            return true;
        } catch (const json::exception& e) {
            spdlog::warn("[Config] set '{}' failed: {}", path, e.what());
            return false;
        }
    }

    /// Mutable access to a subtree ("" = document root). Creates the key if absent.
    json& get_json(const std::string& path);

    /// Remove a key. Returns true if it existed.
    bool erase(const std::string& path);

  private:
    friend class ConfigFixture;

    std::string path_;
    json data = json::object();
};

} // namespace dashgrid
