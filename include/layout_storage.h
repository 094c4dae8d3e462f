// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>

namespace dashgrid {

class Config;

/// Storage key of the live layout document
constexpr const char* LAYOUT_STORAGE_KEY = "/dashboard/widget_layout";
/// Storage key of the user template array (seed templates are never stored)
constexpr const char* TEMPLATES_STORAGE_KEY = "/dashboard/widget_templates";

/**
 * @brief Opaque key/value persistence substrate for layout documents
 *
 * Values are serialized JSON text. Implementations must not throw.
 */
class LayoutStorage {
  public:
    virtual ~LayoutStorage() = default;

    /// @return stored bytes, or std::nullopt if the key was never written
    virtual std::optional<std::string> read(const std::string& key) = 0;

    /// @return false if the value could not be persisted
    virtual bool write(const std::string& key, const std::string& bytes) = 0;
};

/**
 * @brief LayoutStorage backed by the JSON settings file
 *
 * Keys are JSON pointers into the Config document. Valid JSON is stored as a
 * nested subtree so the settings file stays hand-editable; anything else is
 * stored verbatim as a string and handed back unchanged by read().
 */
class ConfigLayoutStorage : public LayoutStorage {
  public:
    explicit ConfigLayoutStorage(Config& config);

    std::optional<std::string> read(const std::string& key) override;
    bool write(const std::string& key, const std::string& bytes) override;

  private:
    Config& config_;
};

} // namespace dashgrid
