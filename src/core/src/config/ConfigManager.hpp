/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "CellConfig.hpp"
#include "SystemConfig.hpp"

namespace robot_cell {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Manages loading and access to the robot cell and system configuration.
 * A failed load leaves the previous configuration in place.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load robot cell configuration from YAML file
     * @param filepath Path to cell_config.yaml
     * @return true if loaded successfully
     */
    bool loadCellConfig(const std::string& filepath);

    /**
     * Load robot cell configuration from a YAML document
     */
    bool loadCellConfigFromString(const std::string& yaml);

    /**
     * Load system configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Load system configuration from a YAML document
     */
    bool loadSystemConfigFromString(const std::string& yaml);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     * @return true if all configs loaded successfully
     */
    bool loadAll(const std::string& config_dir = "config");

    const CellConfig& cellConfig() const { return m_cell_config; }
    const SystemConfig& systemConfig() const { return m_system_config; }

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON
     */
    std::string cellConfigToJson() const;
    std::string systemConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool applyCellConfig(const std::string& source, bool fromFile);
    bool applySystemConfig(const std::string& source, bool fromFile);

    CellConfig m_cell_config;
    SystemConfig m_system_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace robot_cell
