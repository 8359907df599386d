/**
 * @file SystemConfig.hpp
 * @brief System configuration data structures
 */

#pragma once

#include <string>
#include <vector>

namespace robot_cell {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/robot_cell.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool file_enabled = true;
};

/**
 * Program check configuration
 */
struct CheckConfig {
    double linear_step = 1.0;               // mm
    double angular_step = 1.0;              // degrees
    double joint_jump_factor = 10.0;        // x step
    double default_translation_speed = 100.0;   // mm/s
    double default_rotation_speed = 90.0;       // deg/s
};

/**
 * Collision check configuration
 */
struct CollisionConfig {
    double linear_step = 100.0;     // mm
    double angular_step = 45.0;     // degrees
    std::vector<int> first = {7};
    std::vector<int> second = {4};
};

/**
 * Complete system configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    CheckConfig check;
    CollisionConfig collision;
};

} // namespace config
} // namespace robot_cell
