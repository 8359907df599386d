/**
 * @file CellConfig.hpp
 * @brief Robot cell configuration data structures
 *
 * Lengths in mm, angles in degrees (converted when the cell is built).
 */

#pragma once

#include "Manufacturer.hpp"
#include "../frame/FrameTypes.hpp"
#include "../tool/ToolTypes.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace config {

/**
 * Collision envelope of one slot
 */
struct GeometryConfig {
    std::vector<std::array<double, 7>> capsules;   // x0, y0, z0, x1, y1, z1, radius
    std::vector<std::array<double, 4>> spheres;    // x, y, z, radius

    bool empty() const { return capsules.empty() && spheres.empty(); }
};

/**
 * DH row and limits of one arm joint
 */
struct ArmJointConfig {
    std::string name;
    double a = 0.0;                 // Link length (mm)
    double alpha = 0.0;             // Link twist (degrees)
    double d = 0.0;                 // Link offset (mm)
    double theta_offset = 0.0;      // Joint angle offset (degrees)
    double sign = 1.0;              // +1 or -1
    double min = -180.0;            // degrees
    double max = 180.0;             // degrees
    double max_speed = 180.0;       // deg/s
    double default_value = 0.0;     // degrees
    GeometryConfig geometry;
};

struct ArmConfig {
    std::string name = "Robot";
    frame::Frame base;
    GeometryConfig base_geometry;
    std::vector<ArmJointConfig> joints;
};

/**
 * Joint of a track (mm) or positioner (degrees)
 */
struct AxisJointConfig {
    std::string name;
    std::array<double, 3> axis = {0.0, 0.0, 1.0};
    std::array<double, 3> offset = {0.0, 0.0, 0.0};   // mm, from the previous joint frame
    double min = -1000.0;
    double max = 1000.0;
    double max_speed = 500.0;
    double default_value = 0.0;
    GeometryConfig geometry;
};

struct ExternalConfig {
    std::string name = "External";
    std::string kind = "track";     // track | positioner
    bool moves_robot = false;
    frame::Frame base;
    GeometryConfig base_geometry;
    std::vector<AxisJointConfig> joints;
};

struct GroupConfig {
    std::string name = "Group";
    std::optional<ArmConfig> robot;
    std::vector<ExternalConfig> externals;
};

struct ToolConfig {
    std::string name = "DefaultTool";
    tool::ToolTCP tcp;
    double weight = 0.0;            // kg
    GeometryConfig geometry;        // flange coordinates
};

/**
 * Complete robot cell configuration
 */
struct CellConfig {
    std::string name = "RobotCell";
    Manufacturer manufacturer = Manufacturer::OTHER;
    std::vector<GroupConfig> groups;
    std::vector<ToolConfig> tools;
};

} // namespace config
} // namespace robot_cell
