/**
 * @file ToolTypes.hpp
 * @brief Tools mounted on the last frame of a mechanical group
 */

#pragma once

#include "../frame/FrameTypes.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include <Eigen/Core>
#include <memory>
#include <string>

namespace robot_cell {
namespace tool {

/// TCP offset from the flange (mm, degrees ZYX)
using ToolTCP = frame::Frame;

/**
 * Tool.
 *
 * Cartesian targets place the TCP; the robot is solved for the flange
 * behind it. Geometry is given in flange coordinates and moves with the
 * flange.
 */
struct Tool {
    std::string name = "DefaultTool";
    ToolTCP tcp;
    double weight = 0.0;                 // kg
    geometry::GeometryPtr geometry;      // may be null

    /// Flange to TCP
    Eigen::Matrix4d tcpFrame() const;

    /// Flange pose that puts the TCP at `tcpPose`
    Eigen::Matrix4d flangeFor(const Eigen::Matrix4d& tcpPose) const;

    /// True when the TCP sits on the flange
    bool isFlange() const;

    static std::shared_ptr<const Tool> defaultTool();
};

using ToolPtr = std::shared_ptr<const Tool>;

} // namespace tool
} // namespace robot_cell
