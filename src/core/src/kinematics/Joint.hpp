/**
 * @file Joint.hpp
 * @brief Joint of a mechanism
 */

#pragma once

#include "MathTypes.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include <string>

namespace robot_cell {
namespace kinematics {

enum class JointType {
    REVOLUTE,   // rad
    PRISMATIC   // mm
};

/**
 * Joint of a mechanism.
 *
 * `number` is the joint's index within its mechanical group: robot joints
 * first, then the joints of each external in declaration order.
 * axis/offset are only read by track and positioner mechanisms.
 */
struct Joint {
    int number = 0;
    std::string name;
    JointType type = JointType::REVOLUTE;

    double minValue = -PI;
    double maxValue = PI;
    double maxSpeed = PI;       // rad/s or mm/s
    double defaultValue = 0.0;

    Vector3d axis = Vector3d::UnitZ();
    Vector3d offset = Vector3d::Zero();

    geometry::GeometryPtr geometry;   // world coordinates at the default pose

    bool isWithinRange(double value, double tolerance = 1e-9) const {
        return value >= minValue - tolerance && value <= maxValue + tolerance;
    }

    bool isRevolute() const { return type == JointType::REVOLUTE; }
};

} // namespace kinematics
} // namespace robot_cell
