/**
 * @file FrameTypes.hpp
 * @brief Frames as written in configuration, and target reference frames
 */

#pragma once

#include "../kinematics/MathTypes.hpp"
#include <array>
#include <string>

namespace robot_cell {
namespace frame {

/**
 * @brief 6-DOF frame as read from configuration
 *
 * Position in mm, orientation in degrees (Euler ZYX: Rz * Ry * Rx)
 */
struct Frame {
    double x = 0.0;   // mm
    double y = 0.0;   // mm
    double z = 0.0;   // mm
    double rx = 0.0;  // degrees (rotation around X)
    double ry = 0.0;  // degrees (rotation around Y)
    double rz = 0.0;  // degrees (rotation around Z)

    Eigen::Matrix4d toMatrix() const {
        using namespace kinematics;
        Vector3d rpy(degToRad(rx), degToRad(ry), degToRad(rz));
        return makeTransform(rpyToRotation(rpy), Vector3d(x, y, z));
    }

    static Frame fromMatrix(const Eigen::Matrix4d& mat) {
        using namespace kinematics;
        Vector3d p = translationOf(mat);
        Vector3d rpy = rotationToRPY(rotationOf(mat));
        return Frame{p.x(), p.y(), p.z(),
                     radToDeg(rpy(0)), radToDeg(rpy(1)), radToDeg(rpy(2))};
    }

    std::array<double, 6> toArray() const {
        return {x, y, z, rx, ry, rz};
    }
};

/**
 * @brief Reference frame a Cartesian target is expressed in
 *
 * A coupled frame follows the last resolved frame of an external
 * mechanism: the plane is re-oriented by that frame before solving.
 * A coupled group of -1 means the target's own group.
 */
struct TargetFrame {
    std::string name = "world";
    Eigen::Matrix4d plane = Eigen::Matrix4d::Identity();
    int coupledMechanicalGroup = -1;
    int coupledMechanism = -1;

    bool isCoupled() const {
        return coupledMechanism != -1;
    }

    static TargetFrame world() { return TargetFrame{}; }

    static TargetFrame coupled(const Eigen::Matrix4d& plane, int group, int mechanism,
                               const std::string& name = "coupled") {
        TargetFrame f;
        f.name = name;
        f.plane = plane;
        f.coupledMechanicalGroup = group;
        f.coupledMechanism = mechanism;
        return f;
    }
};

} // namespace frame
} // namespace robot_cell
