/**
 * @file Mechanism.hpp
 * @brief A rigid kinematic chain on a base frame (arm, track or positioner)
 */

#pragma once

#include "AxisSolvers.hpp"
#include "Joint.hpp"
#include "KinematicSolution.hpp"
#include "MathTypes.hpp"
#include "SphericalWristSolver.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include <string>
#include <variant>
#include <vector>

namespace robot_cell {
namespace kinematics {

using MechanismSolver = std::variant<SphericalWristSolver, TrackSolver, PositionerSolver>;

enum class MechanismKind {
    ARM,
    TRACK,
    POSITIONER
};

std::string mechanismKindToString(MechanismKind kind);

/**
 * Mechanism.
 *
 * Immutable once built. Frames produced by forward()/solve() are
 * [base, joint_1 .. joint_N] in world coordinates. A mechanism that
 * `movesRobot` carries the robot of its group on its last frame.
 */
class Mechanism {
public:
    Mechanism(std::string name,
              const Matrix4d& baseFrame,
              std::vector<Joint> joints,
              MechanismSolver solver,
              bool movesRobot = false,
              geometry::GeometryPtr baseGeometry = nullptr);

    const std::string& name() const { return name_; }
    MechanismKind kind() const;
    bool isArm() const { return kind() == MechanismKind::ARM; }
    bool movesRobot() const { return movesRobot_; }

    const Matrix4d& baseFrame() const { return baseFrame_; }
    const std::vector<Joint>& joints() const { return joints_; }
    size_t jointCount() const { return joints_.size(); }
    const MechanismSolver& solver() const { return solver_; }

    JointValues defaultJoints() const;

    /**
     * Frames at the default joints on the mechanism's own base
     */
    FrameList defaultFrames() const;

    /**
     * Geometry per frame slot: base first, then one per joint (entries may be null)
     */
    std::vector<geometry::GeometryPtr> geometries() const;

    FrameList forward(const JointValues& q, const Matrix4d& base) const;

    /**
     * Resolve a request on the given base (world coordinates).
     */
    KinematicSolution solve(const MechanismRequest& request, const Matrix4d& base) const;

    /**
     * Copy with joints renumbered from `first`
     */
    Mechanism withJointNumbers(int first) const;

private:
    std::string name_;
    Matrix4d baseFrame_;
    std::vector<Joint> joints_;
    MechanismSolver solver_;
    bool movesRobot_;
    geometry::GeometryPtr baseGeometry_;
};

} // namespace kinematics
} // namespace robot_cell
