/**
 * @file AxisSolvers.hpp
 * @brief Serial chains of single-axis joints (tracks and positioners)
 *
 * Each joint i contributes Translate(offset_i) * Motion(axis_i, q_i), where
 * Motion is a translation along the axis (track) or a rotation about it
 * (positioner). Frames are relative to the mechanism base.
 *
 * These mechanisms are always driven in joint space: a Cartesian request
 * is reported and the default joints are used.
 */

#pragma once

#include "Joint.hpp"
#include "KinematicSolution.hpp"
#include "MathTypes.hpp"
#include <vector>

namespace robot_cell {
namespace kinematics {

/**
 * Linear axes (prismatic joints, values in mm)
 */
class TrackSolver {
public:
    FrameList forward(const JointValues& q, const std::vector<Joint>& joints) const;

    KinematicSolution solve(const MechanismRequest& request,
                            const std::vector<Joint>& joints) const;
};

/**
 * Rotary axes (revolute joints, values in rad)
 */
class PositionerSolver {
public:
    FrameList forward(const JointValues& q, const std::vector<Joint>& joints) const;

    KinematicSolution solve(const MechanismRequest& request,
                            const std::vector<Joint>& joints) const;
};

} // namespace kinematics
} // namespace robot_cell
