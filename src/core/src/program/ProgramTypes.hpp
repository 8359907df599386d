/**
 * @file ProgramTypes.hpp
 * @brief Diagnostics, keyframes and simulation poses of a checked program
 */

#pragma once

#include "../kinematics/KinematicSolution.hpp"
#include <string>
#include <vector>

namespace robot_cell {
namespace program {

using kinematics::KinematicSolution;

/**
 * Kinematic diagnostic attached to one target of one group.
 * Never aborts a check.
 */
struct Diagnostic {
    int targetIndex = 0;
    int group = 0;
    std::string message;
};

/**
 * Resolved pose of every group at a point in time.
 * `targetIndex` is the target being moved to (the target itself for the
 * keyframe of a target).
 */
struct Keyframe {
    double time = 0.0;      // s
    int targetIndex = 0;
    std::vector<KinematicSolution> solutions;
};

struct SimulationPose {
    double time = 0.0;      // s
    int targetIndex = 0;
    std::vector<KinematicSolution> solutions;
};

} // namespace program
} // namespace robot_cell
