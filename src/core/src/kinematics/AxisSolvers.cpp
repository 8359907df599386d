/**
 * @file AxisSolvers.cpp
 * @brief Track and positioner kinematics
 */

#include "AxisSolvers.hpp"
#include <spdlog/fmt/fmt.h>

namespace robot_cell {
namespace kinematics {

namespace {

Matrix4d axisMotion(const Joint& joint, double value) {
    Vector3d axis = joint.axis.normalized();
    if (joint.isRevolute()) {
        return makeTransform(AngleAxisd(value, axis).toRotationMatrix(), Vector3d::Zero());
    }
    return makeTranslation(axis * value);
}

FrameList chain(const JointValues& q, const std::vector<Joint>& joints) {
    FrameList frames;
    frames.reserve(joints.size());

    Matrix4d T = Matrix4d::Identity();
    for (size_t i = 0; i < joints.size(); ++i) {
        double value = i < q.size() ? q[i] : joints[i].defaultValue;
        T = T * makeTranslation(joints[i].offset) * axisMotion(joints[i], value);
        frames.push_back(T);
    }
    return frames;
}

KinematicSolution solveChain(const MechanismRequest& request,
                             const std::vector<Joint>& joints) {
    KinematicSolution solution;

    if (request.joints) {
        solution.joints = *request.joints;
    } else {
        if (request.flange) {
            solution.errors.push_back("External axes can only be driven by joint values");
        }
        for (const auto& j : joints) solution.joints.push_back(j.defaultValue);
    }

    for (size_t i = 0; i < joints.size() && i < solution.joints.size(); ++i) {
        const Joint& j = joints[i];
        double value = solution.joints[i];
        if (j.isWithinRange(value)) continue;

        if (j.isRevolute()) {
            solution.errors.push_back(fmt::format(
                "Joint {} value {:.2f} deg is outside its range [{:.2f}, {:.2f}] deg",
                j.name, radToDeg(value), radToDeg(j.minValue), radToDeg(j.maxValue)));
        } else {
            solution.errors.push_back(fmt::format(
                "Joint {} value {:.2f} mm is outside its range [{:.2f}, {:.2f}] mm",
                j.name, value, j.minValue, j.maxValue));
        }
    }

    solution.frames = chain(solution.joints, joints);
    return solution;
}

} // namespace

// ============================================================================
// TrackSolver
// ============================================================================

FrameList TrackSolver::forward(const JointValues& q, const std::vector<Joint>& joints) const {
    return chain(q, joints);
}

KinematicSolution TrackSolver::solve(const MechanismRequest& request,
                                     const std::vector<Joint>& joints) const {
    return solveChain(request, joints);
}

// ============================================================================
// PositionerSolver
// ============================================================================

FrameList PositionerSolver::forward(const JointValues& q, const std::vector<Joint>& joints) const {
    return chain(q, joints);
}

KinematicSolution PositionerSolver::solve(const MechanismRequest& request,
                                          const std::vector<Joint>& joints) const {
    return solveChain(request, joints);
}

} // namespace kinematics
} // namespace robot_cell
