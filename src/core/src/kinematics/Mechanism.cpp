/**
 * @file Mechanism.cpp
 * @brief Mechanism implementation
 */

#include "Mechanism.hpp"
#include <stdexcept>
#include <type_traits>

namespace robot_cell {
namespace kinematics {

std::string mechanismKindToString(MechanismKind kind) {
    switch (kind) {
        case MechanismKind::ARM: return "arm";
        case MechanismKind::TRACK: return "track";
        case MechanismKind::POSITIONER: return "positioner";
    }
    return "unknown";
}

Mechanism::Mechanism(std::string name,
                     const Matrix4d& baseFrame,
                     std::vector<Joint> joints,
                     MechanismSolver solver,
                     bool movesRobot,
                     geometry::GeometryPtr baseGeometry)
    : name_(std::move(name))
    , baseFrame_(baseFrame)
    , joints_(std::move(joints))
    , solver_(std::move(solver))
    , movesRobot_(movesRobot)
    , baseGeometry_(std::move(baseGeometry))
{
    if (std::holds_alternative<SphericalWristSolver>(solver_)) {
        if (joints_.size() != static_cast<size_t>(ARM_JOINTS)) {
            throw std::invalid_argument("Arm '" + name_ + "' needs exactly 6 joints");
        }
        if (movesRobot_) {
            throw std::invalid_argument("Arm '" + name_ + "' cannot carry another robot");
        }
    }
}

MechanismKind Mechanism::kind() const {
    switch (solver_.index()) {
        case 0: return MechanismKind::ARM;
        case 1: return MechanismKind::TRACK;
        default: return MechanismKind::POSITIONER;
    }
}

JointValues Mechanism::defaultJoints() const {
    JointValues q;
    q.reserve(joints_.size());
    for (const auto& j : joints_) q.push_back(j.defaultValue);
    return q;
}

FrameList Mechanism::defaultFrames() const {
    return forward(defaultJoints(), baseFrame_);
}

std::vector<geometry::GeometryPtr> Mechanism::geometries() const {
    std::vector<geometry::GeometryPtr> result;
    result.reserve(joints_.size() + 1);
    result.push_back(baseGeometry_);
    for (const auto& j : joints_) result.push_back(j.geometry);
    return result;
}

FrameList Mechanism::forward(const JointValues& q, const Matrix4d& base) const {
    FrameList local = std::visit(
        [&](const auto& solver) {
            using T = std::decay_t<decltype(solver)>;
            if constexpr (std::is_same_v<T, SphericalWristSolver>) {
                return solver.forward(q);
            } else {
                return solver.forward(q, joints_);
            }
        },
        solver_);

    FrameList frames;
    frames.reserve(local.size() + 1);
    frames.push_back(base);
    for (const auto& T : local) frames.push_back(base * T);
    return frames;
}

KinematicSolution Mechanism::solve(const MechanismRequest& request, const Matrix4d& base) const {
    MechanismRequest local = request;
    if (request.flange) {
        local.flange = inverseTransform(base) * (*request.flange);
    }

    KinematicSolution solution = std::visit(
        [&](const auto& solver) { return solver.solve(local, joints_); },
        solver_);

    FrameList frames;
    frames.reserve(solution.frames.size() + 1);
    frames.push_back(base);
    for (const auto& T : solution.frames) frames.push_back(base * T);
    solution.frames = std::move(frames);

    return solution;
}

Mechanism Mechanism::withJointNumbers(int first) const {
    Mechanism copy = *this;
    for (auto& j : copy.joints_) j.number = first++;
    return copy;
}

} // namespace kinematics
} // namespace robot_cell
