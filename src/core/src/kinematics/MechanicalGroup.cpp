/**
 * @file MechanicalGroup.cpp
 * @brief MechanicalGroup implementation
 */

#include "MechanicalGroup.hpp"
#include "../logging/Logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace robot_cell {
namespace kinematics {

MechanicalGroup::MechanicalGroup(std::string name,
                                 int index,
                                 std::optional<Mechanism> robot,
                                 std::vector<Mechanism> externals)
    : name_(std::move(name))
    , index_(index)
{
    if (robot && !robot->isArm()) {
        throw std::invalid_argument("Group '" + name_ + "': robot must be an arm");
    }

    int number = 0;
    if (robot) {
        robot_ = robot->withJointNumbers(number);
        number += static_cast<int>(robot_->jointCount());
    }

    bool carrier = false;
    for (const auto& external : externals) {
        if (external.isArm()) {
            throw std::invalid_argument("Group '" + name_ + "': external '" +
                                        external.name() + "' cannot be an arm");
        }
        if (external.movesRobot()) {
            if (carrier) {
                throw std::invalid_argument("Group '" + name_ +
                                            "': only one external can move the robot");
            }
            carrier = true;
        }
        externals_.push_back(external.withJointNumbers(number));
        number += static_cast<int>(external.jointCount());
    }

    joints_.resize(number);
    if (robot_) {
        for (const auto& j : robot_->joints()) joints_[j.number] = j;
    }
    for (const auto& external : externals_) {
        for (const auto& j : external.joints()) joints_[j.number] = j;
    }
}

size_t MechanicalGroup::robotJointCount() const {
    return robot_ ? robot_->jointCount() : 0;
}

size_t MechanicalGroup::externalJointCount() const {
    return joints_.size() - robotJointCount();
}

JointValues MechanicalGroup::defaultJoints() const {
    JointValues q;
    q.reserve(joints_.size());
    for (const auto& j : joints_) q.push_back(j.defaultValue);
    return q;
}

int MechanicalGroup::externalFrameIndex(int mechanism) const {
    if (mechanism < 0 || mechanism >= static_cast<int>(externals_.size())) return -1;

    int index = -1;
    for (int m = 0; m <= mechanism; ++m) {
        index += static_cast<int>(externals_[m].jointCount()) + 1;
    }
    return index;
}

size_t MechanicalGroup::frameCount() const {
    size_t count = 1;  // tool
    for (const auto& external : externals_) count += external.jointCount() + 1;
    if (robot_) count += robot_->jointCount() + 1;
    return count;
}

FrameList MechanicalGroup::defaultFrames() const {
    FrameList frames;
    Matrix4d robotBase = robot_ ? robot_->baseFrame() : Matrix4d::Identity();

    for (const auto& external : externals_) {
        FrameList f = external.defaultFrames();
        if (external.movesRobot()) robotBase = f.back();
        frames.insert(frames.end(), f.begin(), f.end());
    }

    if (robot_) {
        FrameList f = robot_->forward(robot_->defaultJoints(), robotBase);
        frames.insert(frames.end(), f.begin(), f.end());
    }

    frames.push_back(frames.empty() ? Matrix4d::Identity() : frames.back());
    return frames;
}

std::vector<geometry::GeometryPtr> MechanicalGroup::geometries() const {
    std::vector<geometry::GeometryPtr> result;
    for (const auto& external : externals_) {
        auto g = external.geometries();
        result.insert(result.end(), g.begin(), g.end());
    }
    if (robot_) {
        auto g = robot_->geometries();
        result.insert(result.end(), g.begin(), g.end());
    }
    result.push_back(nullptr);
    return result;
}

JointValues MechanicalGroup::subset(const JointValues& values, const Mechanism& mechanism) {
    JointValues result;
    result.reserve(mechanism.jointCount());
    for (const auto& j : mechanism.joints()) result.push_back(values[j.number]);
    return result;
}

// ============================================================================
// Resolve
// ============================================================================

KinematicSolution MechanicalGroup::resolve(const target::Target& target,
                                           const JointValues* previous,
                                           const std::optional<Matrix4d>& coupledFrame,
                                           const std::optional<Matrix4d>& baseFrame) const
{
    KinematicSolution solution;
    solution.joints.assign(joints_.size(), 0.0);

    if (previous && previous->size() != joints_.size()) {
        solution.errors.push_back(fmt::format(
            "Previous joints contain {} value(s), should contain {} values",
            previous->size(), joints_.size()));
        previous = nullptr;
    }

    // ---- External values by joint number, padded with defaults ----
    JointValues external;
    for (const auto& mechanism : externals_) {
        for (const auto& j : mechanism.joints()) external.push_back(j.defaultValue);
    }
    if (!target.external.empty() && target.external.size() != external.size()) {
        solution.errors.push_back(fmt::format(
            "External values contain {} value(s), should contain {} values",
            target.external.size(), external.size()));
    }
    for (size_t i = 0; i < external.size() && i < target.external.size(); ++i) {
        external[i] = target.external[i];
    }

    // ---- Target frame coupling ----
    const auto& frame = target.frame;
    std::optional<Matrix4d> coupling;
    const Mechanism* coupledMechanism = nullptr;

    if (frame.isCoupled()) {
        bool ownGroup = frame.coupledMechanicalGroup == -1 || frame.coupledMechanicalGroup == index_;
        if (ownGroup) {
            if (frame.coupledMechanism < 0 ||
                frame.coupledMechanism >= static_cast<int>(externals_.size())) {
                solution.errors.push_back(fmt::format(
                    "Frame '{}' is coupled to mechanism {} which does not exist",
                    frame.name, frame.coupledMechanism));
            } else {
                coupledMechanism = &externals_[frame.coupledMechanism];
            }
        } else if (coupledFrame) {
            coupling = coupledFrame;
        } else {
            solution.errors.push_back(fmt::format(
                "Frame '{}' is coupled to group {} which was not resolved",
                frame.name, frame.coupledMechanicalGroup));
        }
    }

    // ---- Externals ----
    std::optional<Matrix4d> robotBase = baseFrame;
    size_t offset = 0;

    for (const auto& mechanism : externals_) {
        JointValues values(external.begin() + offset,
                           external.begin() + offset + mechanism.jointCount());
        offset += mechanism.jointCount();

        JointValues prev;
        if (previous) prev = subset(*previous, mechanism);

        auto request = MechanismRequest::jointSpace(values, previous ? &prev : nullptr);
        auto result = mechanism.solve(request, baseFrame.value_or(mechanism.baseFrame()));

        for (size_t i = 0; i < mechanism.jointCount(); ++i) {
            solution.joints[mechanism.joints()[i].number] = result.joints[i];
        }
        solution.frames.insert(solution.frames.end(), result.frames.begin(), result.frames.end());
        solution.errors.insert(solution.errors.end(), result.errors.begin(), result.errors.end());

        if (&mechanism == coupledMechanism) coupling = result.frames.back();
        if (mechanism.movesRobot()) robotBase = result.frames.back();
    }

    const auto* tool = target.tool ? target.tool.get() : tool::Tool::defaultTool().get();
    Matrix4d tcp = tool->tcpFrame();

    // ---- Robot ----
    if (robot_) {
        const Mechanism& robot = *robot_;
        JointValues prev;
        if (previous) prev = subset(*previous, robot);
        const JointValues* robotPrevious = previous ? &prev : nullptr;

        MechanismRequest request;
        if (const auto* cartesian = target.cartesian()) {
            Matrix4d plane = coupling ? Matrix4d(*coupling * frame.plane) : frame.plane;
            Matrix4d flange = tool->flangeFor(plane * cartesian->pose);
            request = MechanismRequest::cartesian(flange, cartesian->configuration, robotPrevious);
        } else {
            const auto& values = target.joints()->joints;
            if (values.size() == robot.jointCount()) {
                request = MechanismRequest::jointSpace(values, robotPrevious);
            } else {
                solution.errors.push_back(fmt::format(
                    "Joint target contains {} value(s), should contain {} values",
                    values.size(), robot.jointCount()));
                request = MechanismRequest::jointSpace(robot.defaultJoints(), robotPrevious);
            }
        }

        auto result = robot.solve(request, robotBase.value_or(robot.baseFrame()));

        for (size_t i = 0; i < robot.jointCount(); ++i) {
            solution.joints[robot.joints()[i].number] = result.joints[i];
        }
        solution.frames.insert(solution.frames.end(), result.frames.begin(), result.frames.end());
        solution.errors.insert(solution.errors.end(), result.errors.begin(), result.errors.end());
        solution.configuration = result.configuration;
    }

    // ---- Tool ----
    Matrix4d last = solution.frames.empty() ? Matrix4d::Identity() : solution.frames.back();
    solution.frames.push_back(last * tcp);

    if (solution.hasErrors()) {
        LOG_DEBUG("Group '{}' resolved with {} diagnostic(s)", name_, solution.errors.size());
    }

    return solution;
}

} // namespace kinematics
} // namespace robot_cell
