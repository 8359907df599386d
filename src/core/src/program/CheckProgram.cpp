/**
 * @file CheckProgram.cpp
 * @brief CheckProgram implementation
 */

#include "CheckProgram.hpp"
#include "../logging/Logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace robot_cell {
namespace program {

using kinematics::JointValues;
using kinematics::Matrix4d;

CheckSettings CheckSettings::fromConfig(const config::CheckConfig& config) {
    CheckSettings settings;
    settings.linearStep = config.linear_step;
    settings.angularStep = kinematics::degToRad(config.angular_step);
    settings.jointJumpFactor = config.joint_jump_factor;
    return settings;
}

CheckProgram::CheckProgram(const kinematics::RobotCell& cell,
                           const std::vector<target::Toolpath>& toolpaths,
                           const CheckSettings& settings)
    : cell_(cell)
    , settings_(settings)
{
    CheckSettings defaults;
    if (settings_.linearStep <= 0.0) {
        LOG_WARN("Invalid linear step {}, using {}", settings_.linearStep, defaults.linearStep);
        settings_.linearStep = defaults.linearStep;
    }
    if (settings_.angularStep <= 0.0) {
        LOG_WARN("Invalid angular step {}, using {}", settings_.angularStep, defaults.angularStep);
        settings_.angularStep = defaults.angularStep;
    }
    if (settings_.jointJumpFactor <= 0.0) {
        settings_.jointJumpFactor = defaults.jointJumpFactor;
    }

    if (!validate(toolpaths)) {
        for (const auto& e : errors_) LOG_WARN("Program check: {}", e);
        return;
    }

    resolveTargets(toolpaths);
    buildKeyframes();

    LOG_DEBUG("Program check: {} target(s), {} keyframe(s), {} diagnostic(s)",
              fixedTargets_.size(), keyframes_.size(), diagnostics_.size());
}

// ============================================================================
// Structural validation
// ============================================================================

bool CheckProgram::validate(const std::vector<target::Toolpath>& toolpaths) {
    const auto& groups = cell_.groups();

    if (toolpaths.size() != groups.size()) {
        errors_.push_back(fmt::format(
            "You supplied {} toolpath(s), this robot cell requires {} toolpath(s)",
            toolpaths.size(), groups.size()));
        return false;
    }

    const size_t count = toolpaths.front().size();
    for (const auto& toolpath : toolpaths) {
        if (toolpath.size() != count) {
            errors_.push_back("All toolpaths must contain the same number of targets");
            return false;
        }
    }

    if (count == 0) {
        errors_.push_back("The program must contain at least 1 target");
        return false;
    }

    for (size_t i = 0; i < count; ++i) {
        for (size_t g = 0; g < groups.size(); ++g) {
            const auto& t = toolpaths[g][i];
            if (!t) {
                errors_.push_back(fmt::format("Target index {} is null or invalid", i));
                return false;
            }

            if (const auto* joints = t->joints()) {
                size_t expected = groups[g].robotJointCount();
                if (joints->joints.size() != expected) {
                    errors_.push_back(fmt::format(
                        "Target index {} of group '{}' has {} joint value(s), should have {}",
                        i, groups[g].name(), joints->joints.size(), expected));
                    return false;
                }
            }

            const auto& frame = t->frame;
            if (frame.isCoupled()) {
                int source = frame.coupledMechanicalGroup == -1
                           ? static_cast<int>(g) : frame.coupledMechanicalGroup;
                bool valid = source >= 0 && source < static_cast<int>(groups.size()) &&
                             groups[source].externalFrameIndex(frame.coupledMechanism) != -1;
                if (!valid) {
                    errors_.push_back(fmt::format(
                        "Target index {} frame '{}' is coupled to mechanism {} of group {} "
                        "which does not exist",
                        i, frame.name, frame.coupledMechanism, source));
                    return false;
                }
            }
        }
    }

    return true;
}

// ============================================================================
// Resolution
// ============================================================================

void CheckProgram::resolveTargets(const std::vector<target::Toolpath>& toolpaths) {
    const size_t count = toolpaths.front().size();
    const size_t groups = toolpaths.size();

    std::vector<JointValues> previous;

    for (size_t i = 0; i < count; ++i) {
        target::CellTarget cellTarget;
        cellTarget.index = static_cast<int>(i);
        for (size_t g = 0; g < groups; ++g) {
            cellTarget.programTargets.push_back({ toolpaths[g][i], static_cast<int>(g) });
        }

        auto solutions = cell_.solve(cellTarget, i == 0 ? nullptr : &previous);

        previous.clear();
        for (size_t g = 0; g < groups; ++g) {
            const auto& solution = solutions[g];
            previous.push_back(solution.joints);

            for (const auto& error : solution.errors) {
                diagnostics_.push_back({ static_cast<int>(i), static_cast<int>(g), error });
                LOG_DEBUG("Target {} group {}: {}", i, g, error);
            }

            // Fix the branch so generated code reproduces this solution
            auto& programTarget = cellTarget.programTargets[g];
            const auto* cartesian = programTarget.target->cartesian();
            if (cartesian && !cartesian->configuration && cell_.group(static_cast<int>(g)).robot()) {
                programTarget.target = std::make_shared<const target::Target>(
                    programTarget.target->withConfiguration(solution.configuration));
            }
        }

        fixedTargets_.push_back(std::move(cellTarget));
        solutions_.push_back(std::move(solutions));
    }
}

// ============================================================================
// Keyframes
// ============================================================================

namespace {

bool isLinear(const target::Target& t, const kinematics::MechanicalGroup& group) {
    return t.motion == target::Motion::LINEAR && t.isCartesian() && group.robot() != nullptr;
}

} // namespace

double CheckProgram::segmentDuration(int index) const {
    double duration = 0.0;

    for (size_t g = 0; g < cell_.groups().size(); ++g) {
        const auto& group = cell_.group(static_cast<int>(g));
        const auto& t = fixedTargets_[index].target(static_cast<int>(g));
        const auto& from = solutions_[index - 1][g];
        const auto& to = solutions_[index][g];

        double d = 0.0;
        if (t.speed.time > 0.0) {
            d = t.speed.time;
        } else {
            if (t.speed.translation > 0.0) {
                d = std::max(d, kinematics::translationBetween(from.toolFrame(), to.toolFrame())
                                / t.speed.translation);
            }
            if (t.speed.rotation > 0.0) {
                d = std::max(d, kinematics::rotationAngleBetween(from.toolFrame(), to.toolFrame())
                                / t.speed.rotation);
            }
            for (size_t j = 0; j < group.jointCount(); ++j) {
                double maxSpeed = group.joints()[j].maxSpeed;
                if (maxSpeed <= 0.0) continue;
                d = std::max(d, std::abs(to.joints[j] - from.joints[j]) / maxSpeed);
            }
        }

        duration = std::max(duration, d);
    }

    return duration;
}

int CheckProgram::subdivisions(int index) const {
    double steps = 1.0;

    for (size_t g = 0; g < cell_.groups().size(); ++g) {
        const auto& group = cell_.group(static_cast<int>(g));
        const auto& from = solutions_[index - 1][g];
        const auto& to = solutions_[index][g];

        steps = std::max(steps, kinematics::translationBetween(from.toolFrame(), to.toolFrame())
                                / settings_.linearStep);
        steps = std::max(steps, kinematics::rotationAngleBetween(from.toolFrame(), to.toolFrame())
                                / settings_.angularStep);

        for (size_t j = 0; j < group.jointCount(); ++j) {
            double step = group.joints()[j].isRevolute() ? settings_.angularStep
                                                         : settings_.linearStep;
            steps = std::max(steps, std::abs(to.joints[j] - from.joints[j]) / step);
        }
    }

    return static_cast<int>(std::ceil(steps - 1e-9));
}

KinematicSolution CheckProgram::sample(int index, int group, double s,
                                       const KinematicSolution& previous) const
{
    const auto& mechanicalGroup = cell_.group(group);
    const auto& from = solutions_[index - 1][group];
    const auto& to = solutions_[index][group];

    // Work on a copy; program targets are never modified
    target::Target t = fixedTargets_[index].target(group);

    JointValues joints(from.joints.size());
    for (size_t j = 0; j < joints.size(); ++j) {
        joints[j] = from.joints[j] + s * (to.joints[j] - from.joints[j]);
    }

    const auto robotCount = static_cast<std::ptrdiff_t>(mechanicalGroup.robotJointCount());
    t.external.assign(joints.begin() + robotCount, joints.end());

    if (isLinear(t, mechanicalGroup)) {
        target::CartesianTarget cartesian;
        cartesian.pose = kinematics::interpolateTransform(from.toolFrame(), to.toolFrame(), s);
        t.goal = cartesian;
        t.frame = frame::TargetFrame::world();
        return mechanicalGroup.resolve(t, &previous.joints);
    }

    t.goal = target::JointTarget{ JointValues(joints.begin(), joints.begin() + robotCount) };
    auto solution = mechanicalGroup.resolve(t);
    // Joint-space samples inherit the diagnostics of their end targets
    solution.errors.clear();
    return solution;
}

void CheckProgram::buildKeyframes() {
    const size_t groups = cell_.groups().size();
    const int count = static_cast<int>(solutions_.size());

    auto isJump = [&](int g, const KinematicSolution& a, const KinematicSolution& b) {
        const auto& group = cell_.group(g);
        if (group.robot() && a.configuration != b.configuration) return true;
        for (size_t j = 0; j < group.jointCount(); ++j) {
            double step = group.joints()[j].isRevolute() ? settings_.angularStep
                                                         : settings_.linearStep;
            if (std::abs(b.joints[j] - a.joints[j]) > settings_.jointJumpFactor * step) return true;
        }
        return false;
    };

    double time = 0.0;
    keyframes_.push_back({ time, 0, solutions_[0] });

    for (int i = 1; i < count; ++i) {
        double duration = segmentDuration(i);
        int n = subdivisions(i);

        std::vector<KinematicSolution> last = solutions_[i - 1];
        std::vector<bool> unreachable(groups, false);
        std::vector<bool> discontinuous(groups, false);

        for (int k = 1; k < n; ++k) {
            double s = static_cast<double>(k) / n;

            Keyframe keyframe;
            keyframe.time = time + s * duration;
            keyframe.targetIndex = i;

            for (size_t g = 0; g < groups; ++g) {
                int gi = static_cast<int>(g);
                auto solution = sample(i, gi, s, last[g]);

                if (isLinear(fixedTargets_[i].target(gi), cell_.group(gi))) {
                    if (solution.hasErrors() && !unreachable[g]) {
                        diagnostics_.push_back({ i, gi,
                            "Linear motion passes through an invalid pose: " + solution.errors.front() });
                        unreachable[g] = true;
                    }
                    if (!discontinuous[g] && isJump(gi, last[g], solution)) {
                        diagnostics_.push_back({ i, gi, "Joint discontinuity in linear motion" });
                        discontinuous[g] = true;
                    }
                }

                last[g] = solution;
                keyframe.solutions.push_back(std::move(solution));
            }

            keyframes_.push_back(std::move(keyframe));
        }

        for (size_t g = 0; g < groups; ++g) {
            int gi = static_cast<int>(g);
            if (isLinear(fixedTargets_[i].target(gi), cell_.group(gi)) &&
                !discontinuous[g] && isJump(gi, last[g], solutions_[i][g])) {
                diagnostics_.push_back({ i, gi, "Joint discontinuity in linear motion" });
            }
        }

        time += duration;
        keyframes_.push_back({ time, i, solutions_[i] });
    }
}

} // namespace program
} // namespace robot_cell
