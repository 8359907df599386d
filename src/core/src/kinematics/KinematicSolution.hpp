/**
 * @file KinematicSolution.hpp
 * @brief Request and result of resolving one target against a mechanism
 *        or mechanical group
 */

#pragma once

#include "Configuration.hpp"
#include "MathTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace kinematics {

/**
 * What a single mechanism is asked to reach.
 *
 * Exactly one of `joints` / `flange` is set. Mechanisms receive the flange
 * in world coordinates; solvers receive it relative to the mechanism base.
 * `previous` (may be null) holds this mechanism's joints at the previous
 * target, in the same order as its joint list.
 */
struct MechanismRequest {
    std::optional<JointValues> joints;
    std::optional<Matrix4d> flange;
    std::optional<Configuration> configuration;
    const JointValues* previous = nullptr;

    static MechanismRequest jointSpace(const JointValues& values,
                                       const JointValues* previous = nullptr) {
        MechanismRequest r;
        r.joints = values;
        r.previous = previous;
        return r;
    }

    static MechanismRequest cartesian(const Matrix4d& flange,
                                      const std::optional<Configuration>& configuration,
                                      const JointValues* previous = nullptr) {
        MechanismRequest r;
        r.flange = flange;
        r.configuration = configuration;
        r.previous = previous;
        return r;
    }
};

/**
 * Resolved joints, frames, configuration and diagnostics.
 *
 * For a mechanical group, `joints` is indexed by joint number and
 * `frames` holds, in order: every external's base and joint frames, the
 * robot's base and joint frames, then the tool (TCP) frame.
 * An empty error list only means resolution did not fail.
 */
struct KinematicSolution {
    JointValues joints;
    FrameList frames;
    Configuration configuration;
    std::vector<std::string> errors;

    bool hasErrors() const { return !errors.empty(); }

    const Matrix4d& toolFrame() const { return frames.back(); }
};

} // namespace kinematics
} // namespace robot_cell
