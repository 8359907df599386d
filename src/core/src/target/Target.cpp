/**
 * @file Target.cpp
 * @brief Target helpers
 */

#include "Target.hpp"

namespace robot_cell {
namespace target {

std::string motionToString(Motion motion) {
    switch (motion) {
        case Motion::JOINT: return "Joint";
        case Motion::LINEAR: return "Linear";
    }
    return "Unknown";
}

Target Target::joint(const JointValues& joints, const JointValues& external) {
    Target t;
    t.goal = JointTarget{joints};
    t.external = external;
    return t;
}

Target Target::cartesianPose(const Matrix4d& pose, Motion motion,
                             const std::optional<Configuration>& configuration) {
    Target t;
    CartesianTarget c;
    c.pose = pose;
    c.configuration = configuration;
    t.goal = c;
    t.motion = motion;
    return t;
}

Target Target::withConfiguration(const Configuration& configuration) const {
    Target copy = *this;
    if (auto* c = std::get_if<CartesianTarget>(&copy.goal)) {
        c->configuration = configuration;
    }
    return copy;
}

} // namespace target
} // namespace robot_cell
