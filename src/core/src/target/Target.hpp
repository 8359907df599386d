/**
 * @file Target.hpp
 * @brief Targets, program targets and cell targets
 */

#pragma once

#include "../frame/FrameTypes.hpp"
#include "../kinematics/Configuration.hpp"
#include "../kinematics/MathTypes.hpp"
#include "../tool/ToolTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace robot_cell {
namespace target {

using kinematics::Configuration;
using kinematics::JointValues;
using kinematics::Matrix4d;

enum class Motion {
    JOINT,
    LINEAR
};

std::string motionToString(Motion motion);

/**
 * Speed limits of a segment ending at a target.
 * A positive `time` fixes the segment duration instead.
 */
struct Speed {
    std::string name = "DefaultSpeed";
    double translation = 100.0;     // mm/s
    double rotation = kinematics::PI / 2.0;   // rad/s
    double time = 0.0;              // s

    static Speed fixedTime(double seconds) {
        Speed s;
        s.name = "FixedTime";
        s.time = seconds;
        return s;
    }
};

struct JointTarget {
    JointValues joints;
};

struct CartesianTarget {
    Matrix4d pose = Matrix4d::Identity();   // TCP pose in the target frame
    std::optional<Configuration> configuration;
};

/**
 * Target for one mechanical group.
 *
 * A joint target lists the robot's joints (or is empty for groups without
 * a robot). `external` lists the values of the group's external joints in
 * joint-number order. Targets are immutable once shared.
 */
struct Target {
    std::variant<JointTarget, CartesianTarget> goal;
    tool::ToolPtr tool = tool::Tool::defaultTool();
    Speed speed;
    Motion motion = Motion::JOINT;
    frame::TargetFrame frame;
    JointValues external;
    std::string name;

    bool isCartesian() const { return std::holds_alternative<CartesianTarget>(goal); }
    const CartesianTarget* cartesian() const { return std::get_if<CartesianTarget>(&goal); }
    const JointTarget* joints() const { return std::get_if<JointTarget>(&goal); }

    static Target joint(const JointValues& joints, const JointValues& external = {});

    static Target cartesianPose(const Matrix4d& pose,
                                Motion motion = Motion::JOINT,
                                const std::optional<Configuration>& configuration = std::nullopt);

    /**
     * Copy with the branch fixed (Cartesian targets only; joint targets are returned as is)
     */
    Target withConfiguration(const Configuration& configuration) const;
};

using TargetPtr = std::shared_ptr<const Target>;

/**
 * Ordered targets of one mechanical group
 */
using Toolpath = std::vector<TargetPtr>;

struct ProgramTarget {
    TargetPtr target;
    int group = 0;
};

/**
 * One program step across all mechanical groups (one ProgramTarget per group)
 */
struct CellTarget {
    std::vector<ProgramTarget> programTargets;
    int index = 0;

    const Target& target(int group) const { return *programTargets.at(group).target; }
};

} // namespace target
} // namespace robot_cell
