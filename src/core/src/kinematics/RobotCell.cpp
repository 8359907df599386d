/**
 * @file RobotCell.cpp
 * @brief RobotCell implementation
 */

#include "RobotCell.hpp"
#include "../logging/Logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace robot_cell {
namespace kinematics {

namespace {

geometry::GeometryPtr makeGeometry(const config::GeometryConfig& config) {
    if (config.empty()) return nullptr;

    std::vector<geometry::Capsule> capsules;
    for (const auto& c : config.capsules) {
        geometry::Capsule capsule;
        capsule.start = Vector3d(c[0], c[1], c[2]);
        capsule.end = Vector3d(c[3], c[4], c[5]);
        capsule.radius = c[6];
        capsules.push_back(capsule);
    }
    for (const auto& s : config.spheres) {
        capsules.push_back(geometry::Capsule::sphere(Vector3d(s[0], s[1], s[2]), s[3]));
    }
    return std::make_shared<const geometry::CollisionGeometry>(std::move(capsules));
}

std::optional<Mechanism> makeArm(const config::ArmConfig& config, std::string& error) {
    if (config.joints.size() != static_cast<size_t>(ARM_JOINTS)) {
        error = fmt::format("arm '{}' has {} joints, expected {}",
                            config.name, config.joints.size(), ARM_JOINTS);
        return std::nullopt;
    }

    DHTable dh;
    std::vector<Joint> joints;
    for (int i = 0; i < ARM_JOINTS; ++i) {
        const auto& jc = config.joints[i];
        dh[i] = { jc.a, degToRad(jc.alpha), jc.d, degToRad(jc.theta_offset), jc.sign };

        Joint j;
        j.name = jc.name.empty() ? fmt::format("J{}", i + 1) : jc.name;
        j.type = JointType::REVOLUTE;
        j.minValue = degToRad(jc.min);
        j.maxValue = degToRad(jc.max);
        j.maxSpeed = degToRad(jc.max_speed);
        j.defaultValue = degToRad(jc.default_value);
        j.geometry = makeGeometry(jc.geometry);
        joints.push_back(j);
    }

    std::string reason;
    if (!SphericalWristSolver::isSupported(dh, &reason)) {
        error = fmt::format("arm '{}' is not a spherical-wrist arm: {}", config.name, reason);
        return std::nullopt;
    }

    return Mechanism(config.name, config.base.toMatrix(), joints, SphericalWristSolver(dh),
                     false, makeGeometry(config.base_geometry));
}

std::optional<Mechanism> makeExternal(const config::ExternalConfig& config, std::string& error) {
    if (config.joints.empty()) {
        error = fmt::format("external '{}' has no joints", config.name);
        return std::nullopt;
    }

    bool prismatic;
    if (config.kind == "track") {
        prismatic = true;
    } else if (config.kind == "positioner") {
        prismatic = false;
    } else {
        error = fmt::format("external '{}' has unknown kind '{}'", config.name, config.kind);
        return std::nullopt;
    }

    std::vector<Joint> joints;
    for (size_t i = 0; i < config.joints.size(); ++i) {
        const auto& jc = config.joints[i];
        Vector3d axis(jc.axis[0], jc.axis[1], jc.axis[2]);
        if (axis.norm() < EPSILON) {
            error = fmt::format("external '{}' joint {} has a zero axis", config.name, i + 1);
            return std::nullopt;
        }

        // Tracks in mm, positioners in degrees
        double scale = prismatic ? 1.0 : DEG_TO_RAD;

        Joint j;
        j.name = jc.name.empty() ? fmt::format("{}_E{}", config.name, i + 1) : jc.name;
        j.type = prismatic ? JointType::PRISMATIC : JointType::REVOLUTE;
        j.axis = axis.normalized();
        j.offset = Vector3d(jc.offset[0], jc.offset[1], jc.offset[2]);
        j.minValue = jc.min * scale;
        j.maxValue = jc.max * scale;
        j.maxSpeed = jc.max_speed * scale;
        j.defaultValue = jc.default_value * scale;
        j.geometry = makeGeometry(jc.geometry);
        joints.push_back(j);
    }

    MechanismSolver solver = prismatic ? MechanismSolver(TrackSolver{})
                                       : MechanismSolver(PositionerSolver{});
    return Mechanism(config.name, config.base.toMatrix(), joints, solver,
                     config.moves_robot, makeGeometry(config.base_geometry));
}

bool checkRanges(const Mechanism& mechanism, std::string& error) {
    for (const auto& j : mechanism.joints()) {
        if (j.minValue > j.maxValue) {
            error = fmt::format("joint {} of '{}' has min > max", j.name, mechanism.name());
            return false;
        }
        if (!j.isWithinRange(j.defaultValue)) {
            error = fmt::format("joint {} of '{}' has a default value outside its range",
                                j.name, mechanism.name());
            return false;
        }
        if (j.maxSpeed <= 0.0) {
            error = fmt::format("joint {} of '{}' needs a positive max speed",
                                j.name, mechanism.name());
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

RobotCell::RobotCell(std::string name,
                     config::Manufacturer manufacturer,
                     std::vector<MechanicalGroup> groups,
                     std::vector<tool::ToolPtr> tools)
    : name_(std::move(name))
    , manufacturer_(manufacturer)
    , groups_(std::move(groups))
    , tools_(std::move(tools))
{
    if (groups_.empty()) {
        throw std::invalid_argument("Robot cell '" + name_ + "' needs at least one group");
    }
    for (size_t i = 0; i < groups_.size(); ++i) {
        if (groups_[i].index() != static_cast<int>(i)) {
            throw std::invalid_argument("Robot cell '" + name_ + "': group '" +
                                        groups_[i].name() + "' has the wrong index");
        }
    }
}

std::optional<RobotCell> RobotCell::fromConfig(const config::CellConfig& config) {
    std::string error;
    std::vector<MechanicalGroup> groups;

    if (config.groups.empty()) {
        LOG_ERROR("Cell '{}' has no mechanical groups", config.name);
        return std::nullopt;
    }

    try {
        for (size_t g = 0; g < config.groups.size(); ++g) {
            const auto& gc = config.groups[g];

            std::optional<Mechanism> robot;
            if (gc.robot) {
                robot = makeArm(*gc.robot, error);
                if (!robot || !checkRanges(*robot, error)) {
                    LOG_ERROR("Cell '{}' group '{}': {}", config.name, gc.name, error);
                    return std::nullopt;
                }
            }

            std::vector<Mechanism> externals;
            for (const auto& ec : gc.externals) {
                auto external = makeExternal(ec, error);
                if (!external || !checkRanges(*external, error)) {
                    LOG_ERROR("Cell '{}' group '{}': {}", config.name, gc.name, error);
                    return std::nullopt;
                }
                externals.push_back(*external);
            }

            if (!robot && externals.empty()) {
                LOG_ERROR("Cell '{}' group '{}' has no mechanisms", config.name, gc.name);
                return std::nullopt;
            }

            groups.emplace_back(gc.name, static_cast<int>(g), robot, externals);
        }
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Cell '{}': {}", config.name, e.what());
        return std::nullopt;
    }

    std::vector<tool::ToolPtr> tools;
    for (const auto& tc : config.tools) {
        auto t = std::make_shared<tool::Tool>();
        t->name = tc.name;
        t->tcp = tc.tcp;
        t->weight = tc.weight;
        t->geometry = makeGeometry(tc.geometry);
        tools.push_back(t);
    }

    LOG_INFO("Robot cell '{}' built: {} group(s), {} tool(s)",
             config.name, groups.size(), tools.size());

    return RobotCell(config.name, config.manufacturer, std::move(groups), std::move(tools));
}

const MechanicalGroup& RobotCell::group(int index) const {
    if (index < 0 || index >= static_cast<int>(groups_.size())) {
        throw std::out_of_range(fmt::format("Group index {} out of range", index));
    }
    return groups_[index];
}

tool::ToolPtr RobotCell::tool(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t->name == name) return t;
    }
    return nullptr;
}

// ============================================================================
// Solve
// ============================================================================

std::vector<KinematicSolution> RobotCell::solve(const target::CellTarget& cellTarget,
                                                const std::vector<JointValues>* previous) const
{
    const size_t n = groups_.size();
    std::vector<KinematicSolution> solutions(n);
    std::vector<bool> solved(n, false);

    auto previousOf = [previous](size_t g) -> const JointValues* {
        if (!previous || g >= previous->size() || (*previous)[g].empty()) return nullptr;
        return &(*previous)[g];
    };

    // Group this group's target frame depends on, -1 if none
    auto sourceOf = [&](size_t g) -> int {
        const auto& frame = cellTarget.target(static_cast<int>(g)).frame;
        if (!frame.isCoupled()) return -1;
        int source = frame.coupledMechanicalGroup;
        return (source == -1 || source == static_cast<int>(g)) ? -1 : source;
    };

    for (size_t g = 0; g < n; ++g) {
        if (sourceOf(g) != -1) continue;
        solutions[g] = groups_[g].resolve(cellTarget.target(static_cast<int>(g)), previousOf(g));
        solved[g] = true;
    }

    for (size_t g = 0; g < n; ++g) {
        int source = sourceOf(g);
        if (source == -1) continue;

        const auto& target = cellTarget.target(static_cast<int>(g));
        std::optional<Matrix4d> coupled;

        if (source >= 0 && source < static_cast<int>(n) && solved[source]) {
            int index = groups_[source].externalFrameIndex(target.frame.coupledMechanism);
            if (index != -1) coupled = solutions[source].frames[index];
        } else {
            LOG_DEBUG("Cell target {}: group {} is coupled to unresolved group {}",
                      cellTarget.index, g, source);
        }

        solutions[g] = groups_[g].resolve(target, previousOf(g), coupled);
    }

    return solutions;
}

// ============================================================================
// Collision slots
// ============================================================================

size_t RobotCell::slotCount() const {
    size_t count = 0;
    for (const auto& g : groups_) count += g.frameCount();
    return count;
}

int RobotCell::slotOffset(int group) const {
    int offset = 0;
    for (int g = 0; g < group && g < static_cast<int>(groups_.size()); ++g) {
        offset += static_cast<int>(groups_[g].frameCount());
    }
    return offset;
}

FrameList RobotCell::defaultSlotFrames() const {
    FrameList frames;
    for (const auto& g : groups_) {
        FrameList f = g.defaultFrames();
        f.back() = Matrix4d::Identity();
        frames.insert(frames.end(), f.begin(), f.end());
    }
    return frames;
}

std::vector<geometry::GeometryPtr> RobotCell::slotGeometries() const {
    std::vector<geometry::GeometryPtr> result;
    for (const auto& g : groups_) {
        auto geometries = g.geometries();
        result.insert(result.end(), geometries.begin(), geometries.end());
    }
    return result;
}

} // namespace kinematics
} // namespace robot_cell
