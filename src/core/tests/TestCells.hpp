/**
 * @file TestCells.hpp
 * @brief Mechanisms and cells shared by the unit tests
 *
 * Test arm (standard DH, all signs +1):
 *   | Joint | a   | alpha | d    | offset | range  |
 *   |-------|-----|-------|------|--------|--------|
 *   | 1     | 150 | -90   | 505  | 0      | +-180  |
 *   | 2     | 760 |   0   | 0    | -90    | +-155  |
 *   | 3     | 200 | -90   | 0    | 0      | +-170  |
 *   | 4     | 0   |  90   | 1082 | 0      | +-180  |
 *   | 5     | 0   | -90   | 0    | 0      | +-135  |
 *   | 6     | 0   |   0   | 100  | 0      | +-360  |
 *
 * Default joints [0, 0, 0, 0, -45deg, 0] put the flange at
 * (1302.711, 0, 1535.711), tool Z pointing up and forward.
 */

#pragma once

#include "kinematics/MechanicalGroup.hpp"
#include "kinematics/Mechanism.hpp"
#include "kinematics/RobotCell.hpp"
#include "target/Target.hpp"
#include "tool/ToolTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace robot_cell {
namespace test {

using namespace robot_cell::kinematics;

constexpr double HOME_X = 1302.7106781186549;
constexpr double HOME_Z = 1535.7106781186546;
constexpr double POSITIONER_X = 1500.0;

inline DHTable testArmDH() {
    DHTable dh;
    dh[0] = { 150.0, -PI / 2.0, 505.0, 0.0, 1.0 };
    dh[1] = { 760.0, 0.0, 0.0, -PI / 2.0, 1.0 };
    dh[2] = { 200.0, -PI / 2.0, 0.0, 0.0, 1.0 };
    dh[3] = { 0.0, PI / 2.0, 1082.0, 0.0, 1.0 };
    dh[4] = { 0.0, -PI / 2.0, 0.0, 0.0, 1.0 };
    dh[5] = { 0.0, 0.0, 100.0, 0.0, 1.0 };
    return dh;
}

inline std::vector<Joint> testArmJoints() {
    const double limits[ARM_JOINTS] = { 180.0, 155.0, 170.0, 180.0, 135.0, 360.0 };

    std::vector<Joint> joints;
    for (int i = 0; i < ARM_JOINTS; ++i) {
        Joint j;
        j.number = i;
        j.name = "J" + std::to_string(i + 1);
        j.minValue = -degToRad(limits[i]);
        j.maxValue = degToRad(limits[i]);
        j.maxSpeed = PI;
        joints.push_back(j);
    }
    joints[4].defaultValue = -PI / 4.0;
    return joints;
}

inline JointValues homeJoints() {
    return { 0.0, 0.0, 0.0, 0.0, -PI / 4.0, 0.0 };
}

inline Mechanism testArm(const Matrix4d& base = Matrix4d::Identity()) {
    return Mechanism("Robot", base, testArmJoints(), SphericalWristSolver(testArmDH()));
}

/**
 * One linear axis along world X, range +-2000 mm
 */
inline Mechanism testTrack(bool movesRobot = true) {
    Joint j;
    j.name = "E1";
    j.type = JointType::PRISMATIC;
    j.axis = Vector3d::UnitX();
    j.minValue = -2000.0;
    j.maxValue = 2000.0;
    j.maxSpeed = 1000.0;
    return Mechanism("Track", Matrix4d::Identity(), { j }, TrackSolver{}, movesRobot);
}

/**
 * One rotary axis about world Z through (1500, 0, 0)
 */
inline Mechanism testPositioner() {
    Joint j;
    j.name = "P1";
    j.type = JointType::REVOLUTE;
    j.axis = Vector3d::UnitZ();
    j.minValue = -PI;
    j.maxValue = PI;
    j.maxSpeed = PI;
    return Mechanism("Positioner", makeTranslation(Vector3d(POSITIONER_X, 0.0, 0.0)),
                     { j }, PositionerSolver{});
}

inline Matrix4d homeFlange() {
    return testArm().forward(homeJoints(), Matrix4d::Identity()).back();
}

inline std::shared_ptr<const RobotCell> singleArmCell(
    config::Manufacturer manufacturer = config::Manufacturer::OTHER)
{
    std::vector<MechanicalGroup> groups;
    groups.emplace_back("Robot", 0, testArm(), std::vector<Mechanism>{});
    return std::make_shared<const RobotCell>("TestCell", manufacturer, std::move(groups));
}

/**
 * Group 0: arm, group 1: positioner only
 */
inline std::shared_ptr<const RobotCell> armAndPositionerCell(
    config::Manufacturer manufacturer = config::Manufacturer::OTHER)
{
    std::vector<MechanicalGroup> groups;
    groups.emplace_back("Robot", 0, testArm(), std::vector<Mechanism>{});
    groups.emplace_back("Positioner", 1, std::nullopt, std::vector<Mechanism>{ testPositioner() });
    return std::make_shared<const RobotCell>("TwoGroups", manufacturer, std::move(groups));
}

inline tool::ToolPtr sphereTool(double radius) {
    auto t = std::make_shared<tool::Tool>();
    t->name = "SphereTool";
    t->geometry = std::make_shared<const geometry::CollisionGeometry>(
        std::vector<geometry::Capsule>{ geometry::Capsule::sphere(Vector3d::Zero(), radius) });
    return t;
}

inline target::TargetPtr jointTarget(const JointValues& joints,
                                     const JointValues& external = {},
                                     tool::ToolPtr tool = nullptr) {
    auto t = target::Target::joint(joints, external);
    if (tool) t.tool = tool;
    return std::make_shared<const target::Target>(t);
}

inline target::TargetPtr poseTarget(const Matrix4d& pose,
                                    target::Motion motion = target::Motion::JOINT,
                                    const std::optional<Configuration>& configuration = std::nullopt) {
    return std::make_shared<const target::Target>(
        target::Target::cartesianPose(pose, motion, configuration));
}

inline Matrix4d shifted(const Matrix4d& frame, const Vector3d& delta) {
    Matrix4d result = frame;
    result.block<3, 1>(0, 3) += delta;
    return result;
}

} // namespace test
} // namespace robot_cell
