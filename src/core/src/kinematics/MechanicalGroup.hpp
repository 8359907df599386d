/**
 * @file MechanicalGroup.hpp
 * @brief A robot arm with its external axes, resolved together
 */

#pragma once

#include "KinematicSolution.hpp"
#include "Mechanism.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include "../target/Target.hpp"
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace kinematics {

/**
 * MechanicalGroup.
 *
 * Joint numbers are contiguous: robot joints first, then the joints of
 * each external in order. Solution frames are ordered externals first,
 * then the robot, then the tool.
 *
 * Couplings:
 *  - an external with movesRobot() supplies the robot's base frame
 *  - a Cartesian target whose frame is coupled to an external of this
 *    group is re-oriented by that external's last frame before solving
 */
class MechanicalGroup {
public:
    MechanicalGroup(std::string name,
                    int index,
                    std::optional<Mechanism> robot,
                    std::vector<Mechanism> externals);

    const std::string& name() const { return name_; }
    int index() const { return index_; }

    const Mechanism* robot() const { return robot_ ? &*robot_ : nullptr; }
    const std::vector<Mechanism>& externals() const { return externals_; }

    /**
     * All joints by joint number
     */
    const std::vector<Joint>& joints() const { return joints_; }
    size_t jointCount() const { return joints_.size(); }
    size_t robotJointCount() const;
    size_t externalJointCount() const;

    JointValues defaultJoints() const;

    /**
     * Index in solution frames of an external's last frame, -1 if invalid
     */
    int externalFrameIndex(int mechanism) const;

    /**
     * Number of frames in a solution (including the tool frame)
     */
    size_t frameCount() const;

    /**
     * Frames at the default joints, tool frame = flange (no TCP)
     */
    FrameList defaultFrames() const;

    /**
     * Geometry per frame slot, same order as solution frames.
     * The tool slot is empty; the tool geometry comes from each target.
     */
    std::vector<geometry::GeometryPtr> geometries() const;

    /**
     * Resolve one target.
     *
     * @param target Target for this group
     * @param previous Joints of the previous target, by joint number (may be null)
     * @param coupledFrame Frame of a mechanism in another group the target frame is coupled to
     * @param baseFrame Replaces the base frame of every mechanism of the group
     */
    KinematicSolution resolve(const target::Target& target,
                              const JointValues* previous = nullptr,
                              const std::optional<Matrix4d>& coupledFrame = std::nullopt,
                              const std::optional<Matrix4d>& baseFrame = std::nullopt) const;

private:
    std::string name_;
    int index_;
    std::optional<Mechanism> robot_;
    std::vector<Mechanism> externals_;
    std::vector<Joint> joints_;

    static JointValues subset(const JointValues& values, const Mechanism& mechanism);
};

} // namespace kinematics
} // namespace robot_cell
