/**
 * @file RobotCell.hpp
 * @brief Robot-system definition: mechanical groups and tools of one cell
 */

#pragma once

#include "KinematicSolution.hpp"
#include "MechanicalGroup.hpp"
#include "../config/CellConfig.hpp"
#include "../config/Manufacturer.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include "../target/Target.hpp"
#include "../tool/ToolTypes.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace kinematics {

/**
 * RobotCell.
 *
 * Owns the mechanical groups; outlives any program checked against it.
 * Collision slots are numbered across groups in group order, each group
 * contributing its solution frames (tool slot last).
 */
class RobotCell {
public:
    RobotCell(std::string name,
              config::Manufacturer manufacturer,
              std::vector<MechanicalGroup> groups,
              std::vector<tool::ToolPtr> tools = {});

    /**
     * Build a cell from configuration.
     * @return Empty if the configuration is invalid (reason is logged)
     */
    static std::optional<RobotCell> fromConfig(const config::CellConfig& config);

    const std::string& name() const { return name_; }
    config::Manufacturer manufacturer() const { return manufacturer_; }

    const std::vector<MechanicalGroup>& groups() const { return groups_; }

    /**
     * @throws std::out_of_range for an invalid index
     */
    const MechanicalGroup& group(int index) const;

    /**
     * Tool by name, null if unknown
     */
    tool::ToolPtr tool(const std::string& name) const;
    const std::vector<tool::ToolPtr>& tools() const { return tools_; }

    /**
     * Resolve every group of a cell target.
     *
     * Groups whose target frame is coupled to another group are resolved
     * after it. Coupling chains across more than two groups are reported.
     *
     * @param previous Joints of the previous cell target per group (may be null;
     *                 empty entries mean no previous joints for that group)
     */
    std::vector<KinematicSolution> solve(const target::CellTarget& cellTarget,
                                         const std::vector<JointValues>* previous = nullptr) const;

    // ========================================================================
    // Collision slots
    // ========================================================================

    size_t slotCount() const;

    /**
     * First slot index of a group
     */
    int slotOffset(int group) const;

    /**
     * Default frame of every slot (tool slots: identity)
     */
    FrameList defaultSlotFrames() const;

    /**
     * Geometry of every slot (tool slots: null)
     */
    std::vector<geometry::GeometryPtr> slotGeometries() const;

private:
    std::string name_;
    config::Manufacturer manufacturer_;
    std::vector<MechanicalGroup> groups_;
    std::vector<tool::ToolPtr> tools_;
};

} // namespace kinematics
} // namespace robot_cell
