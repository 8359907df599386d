/**
 * @file Program.hpp
 * @brief A checked program for a robot cell
 */

#pragma once

#include "CheckProgram.hpp"
#include "Collision.hpp"
#include "ProgramTypes.hpp"
#include "Simulation.hpp"
#include "../kinematics/RobotCell.hpp"
#include "../target/Target.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace program {

/**
 * Receives the interpolated pose on every animation step
 */
class IMeshPoser {
public:
    virtual ~IMeshPoser() = default;

    virtual void pose(const std::vector<KinematicSolution>& solutions,
                      const target::CellTarget& cellTarget) = 0;
};

/**
 * Program.
 *
 * Built once from toolpaths (one per mechanical group). Structural errors
 * leave a program with errors only; otherwise it carries the fixed
 * targets, keyframes, diagnostics and a simulation.
 */
class Program {
public:
    Program(std::string name,
            std::shared_ptr<const kinematics::RobotCell> cell,
            const std::vector<target::Toolpath>& toolpaths,
            const std::vector<int>& multiFileIndices = {},
            const CheckSettings& settings = {});

    /**
     * Controller identifier rules: non-empty, at most 32 characters,
     * starting with a letter, then letters, digits or underscores
     */
    static bool isValidIdentifier(const std::string& name, std::string& error);

    const std::string& name() const { return name_; }
    const kinematics::RobotCell& cell() const { return *cell_; }

    const std::vector<target::CellTarget>& targets() const { return targets_; }
    const std::vector<std::vector<KinematicSolution>>& solutions() const { return solutions_; }
    const std::vector<Keyframe>& keyframes() const;
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    const std::vector<int>& multiFileIndices() const { return multiFileIndices_; }

    double duration() const { return duration_; }
    bool hasSimulation() const { return simulation_ != nullptr; }

    void setMeshPoser(std::shared_ptr<IMeshPoser> poser) { meshPoser_ = std::move(poser); }

    /**
     * Step the simulation and pose meshes. Does nothing without a simulation.
     */
    void animate(double time, bool normalized = true);

    /**
     * @throws std::logic_error if the program has no simulation
     */
    const SimulationPose& currentSimulationPose() const;

    /**
     * @throws std::logic_error if the program has no simulation
     */
    Collision checkCollisions(const CollisionSettings& settings = {}) const;

    /**
     * "Program (<name> with <n> targets and hh:mm:ss (h:m:s) long)"
     */
    std::string summary() const;

    nlohmann::json toJson() const;

private:
    std::string name_;
    std::shared_ptr<const kinematics::RobotCell> cell_;

    std::vector<target::CellTarget> targets_;
    std::vector<std::vector<KinematicSolution>> solutions_;
    std::shared_ptr<const std::vector<Keyframe>> keyframes_;
    std::vector<Diagnostic> diagnostics_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    std::vector<int> multiFileIndices_;
    double duration_ = 0.0;

    std::unique_ptr<Simulation> simulation_;
    std::shared_ptr<IMeshPoser> meshPoser_;

    void checkName();
    void fixMultiFileIndices(const std::vector<int>& indices);
};

} // namespace program
} // namespace robot_cell
