/**
 * @file CheckProgram.hpp
 * @brief Program-wide resolution, validation and keyframing
 */

#pragma once

#include "ProgramTypes.hpp"
#include "../config/SystemConfig.hpp"
#include "../kinematics/RobotCell.hpp"
#include "../target/Target.hpp"
#include <string>
#include <vector>

namespace robot_cell {
namespace program {

struct CheckSettings {
    double linearStep = 1.0;                        // mm
    double angularStep = kinematics::DEG_TO_RAD;    // rad
    double jointJumpFactor = 10.0;                  // x step

    static CheckSettings fromConfig(const config::CheckConfig& config);
};

/**
 * CheckProgram.
 *
 * Runs once, in the constructor:
 *  1. structural validation of the toolpaths (aborts on failure)
 *  2. resolution of every cell target, previous joints fed forward
 *  3. keyframes for every target plus intermediate samples so that
 *     consecutive keyframes stay within the linear / angular step
 *
 * Kinematic problems become diagnostics and never stop the walk.
 */
class CheckProgram {
public:
    CheckProgram(const kinematics::RobotCell& cell,
                 const std::vector<target::Toolpath>& toolpaths,
                 const CheckSettings& settings = {});

    /**
     * Structural errors; when not empty there are no targets and no keyframes
     */
    const std::vector<std::string>& errors() const { return errors_; }
    bool hasErrors() const { return !errors_.empty(); }

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    /**
     * Cell targets with the resolved configuration filled in on Cartesian
     * targets that did not declare one
     */
    const std::vector<target::CellTarget>& fixedTargets() const { return fixedTargets_; }

    /**
     * Resolved solutions per cell target
     */
    const std::vector<std::vector<KinematicSolution>>& solutions() const { return solutions_; }

    const std::vector<Keyframe>& keyframes() const { return keyframes_; }

    double duration() const { return keyframes_.empty() ? 0.0 : keyframes_.back().time; }

private:
    const kinematics::RobotCell& cell_;
    CheckSettings settings_;

    std::vector<std::string> errors_;
    std::vector<Diagnostic> diagnostics_;
    std::vector<target::CellTarget> fixedTargets_;
    std::vector<std::vector<KinematicSolution>> solutions_;
    std::vector<Keyframe> keyframes_;

    bool validate(const std::vector<target::Toolpath>& toolpaths);
    void resolveTargets(const std::vector<target::Toolpath>& toolpaths);
    void buildKeyframes();

    double segmentDuration(int index) const;
    int subdivisions(int index) const;

    KinematicSolution sample(int index, int group, double s,
                             const KinematicSolution& previous) const;
};

} // namespace program
} // namespace robot_cell
