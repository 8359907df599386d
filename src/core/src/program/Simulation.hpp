/**
 * @file Simulation.hpp
 * @brief Keyframe playback
 */

#pragma once

#include "ProgramTypes.hpp"
#include <memory>
#include <vector>

namespace robot_cell {
namespace program {

/**
 * Simulation.
 *
 * Interpolates precomputed keyframes; nothing is re-resolved while
 * stepping. Holds its own cursor, so one instance must not be stepped
 * from several threads. Instances can share the same keyframes.
 */
class Simulation {
public:
    /**
     * @throws std::invalid_argument if there are no keyframes
     */
    explicit Simulation(std::shared_ptr<const std::vector<Keyframe>> keyframes);

    /**
     * Move the cursor and compute the pose.
     * @param time Seconds, or a fraction of the duration when normalized;
     *             clamped to the keyframe range
     */
    const SimulationPose& step(double time, bool normalized = true);

    const SimulationPose& currentPose() const { return current_; }

    double duration() const { return keyframes_->back().time; }
    const std::vector<Keyframe>& keyframes() const { return *keyframes_; }

    /**
     * Joints lerped, frames lerped / slerped, configuration of `a` until t = 1
     */
    static std::vector<KinematicSolution> interpolate(const Keyframe& a, const Keyframe& b, double t);

private:
    std::shared_ptr<const std::vector<Keyframe>> keyframes_;
    SimulationPose current_;
    size_t cursor_ = 0;   // index of the keyframe starting the current interval

    size_t locate(double time);
};

} // namespace program
} // namespace robot_cell
