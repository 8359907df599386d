/**
 * @file Collision.hpp
 * @brief Sampled collision check of a checked program
 */

#pragma once

#include "ProgramTypes.hpp"
#include "../geometry/CollisionGeometry.hpp"
#include "../kinematics/RobotCell.hpp"
#include "../target/Target.hpp"
#include <functional>
#include <vector>

namespace robot_cell {
namespace program {

/**
 * Extra geometry in world coordinates, either static (slot -1) or moving
 * with a slot (placed at the slot's default frame).
 */
struct EnvironmentGeometry {
    geometry::GeometryPtr geometry;
    int slot = -1;
};

struct CollisionSettings {
    std::vector<int> first = {7};
    std::vector<int> second = {4};
    std::vector<EnvironmentGeometry> environment;
    double linearStep = 100.0;                  // mm
    double angularStep = kinematics::PI / 4.0;  // rad

    /**
     * Checked between samples; returning true stops the scan
     */
    std::function<bool()> abort;
};

/**
 * Colliding slots at one sample. Environment entries use
 * environmentSlot(i); pairs are stored with first <= second.
 */
struct CollisionPair {
    int first = 0;
    int second = 0;
    double time = 0.0;
    int targetIndex = 0;
};

/**
 * Collision.
 *
 * Slots are numbered across all groups (see RobotCell). Each keyframe
 * interval is sampled so that no frame moves more than the linear or
 * angular step between samples. Every slot of `first` is tested against
 * every slot of `second`, and environment geometry against both sets.
 */
class Collision {
public:
    Collision(const kinematics::RobotCell& cell,
              const std::vector<Keyframe>& keyframes,
              const std::vector<target::CellTarget>& targets,
              const CollisionSettings& settings = {});

    static int environmentSlot(int index) { return -(index + 1); }

    bool hasCollision() const { return !pairs_.empty(); }
    const std::vector<CollisionPair>& pairs() const { return pairs_; }

    /**
     * Times of every evaluated sample, in order
     */
    const std::vector<double>& sampleTimes() const { return sampleTimes_; }

    bool aborted() const { return aborted_; }

private:
    CollisionSettings settings_;

    kinematics::FrameList defaultFrames_;
    std::vector<geometry::GeometryPtr> geometries_;
    std::vector<int> toolSlots_;

    std::vector<CollisionPair> pairs_;
    std::vector<double> sampleTimes_;
    bool aborted_ = false;

    int samplesBetween(const Keyframe& a, const Keyframe& b) const;

    void checkSample(double time, int targetIndex,
                     const std::vector<KinematicSolution>& solutions,
                     const std::vector<target::CellTarget>& targets);
};

} // namespace program
} // namespace robot_cell
