/**
 * @file Collision.cpp
 * @brief Collision implementation
 */

#include "Collision.hpp"
#include "Simulation.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <utility>

namespace robot_cell {
namespace program {

using kinematics::Matrix4d;

namespace {

std::vector<int> validSlots(const std::vector<int>& slots, size_t count, const char* set) {
    std::vector<int> result;
    for (int slot : slots) {
        if (slot < 0 || slot >= static_cast<int>(count)) {
            LOG_WARN("Collision {} set: slot {} does not exist ({} slots)", set, slot, count);
            continue;
        }
        result.push_back(slot);
    }
    return result;
}

} // namespace

Collision::Collision(const kinematics::RobotCell& cell,
                     const std::vector<Keyframe>& keyframes,
                     const std::vector<target::CellTarget>& targets,
                     const CollisionSettings& settings)
    : settings_(settings)
{
    CollisionSettings defaults;
    if (settings_.linearStep <= 0.0) settings_.linearStep = defaults.linearStep;
    if (settings_.angularStep <= 0.0) settings_.angularStep = defaults.angularStep;

    defaultFrames_ = cell.defaultSlotFrames();
    geometries_ = cell.slotGeometries();
    for (size_t g = 0; g < cell.groups().size(); ++g) {
        int gi = static_cast<int>(g);
        toolSlots_.push_back(cell.slotOffset(gi) + static_cast<int>(cell.group(gi).frameCount()) - 1);
    }

    settings_.first = validSlots(settings_.first, geometries_.size(), "first");
    settings_.second = validSlots(settings_.second, geometries_.size(), "second");

    if (keyframes.empty()) return;

    for (size_t k = 0; k + 1 < keyframes.size(); ++k) {
        const Keyframe& a = keyframes[k];
        const Keyframe& b = keyframes[k + 1];
        int n = samplesBetween(a, b);

        for (int j = 0; j < n; ++j) {
            if (settings_.abort && settings_.abort()) {
                aborted_ = true;
                LOG_INFO("Collision check aborted after {} sample(s)", sampleTimes_.size());
                return;
            }

            double s = static_cast<double>(j) / n;
            double time = a.time + s * (b.time - a.time);
            if (j == 0) {
                checkSample(time, a.targetIndex, a.solutions, targets);
            } else {
                checkSample(time, b.targetIndex, Simulation::interpolate(a, b, s), targets);
            }
        }
    }

    if (settings_.abort && settings_.abort()) {
        aborted_ = true;
        return;
    }
    const Keyframe& last = keyframes.back();
    checkSample(last.time, last.targetIndex, last.solutions, targets);

    LOG_DEBUG("Collision check: {} sample(s), {} colliding pair(s)",
              sampleTimes_.size(), pairs_.size());
}

int Collision::samplesBetween(const Keyframe& a, const Keyframe& b) const {
    double steps = 1.0;

    for (size_t g = 0; g < a.solutions.size() && g < b.solutions.size(); ++g) {
        const auto& fa = a.solutions[g].frames;
        const auto& fb = b.solutions[g].frames;
        for (size_t f = 0; f < fa.size() && f < fb.size(); ++f) {
            steps = std::max(steps, kinematics::translationBetween(fa[f], fb[f]) / settings_.linearStep);
            steps = std::max(steps, kinematics::rotationAngleBetween(fa[f], fb[f]) / settings_.angularStep);
        }
    }

    return static_cast<int>(std::ceil(steps - 1e-9));
}

void Collision::checkSample(double time, int targetIndex,
                            const std::vector<KinematicSolution>& solutions,
                            const std::vector<target::CellTarget>& targets)
{
    sampleTimes_.push_back(time);

    kinematics::FrameList frames;
    for (const auto& solution : solutions) {
        frames.insert(frames.end(), solution.frames.begin(), solution.frames.end());
    }
    if (frames.size() != geometries_.size()) {
        LOG_WARN("Collision sample at {:.3f}s has {} frames, expected {}",
                 time, frames.size(), geometries_.size());
        return;
    }

    // Frame a slot's geometry follows; tools hang from the flange
    auto slotFrame = [&](int slot) -> const Matrix4d& {
        bool tool = std::find(toolSlots_.begin(), toolSlots_.end(), slot) != toolSlots_.end();
        return tool && slot > 0 ? frames[slot - 1] : frames[slot];
    };

    std::vector<std::shared_ptr<const geometry::CollisionGeometry>> posed(geometries_.size());
    for (size_t slot = 0; slot < geometries_.size(); ++slot) {
        geometry::GeometryPtr source = geometries_[slot];

        auto tool = std::find(toolSlots_.begin(), toolSlots_.end(), static_cast<int>(slot));
        if (tool != toolSlots_.end()) {
            int group = static_cast<int>(std::distance(toolSlots_.begin(), tool));
            if (targetIndex >= 0 && targetIndex < static_cast<int>(targets.size())) {
                const auto& t = targets[targetIndex].target(group);
                if (t.tool) source = t.tool->geometry;
            }
        }

        if (!source || source->empty()) continue;
        posed[slot] = std::make_shared<const geometry::CollisionGeometry>(
            source->transformed(defaultFrames_[slot], slotFrame(static_cast<int>(slot))));
    }

    std::set<std::pair<int, int>> seen;
    auto record = [&](int a, int b) {
        auto key = std::minmax(a, b);
        if (!seen.insert(key).second) return;
        pairs_.push_back({ key.first, key.second, time, targetIndex });
    };

    for (int a : settings_.first) {
        for (int b : settings_.second) {
            if (a == b || !posed[a] || !posed[b]) continue;
            if (seen.count(std::minmax(a, b))) continue;
            if (posed[a]->intersects(*posed[b])) record(a, b);
        }
    }

    if (settings_.environment.empty()) return;

    std::set<int> moving(settings_.first.begin(), settings_.first.end());
    moving.insert(settings_.second.begin(), settings_.second.end());

    for (size_t i = 0; i < settings_.environment.size(); ++i) {
        const auto& env = settings_.environment[i];
        if (!env.geometry || env.geometry->empty()) continue;

        geometry::CollisionGeometry placed = *env.geometry;
        if (env.slot >= 0 && env.slot < static_cast<int>(frames.size())) {
            placed = env.geometry->transformed(defaultFrames_[env.slot], slotFrame(env.slot));
        }

        int envSlot = environmentSlot(static_cast<int>(i));
        for (int slot : moving) {
            if (slot == env.slot || !posed[slot]) continue;
            if (placed.intersects(*posed[slot])) record(envSlot, slot);
        }
    }
}

} // namespace program
} // namespace robot_cell
