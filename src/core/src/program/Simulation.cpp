/**
 * @file Simulation.cpp
 * @brief Simulation implementation
 */

#include "Simulation.hpp"
#include <algorithm>
#include <stdexcept>

namespace robot_cell {
namespace program {

Simulation::Simulation(std::shared_ptr<const std::vector<Keyframe>> keyframes)
    : keyframes_(std::move(keyframes))
{
    if (!keyframes_ || keyframes_->empty()) {
        throw std::invalid_argument("Simulation needs at least one keyframe");
    }

    const auto& first = keyframes_->front();
    current_.time = first.time;
    current_.targetIndex = first.targetIndex;
    current_.solutions = first.solutions;
}

size_t Simulation::locate(double time) {
    const auto& k = *keyframes_;

    // Playback usually moves forward by small steps
    if (cursor_ + 1 < k.size() && k[cursor_].time <= time && time < k[cursor_ + 1].time) {
        return cursor_;
    }

    auto it = std::upper_bound(k.begin(), k.end(), time,
                               [](double t, const Keyframe& kf) { return t < kf.time; });
    size_t index = static_cast<size_t>(std::distance(k.begin(), it));
    cursor_ = index == 0 ? 0 : index - 1;
    return cursor_;
}

const SimulationPose& Simulation::step(double time, bool normalized) {
    const auto& k = *keyframes_;

    if (normalized) time *= duration();
    time = std::clamp(time, k.front().time, k.back().time);

    size_t a = locate(time);
    current_.time = time;

    if (a + 1 >= k.size()) {
        current_.targetIndex = k.back().targetIndex;
        current_.solutions = k.back().solutions;
        return current_;
    }

    const Keyframe& from = k[a];
    const Keyframe& to = k[a + 1];
    double span = to.time - from.time;
    double s = span > 0.0 ? (time - from.time) / span : 1.0;

    current_.targetIndex = s > 0.0 ? to.targetIndex : from.targetIndex;
    current_.solutions = interpolate(from, to, s);
    return current_;
}

std::vector<KinematicSolution> Simulation::interpolate(const Keyframe& a, const Keyframe& b, double t) {
    t = std::clamp(t, 0.0, 1.0);

    std::vector<KinematicSolution> result;
    result.reserve(a.solutions.size());

    for (size_t g = 0; g < a.solutions.size() && g < b.solutions.size(); ++g) {
        const auto& sa = a.solutions[g];
        const auto& sb = b.solutions[g];

        KinematicSolution s;
        s.joints.resize(sa.joints.size());
        for (size_t j = 0; j < sa.joints.size(); ++j) {
            s.joints[j] = sa.joints[j] + t * (sb.joints[j] - sa.joints[j]);
        }

        s.frames.reserve(sa.frames.size());
        for (size_t f = 0; f < sa.frames.size() && f < sb.frames.size(); ++f) {
            s.frames.push_back(kinematics::interpolateTransform(sa.frames[f], sb.frames[f], t));
        }

        s.configuration = t < 1.0 ? sa.configuration : sb.configuration;
        result.push_back(std::move(s));
    }

    return result;
}

} // namespace program
} // namespace robot_cell
