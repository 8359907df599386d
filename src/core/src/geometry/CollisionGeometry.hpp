/**
 * @file CollisionGeometry.hpp
 * @brief Convex envelope geometry (capsules + spheres) for sampled collision checks
 *
 * A sphere is stored as a capsule with coincident end points.
 * Units: mm.
 */

#pragma once

#include <Eigen/Core>
#include <memory>
#include <vector>

namespace robot_cell {
namespace geometry {

struct Capsule {
    Eigen::Vector3d start = Eigen::Vector3d::Zero();
    Eigen::Vector3d end = Eigen::Vector3d::Zero();
    double radius = 0.0;

    static Capsule sphere(const Eigen::Vector3d& center, double radius) {
        return Capsule{center, center, radius};
    }
};

/**
 * Posable collision envelope.
 *
 * Instances are immutable once built; posing returns a transformed copy.
 */
class CollisionGeometry {
public:
    CollisionGeometry() = default;
    explicit CollisionGeometry(std::vector<Capsule> capsules);

    /**
     * Copy of this geometry moved from frame `from` to frame `to`.
     */
    CollisionGeometry transformed(const Eigen::Matrix4d& from, const Eigen::Matrix4d& to) const;

    /**
     * Copy of this geometry with a rigid transform applied.
     */
    CollisionGeometry transformed(const Eigen::Matrix4d& transform) const;

    /**
     * True when any capsule of this geometry overlaps any capsule of other.
     */
    bool intersects(const CollisionGeometry& other) const;

    bool empty() const { return capsules_.empty(); }
    const std::vector<Capsule>& capsules() const { return capsules_; }

private:
    std::vector<Capsule> capsules_;

    // Axis-aligned bounds, used as an early out
    Eigen::Vector3d boundsMin_ = Eigen::Vector3d::Zero();
    Eigen::Vector3d boundsMax_ = Eigen::Vector3d::Zero();

    void updateBounds();
    bool boundsOverlap(const CollisionGeometry& other) const;
};

using GeometryPtr = std::shared_ptr<const CollisionGeometry>;

/**
 * Squared distance between segments [p1,q1] and [p2,q2].
 */
double segmentSegmentDistanceSquared(const Eigen::Vector3d& p1, const Eigen::Vector3d& q1,
                                     const Eigen::Vector3d& p2, const Eigen::Vector3d& q2);

} // namespace geometry
} // namespace robot_cell
