/**
 * @file CollisionGeometry.cpp
 * @brief Capsule envelope posing and overlap tests
 */

#include "CollisionGeometry.hpp"
#include "../kinematics/MathTypes.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace robot_cell {
namespace geometry {

CollisionGeometry::CollisionGeometry(std::vector<Capsule> capsules)
    : capsules_(std::move(capsules)) {
    updateBounds();
}

void CollisionGeometry::updateBounds() {
    if (capsules_.empty()) {
        boundsMin_.setZero();
        boundsMax_.setZero();
        return;
    }

    boundsMin_ = Eigen::Vector3d::Constant(std::numeric_limits<double>::max());
    boundsMax_ = Eigen::Vector3d::Constant(std::numeric_limits<double>::lowest());

    for (const auto& c : capsules_) {
        Eigen::Vector3d r = Eigen::Vector3d::Constant(c.radius);
        boundsMin_ = boundsMin_.cwiseMin(c.start - r).cwiseMin(c.end - r);
        boundsMax_ = boundsMax_.cwiseMax(c.start + r).cwiseMax(c.end + r);
    }
}

bool CollisionGeometry::boundsOverlap(const CollisionGeometry& other) const {
    return (boundsMin_.array() <= other.boundsMax_.array()).all() &&
           (other.boundsMin_.array() <= boundsMax_.array()).all();
}

CollisionGeometry CollisionGeometry::transformed(const Eigen::Matrix4d& transform) const {
    Eigen::Matrix3d R = transform.block<3, 3>(0, 0);
    Eigen::Vector3d t = transform.block<3, 1>(0, 3);

    std::vector<Capsule> posed;
    posed.reserve(capsules_.size());
    for (const auto& c : capsules_) {
        posed.push_back(Capsule{R * c.start + t, R * c.end + t, c.radius});
    }
    return CollisionGeometry(std::move(posed));
}

CollisionGeometry CollisionGeometry::transformed(const Eigen::Matrix4d& from,
                                                 const Eigen::Matrix4d& to) const {
    return transformed(kinematics::planeToPlane(from, to));
}

bool CollisionGeometry::intersects(const CollisionGeometry& other) const {
    if (empty() || other.empty() || !boundsOverlap(other)) {
        return false;
    }

    for (const auto& a : capsules_) {
        for (const auto& b : other.capsules_) {
            double r = a.radius + b.radius;
            if (segmentSegmentDistanceSquared(a.start, a.end, b.start, b.end) <= r * r) {
                return true;
            }
        }
    }
    return false;
}

// ============================================================================
// Closest points between two segments (Ericson, Real-Time Collision Detection 5.1.9)
// ============================================================================

double segmentSegmentDistanceSquared(const Eigen::Vector3d& p1, const Eigen::Vector3d& q1,
                                     const Eigen::Vector3d& p2, const Eigen::Vector3d& q2) {
    constexpr double eps = 1e-12;

    Eigen::Vector3d d1 = q1 - p1;
    Eigen::Vector3d d2 = q2 - p2;
    Eigen::Vector3d r = p1 - p2;
    double a = d1.squaredNorm();
    double e = d2.squaredNorm();
    double f = d2.dot(r);

    double s = 0.0;
    double t = 0.0;

    if (a <= eps && e <= eps) {
        return r.squaredNorm();
    }

    if (a <= eps) {
        t = std::clamp(f / e, 0.0, 1.0);
    } else {
        double c = d1.dot(r);
        if (e <= eps) {
            s = std::clamp(-c / a, 0.0, 1.0);
        } else {
            double b = d1.dot(d2);
            double denom = a * e - b * b;

            // Parallel segments: pick any s
            s = (denom > eps) ? std::clamp((b * f - c * e) / denom, 0.0, 1.0) : 0.0;
            t = (b * s + f) / e;

            if (t < 0.0) {
                t = 0.0;
                s = std::clamp(-c / a, 0.0, 1.0);
            } else if (t > 1.0) {
                t = 1.0;
                s = std::clamp((b - c) / a, 0.0, 1.0);
            }
        }
    }

    Eigen::Vector3d c1 = p1 + d1 * s;
    Eigen::Vector3d c2 = p2 + d2 * t;
    return (c1 - c2).squaredNorm();
}

} // namespace geometry
} // namespace robot_cell
