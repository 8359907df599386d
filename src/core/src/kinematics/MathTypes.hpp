/**
 * @file MathTypes.hpp
 * @brief Math types and utilities for mechanism kinematics
 *
 * Frames are 4x4 homogeneous transforms (translation in mm).
 */

#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>
#include <vector>

namespace robot_cell {
namespace kinematics {

// ============================================================================
// Type Definitions
// ============================================================================

using Vector3d = Eigen::Vector3d;
using Matrix3d = Eigen::Matrix3d;
using Matrix4d = Eigen::Matrix4d;
using Quaterniond = Eigen::Quaterniond;
using AngleAxisd = Eigen::AngleAxisd;

using JointValues = std::vector<double>;
using FrameList = std::vector<Matrix4d>;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double EPSILON = 1e-10;

// ============================================================================
// Utility Functions
// ============================================================================

inline double degToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

inline double radToDeg(double radians) {
    return radians * RAD_TO_DEG;
}

inline bool isNearZero(double value, double tolerance = EPSILON) {
    return std::abs(value) < tolerance;
}

inline double normalizeAngle(double angle) {
    while (angle > PI) angle -= 2.0 * PI;
    while (angle < -PI) angle += 2.0 * PI;
    return angle;
}

/**
 * Convert rotation matrix to RPY (Roll-Pitch-Yaw) angles
 * Convention: ZYX (Yaw-Pitch-Roll applied in that order)
 */
inline Vector3d rotationToRPY(const Matrix3d& R) {
    Vector3d rpy;

    // Check for gimbal lock
    if (std::abs(R(2, 0)) >= 1.0 - EPSILON) {
        rpy(2) = 0.0;
        if (R(2, 0) < 0) {
            rpy(1) = PI / 2.0;
            rpy(0) = std::atan2(R(0, 1), R(0, 2));
        } else {
            rpy(1) = -PI / 2.0;
            rpy(0) = std::atan2(-R(0, 1), -R(0, 2));
        }
    } else {
        rpy(1) = std::asin(-R(2, 0));
        rpy(0) = std::atan2(R(2, 1), R(2, 2));
        rpy(2) = std::atan2(R(1, 0), R(0, 0));
    }

    return rpy;
}

/**
 * Convert RPY angles to rotation matrix
 * Convention: ZYX (Rz * Ry * Rx)
 */
inline Matrix3d rpyToRotation(const Vector3d& rpy) {
    return (AngleAxisd(rpy(2), Vector3d::UnitZ())
          * AngleAxisd(rpy(1), Vector3d::UnitY())
          * AngleAxisd(rpy(0), Vector3d::UnitX())).toRotationMatrix();
}

// ============================================================================
// Homogeneous Transforms
// ============================================================================

inline Matrix4d makeTransform(const Matrix3d& R, const Vector3d& p) {
    Matrix4d T = Matrix4d::Identity();
    T.block<3, 3>(0, 0) = R;
    T.block<3, 1>(0, 3) = p;
    return T;
}

inline Matrix4d makeTranslation(const Vector3d& p) {
    return makeTransform(Matrix3d::Identity(), p);
}

/**
 * Rigid-body inverse: [R' | -R'*t]
 */
inline Matrix4d inverseTransform(const Matrix4d& T) {
    Matrix3d Rt = T.block<3, 3>(0, 0).transpose();
    return makeTransform(Rt, -Rt * T.block<3, 1>(0, 3));
}

inline Vector3d translationOf(const Matrix4d& T) {
    return T.block<3, 1>(0, 3);
}

inline Matrix3d rotationOf(const Matrix4d& T) {
    return T.block<3, 3>(0, 0);
}

/**
 * Transform mapping geometry placed at `from` onto `to` (plane-to-plane).
 */
inline Matrix4d planeToPlane(const Matrix4d& from, const Matrix4d& to) {
    return to * inverseTransform(from);
}

inline Vector3d transformPoint(const Matrix4d& T, const Vector3d& p) {
    return rotationOf(T) * p + translationOf(T);
}

/**
 * Angle (rad) of the relative rotation between two frames.
 */
inline double rotationAngleBetween(const Matrix4d& a, const Matrix4d& b) {
    Quaterniond qa(rotationOf(a));
    Quaterniond qb(rotationOf(b));
    return qa.angularDistance(qb);
}

inline double translationBetween(const Matrix4d& a, const Matrix4d& b) {
    return (translationOf(b) - translationOf(a)).norm();
}

/**
 * Lerp position, slerp orientation. t is clamped to [0, 1].
 */
inline Matrix4d interpolateTransform(const Matrix4d& a, const Matrix4d& b, double t) {
    t = std::clamp(t, 0.0, 1.0);
    Quaterniond qa(rotationOf(a));
    Quaterniond qb(rotationOf(b));
    Quaterniond q = qa.slerp(t, qb);
    q.normalize();
    Vector3d p = translationOf(a) + t * (translationOf(b) - translationOf(a));
    return makeTransform(q.toRotationMatrix(), p);
}

inline bool transformsNear(const Matrix4d& a, const Matrix4d& b,
                           double posTol = 1e-6, double oriTol = 1e-6) {
    return translationBetween(a, b) < posTol && rotationAngleBetween(a, b) < oriTol;
}

} // namespace kinematics
} // namespace robot_cell
