/**
 * @file FrameConversions.cpp
 * @brief Frame to controller-number conversions
 */

#include "FrameConversions.hpp"
#include "FrameTypes.hpp"
#include <Eigen/Geometry>

namespace robot_cell {
namespace frame {

std::vector<double> frameToQuaternionNumbers(const Eigen::Matrix4d& frame) {
    Eigen::Quaterniond q(Eigen::Matrix3d(frame.block<3, 3>(0, 0)));
    q.normalize();

    // Keep the scalar part positive so equal rotations give equal numbers
    if (q.w() < 0) {
        q.coeffs() *= -1.0;
    }

    return {frame(0, 3), frame(1, 3), frame(2, 3), q.w(), q.x(), q.y(), q.z()};
}

std::vector<double> frameToEulerNumbers(const Eigen::Matrix4d& frame) {
    Frame f = Frame::fromMatrix(frame);
    // KUKA A, B, C = rotation about Z, Y, X
    return {f.x, f.y, f.z, f.rz, f.ry, f.rx};
}

std::vector<double> frameToAxisAngleNumbers(const Eigen::Matrix4d& frame) {
    Eigen::AngleAxisd aa(Eigen::Matrix3d(frame.block<3, 3>(0, 0)));
    Eigen::Vector3d v = aa.axis() * aa.angle();
    constexpr double MM_TO_M = 0.001;
    return {frame(0, 3) * MM_TO_M, frame(1, 3) * MM_TO_M, frame(2, 3) * MM_TO_M,
            v.x(), v.y(), v.z()};
}

std::vector<double> frameToNumbers(const Eigen::Matrix4d& frame,
                                   config::Manufacturer manufacturer) {
    switch (manufacturer) {
        case config::Manufacturer::KUKA: return frameToEulerNumbers(frame);
        case config::Manufacturer::UR:   return frameToAxisAngleNumbers(frame);
        case config::Manufacturer::ABB:
        case config::Manufacturer::STAUBLI:
        case config::Manufacturer::OTHER:
        default:
            return frameToQuaternionNumbers(frame);
    }
}

} // namespace frame
} // namespace robot_cell
