/**
 * @file FrameConversions.hpp
 * @brief Frame to controller-number conversions
 *
 * The first 3 numbers are the origin, the rest encode the rotation
 * in the convention of the controller vendor:
 *   ABB   - quaternion (q1..q4, scalar first), mm
 *   KUKA  - Euler ZYX A, B, C in degrees, mm
 *   UR    - axis-angle vector in radians, metres
 *   other - quaternion, mm
 */

#pragma once

#include "../config/Manufacturer.hpp"
#include <Eigen/Core>
#include <vector>

namespace robot_cell {
namespace frame {

std::vector<double> frameToQuaternionNumbers(const Eigen::Matrix4d& frame);
std::vector<double> frameToEulerNumbers(const Eigen::Matrix4d& frame);
std::vector<double> frameToAxisAngleNumbers(const Eigen::Matrix4d& frame);

std::vector<double> frameToNumbers(const Eigen::Matrix4d& frame,
                                   config::Manufacturer manufacturer);

} // namespace frame
} // namespace robot_cell
