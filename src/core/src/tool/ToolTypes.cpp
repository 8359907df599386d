/**
 * @file ToolTypes.cpp
 * @brief Tool TCP helpers
 */

#include "ToolTypes.hpp"
#include "../kinematics/MathTypes.hpp"

namespace robot_cell {
namespace tool {

Eigen::Matrix4d Tool::tcpFrame() const {
    return tcp.toMatrix();
}

Eigen::Matrix4d Tool::flangeFor(const Eigen::Matrix4d& tcpPose) const {
    if (isFlange()) return tcpPose;
    return tcpPose * kinematics::inverseTransform(tcpFrame());
}

bool Tool::isFlange() const {
    constexpr double eps = 1e-9;
    for (double v : tcp.toArray()) {
        if (std::abs(v) > eps) return false;
    }
    return true;
}

std::shared_ptr<const Tool> Tool::defaultTool() {
    static const auto tool = std::make_shared<const Tool>();
    return tool;
}

} // namespace tool
} // namespace robot_cell
