/**
 * @file SphericalWristSolver.hpp
 * @brief Closed-form FK/IK for 6-axis arms with a spherical wrist
 *
 * DH Convention: Standard DH
 *   T_i = Rz(theta_i) * Tz(d_i) * Tx(a_i) * Rx(alpha_i)
 *   theta_i = sign_i * q_i + offset_i
 *
 * Supported geometry (the usual industrial 6R layout):
 *   | Joint | a  | alpha | d  |
 *   |-------|----|-------|----|
 *   | 1     | a1 | -90   | d1 |
 *   | 2     | a2 |   0   | 0  |
 *   | 3     | a3 | -90   | 0  |
 *   | 4     | 0  |  90   | d4 |
 *   | 5     | 0  | -90   | 0  |
 *   | 6     | 0  |   0   | d6 |
 *
 * IK uses position/orientation decoupling (Pieper):
 *   Step 1: wrist center = P - d6 * R * [0,0,1]^T
 *   Step 2: theta1..3 from the wrist center (shoulder x elbow = 4 branches)
 *   Step 3: R_36 = R_03^T * R
 *   Step 4: theta4..6 from ZYZ extraction of R_36 (flip / no-flip)
 */

#pragma once

#include "Configuration.hpp"
#include "Joint.hpp"
#include "KinematicSolution.hpp"
#include "MathTypes.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace robot_cell {
namespace kinematics {

constexpr int ARM_JOINTS = 6;

struct DHRow {
    double a = 0.0;             // Link length (mm)
    double alpha = 0.0;         // Link twist (rad)
    double d = 0.0;             // Link offset (mm)
    double thetaOffset = 0.0;   // Joint angle offset (rad)
    double sign = 1.0;          // Joint angle sign (+1 or -1)
};

using DHTable = std::array<DHRow, ARM_JOINTS>;

/**
 * One inverse-kinematics branch.
 */
struct ArmCandidate {
    Configuration configuration;
    JointValues joints;
};

/**
 * Analytical kinematics for a 6-axis arm with spherical wrist.
 *
 * Frames are relative to the arm base; the last frame is the flange.
 * All methods are const.
 */
class SphericalWristSolver {
public:
    explicit SphericalWristSolver(const DHTable& dh);

    /**
     * Check that a DH table has the layout this solver handles.
     * @param reason Receives a description of the first mismatch (may be null)
     */
    static bool isSupported(const DHTable& dh, std::string* reason = nullptr);

    /**
     * Compute base->frame_i for i = 1..6
     */
    FrameList forward(const JointValues& q) const;

    /**
     * All geometric branches for a flange pose (up to 8), angles normalized
     * to [-pi, pi]. Joint limits are not applied.
     * @param q4Reference Used for theta4 at a wrist singularity (may be null)
     */
    std::vector<ArmCandidate> inverse(const Matrix4d& flange,
                                      const double* q4Reference = nullptr) const;

    /**
     * Configuration tag of a joint vector
     */
    Configuration configurationOf(const JointValues& q) const;

    /**
     * Resolve a request (flange relative to the arm base) against the
     * given joints. Branch choice:
     *   1. the requested configuration (reported if it has no branch)
     *   2. with previous joints: the previous configuration, else the
     *      in-range branch nearest to the previous joints
     *   3. the in-range branch with the lowest rank
     * When no branch is in range, 2 and 3 pick among all branches and the
     * offending joints are reported.
     */
    KinematicSolution solve(const MechanismRequest& request,
                            const std::vector<Joint>& joints) const;

    const DHTable& dhTable() const { return dh_; }

    /**
     * Move a revolute value by whole turns to the in-range value closest
     * to `reference`. Returns the input if no turn lands in range.
     */
    static double closestTurn(double value, double reference, const Joint& joint);

private:
    DHTable dh_;

    static Matrix4d dhTransform(double theta, double d, double a, double alpha);

    std::array<double, ARM_JOINTS> toDH(const JointValues& q) const;
    JointValues fromDH(const std::array<double, ARM_JOINTS>& theta) const;

    struct PositionBranch {
        bool shoulder;
        bool elbow;
        std::array<double, 3> theta;
    };

    std::vector<PositionBranch> solvePosition(const Vector3d& wristCenter) const;

    struct OrientationBranch {
        bool wrist;
        std::array<double, 3> theta;
    };

    std::vector<OrientationBranch> solveOrientation(
        const Matrix3d& R_36, std::optional<double> th4_ref) const;

    const ArmCandidate* select(const std::vector<ArmCandidate>& candidates,
                               const MechanismRequest& request,
                               const std::vector<Joint>& joints,
                               std::vector<std::string>& errors) const;
};

} // namespace kinematics
} // namespace robot_cell
