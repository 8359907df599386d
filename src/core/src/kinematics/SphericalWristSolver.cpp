/**
 * @file SphericalWristSolver.cpp
 * @brief Closed-form FK/IK implementation for spherical-wrist arms
 */

#include "SphericalWristSolver.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace robot_cell {
namespace kinematics {

namespace {

constexpr double ALPHA_TOLERANCE = 1e-6;
constexpr double LENGTH_TOLERANCE = 1e-6;
constexpr double SINGULAR_S5 = 1e-6;

// Expected twist per joint, see table in header
constexpr double EXPECTED_ALPHA[ARM_JOINTS] = {
    -PI / 2.0, 0.0, -PI / 2.0, PI / 2.0, -PI / 2.0, 0.0
};

double weightedDistance(const JointValues& a, const JointValues& b) {
    double cost = 0.0;
    for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
        double diff = a[i] - b[i];
        // Main axes (1-3) move more mass than the wrist
        double w = (i < 3) ? 1.0 : 0.5;
        cost += w * diff * diff;
    }
    return cost;
}

bool allWithinRange(const JointValues& q, const std::vector<Joint>& joints) {
    for (size_t i = 0; i < q.size() && i < joints.size(); ++i) {
        if (!joints[i].isWithinRange(q[i])) return false;
    }
    return true;
}

void reportOutOfRange(const JointValues& q, const std::vector<Joint>& joints,
                      std::vector<std::string>& errors) {
    for (size_t i = 0; i < q.size() && i < joints.size(); ++i) {
        const Joint& j = joints[i];
        if (!j.isWithinRange(q[i])) {
            errors.push_back(fmt::format(
                "Joint {} value {:.2f} deg is outside its range [{:.2f}, {:.2f}] deg",
                j.name, radToDeg(q[i]), radToDeg(j.minValue), radToDeg(j.maxValue)));
        }
    }
}

JointValues defaultValues(const std::vector<Joint>& joints) {
    JointValues q;
    q.reserve(joints.size());
    for (const auto& j : joints) q.push_back(j.defaultValue);
    return q;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

SphericalWristSolver::SphericalWristSolver(const DHTable& dh)
    : dh_(dh)
{
}

bool SphericalWristSolver::isSupported(const DHTable& dh, std::string* reason) {
    auto fail = [reason](const std::string& message) {
        if (reason) *reason = message;
        return false;
    };

    for (int i = 0; i < ARM_JOINTS; ++i) {
        if (std::abs(normalizeAngle(dh[i].alpha - EXPECTED_ALPHA[i])) > ALPHA_TOLERANCE) {
            return fail(fmt::format("joint {} alpha must be {:.0f} deg",
                                    i + 1, radToDeg(EXPECTED_ALPHA[i])));
        }
        if (std::abs(std::abs(dh[i].sign) - 1.0) > 1e-9) {
            return fail(fmt::format("joint {} sign must be +1 or -1", i + 1));
        }
    }

    if (std::abs(dh[1].d) > LENGTH_TOLERANCE || std::abs(dh[2].d) > LENGTH_TOLERANCE) {
        return fail("joints 2 and 3 must have d = 0");
    }
    if (std::abs(dh[4].d) > LENGTH_TOLERANCE) {
        return fail("joint 5 must have d = 0");
    }
    for (int i = 3; i < ARM_JOINTS; ++i) {
        if (std::abs(dh[i].a) > LENGTH_TOLERANCE) {
            return fail(fmt::format("joint {} must have a = 0 (spherical wrist)", i + 1));
        }
    }
    if (std::abs(dh[1].a) < LENGTH_TOLERANCE) {
        return fail("joint 2 must have a non-zero upper arm length");
    }
    if (std::hypot(dh[2].a, dh[3].d) < LENGTH_TOLERANCE) {
        return fail("forearm length must be non-zero");
    }
    return true;
}

// ============================================================================
// DH Transformation Matrix
// ============================================================================

Matrix4d SphericalWristSolver::dhTransform(double theta, double d, double a, double alpha) {
    double ct = std::cos(theta);
    double st = std::sin(theta);
    double ca = std::cos(alpha);
    double sa = std::sin(alpha);

    Matrix4d T;
    T << ct, -st * ca,  st * sa, a * ct,
         st,  ct * ca, -ct * sa, a * st,
          0,       sa,       ca,      d,
          0,        0,        0,      1;
    return T;
}

std::array<double, ARM_JOINTS> SphericalWristSolver::toDH(const JointValues& q) const {
    std::array<double, ARM_JOINTS> theta;
    for (int i = 0; i < ARM_JOINTS; ++i) {
        theta[i] = dh_[i].sign * q[i] + dh_[i].thetaOffset;
    }
    return theta;
}

JointValues SphericalWristSolver::fromDH(const std::array<double, ARM_JOINTS>& theta) const {
    JointValues q(ARM_JOINTS);
    for (int i = 0; i < ARM_JOINTS; ++i) {
        // theta = sign * q + offset  ->  q = (theta - offset) / sign
        q[i] = normalizeAngle((theta[i] - dh_[i].thetaOffset) / dh_[i].sign);
    }
    return q;
}

// ============================================================================
// Forward Kinematics
// ============================================================================

FrameList SphericalWristSolver::forward(const JointValues& q) const {
    auto theta = toDH(q);

    FrameList frames;
    frames.reserve(ARM_JOINTS);

    Matrix4d T = Matrix4d::Identity();
    for (int i = 0; i < ARM_JOINTS; ++i) {
        T = T * dhTransform(theta[i], dh_[i].d, dh_[i].a, dh_[i].alpha);
        frames.push_back(T);
    }
    return frames;
}

Configuration SphericalWristSolver::configurationOf(const JointValues& q) const {
    auto theta = toDH(q);
    auto frames = forward(q);

    // Frame 4 origin is the wrist center
    Vector3d wc = translationOf(frames[3]);
    double phi = std::atan2(dh_[3].d, dh_[2].a);

    Configuration c;
    c.shoulder = std::cos(theta[0]) * wc.x() + std::sin(theta[0]) * wc.y() < 0.0;
    c.elbow = std::sin(theta[2] + phi) < 0.0;
    c.wrist = std::sin(theta[4]) > 0.0;
    return c;
}

// ============================================================================
// Inverse Kinematics: Position Sub-Problem (θ1, θ2, θ3)
//
// In the arm plane of θ1 (h1 = horizontal reach past a1, pz = height
// above d1), with A = a3·c3 - d4·s3 and B = a3·s3 + d4·c3:
//   h1 =  c2·(a2 + A) - s2·B
//  -pz =  s2·(a2 + A) + c2·B
// Squaring and adding gives a3·c3 - d4·s3 = K, K = (h1² + pz² - a2² - a3² - d4²) / 2a2
// ============================================================================

std::vector<SphericalWristSolver::PositionBranch> SphericalWristSolver::solvePosition(
    const Vector3d& wc) const
{
    const double a1 = dh_[0].a;
    const double d1 = dh_[0].d;
    const double a2 = dh_[1].a;
    const double a3 = dh_[2].a;
    const double d4 = dh_[3].d;

    std::vector<PositionBranch> results;

    double th1_front = std::atan2(wc.y(), wc.x());
    if (std::hypot(wc.x(), wc.y()) < 1e-9) {
        th1_front = 0.0;  // On the J1 axis: any θ1 works
    }
    const double theta1_options[2] = { th1_front, normalizeAngle(th1_front + PI) };

    const double L = std::sqrt(a3 * a3 + d4 * d4);
    const double phi = std::atan2(d4, a3);

    for (int i1 = 0; i1 < 2; ++i1) {
        double th1 = theta1_options[i1];
        double c1 = std::cos(th1);
        double s1 = std::sin(th1);

        double h1 = c1 * wc.x() + s1 * wc.y() - a1;
        double pz = wc.z() - d1;

        double K = (h1 * h1 + pz * pz - a2 * a2 - a3 * a3 - d4 * d4) / (2.0 * a2);
        double ratio = K / L;
        if (std::abs(ratio) > 1.0 + 1e-10) continue;
        ratio = std::clamp(ratio, -1.0, 1.0);

        double gamma = std::acos(ratio);

        // elbow up: θ3 + φ in [0, π]; elbow down: θ3 + φ in [-π, 0]
        const double theta3_options[2] = { gamma - phi, -gamma - phi };

        for (int i3 = 0; i3 < 2; ++i3) {
            double th3 = theta3_options[i3];
            double c3 = std::cos(th3);
            double s3 = std::sin(th3);

            double A = a3 * c3 - d4 * s3;
            double B = a3 * s3 + d4 * c3;
            double th2 = std::atan2(-pz, h1) - std::atan2(B, a2 + A);

            results.push_back({ i1 == 1, i3 == 1, { th1, th2, th3 } });
        }
    }

    return results;
}

// ============================================================================
// Inverse Kinematics: Orientation Sub-Problem (θ4, θ5, θ6)
// ============================================================================

std::vector<SphericalWristSolver::OrientationBranch> SphericalWristSolver::solveOrientation(
    const Matrix3d& R_36,
    std::optional<double> th4_ref) const
{
    // R_36 = Rz(θ4) * Rx(+π/2) * Rz(θ5) * Rx(-π/2) * Rz(θ6)
    //      = Rz(θ4) * Ry(-θ5) * Rz(θ6)
    // ZYZ extraction with t5_eff = -θ5.

    std::vector<OrientationBranch> results;

    double r13 = R_36(0, 2);
    double r23 = R_36(1, 2);
    double r33 = R_36(2, 2);
    double r31 = R_36(2, 0);
    double r32 = R_36(2, 1);

    double s5 = std::sqrt(r13 * r13 + r23 * r23);

    if (s5 < SINGULAR_S5) {
        // ---- Wrist singularity: only θ4 ± θ6 is determined ----
        // Keep θ4 at the reference so the wrist does not spin.
        double th4 = th4_ref.value_or(0.0);
        double th5;
        double th6;

        if (r33 > 0) {
            th5 = 0.0;
            double total = std::atan2(R_36(1, 0), R_36(0, 0));  // θ4 + θ6
            th6 = total - th4;
        } else {
            th5 = -PI;
            double total = std::atan2(-R_36(1, 0), -R_36(0, 0));  // θ4 - θ6
            th6 = th4 - total;
        }

        // Both wrist branches collapse onto the same joints
        results.push_back({ false, { th4, th5, th6 } });
        results.push_back({ true, { th4, th5, th6 } });
        return results;
    }

    for (int flip = 0; flip < 2; ++flip) {
        double th5, th4, th6;

        if (flip == 0) {
            // s5_eff > 0 → θ5_dh < 0
            double t5_eff = std::atan2(s5, r33);
            th5 = -t5_eff;
            th4 = std::atan2(r23, r13);
            th6 = std::atan2(r32, -r31);
        } else {
            // s5_eff < 0 → θ5_dh > 0
            double t5_eff = std::atan2(-s5, r33);
            th5 = -t5_eff;
            th4 = std::atan2(-r23, -r13);
            th6 = std::atan2(-r32, r31);
        }

        results.push_back({ flip == 1, { th4, th5, th6 } });
    }

    return results;
}

// ============================================================================
// Full Inverse Kinematics
// ============================================================================

std::vector<ArmCandidate> SphericalWristSolver::inverse(
    const Matrix4d& flange, const double* q4Reference) const
{
    std::vector<ArmCandidate> result;

    const double d6 = dh_[5].d;

    Matrix3d R = rotationOf(flange);
    Vector3d wc = translationOf(flange) - d6 * R.col(2);

    auto positions = solvePosition(wc);

    std::optional<double> th4_ref;
    if (q4Reference) {
        th4_ref = dh_[3].sign * (*q4Reference) + dh_[3].thetaOffset;
    }

    for (const auto& pos : positions) {
        Matrix4d T03 = dhTransform(pos.theta[0], dh_[0].d, dh_[0].a, dh_[0].alpha)
                     * dhTransform(pos.theta[1], dh_[1].d, dh_[1].a, dh_[1].alpha)
                     * dhTransform(pos.theta[2], dh_[2].d, dh_[2].a, dh_[2].alpha);
        Matrix3d R_36 = rotationOf(T03).transpose() * R;

        for (const auto& ori : solveOrientation(R_36, th4_ref)) {
            std::array<double, ARM_JOINTS> theta = {
                pos.theta[0], pos.theta[1], pos.theta[2],
                ori.theta[0], ori.theta[1], ori.theta[2]
            };

            ArmCandidate candidate;
            candidate.configuration.shoulder = pos.shoulder;
            candidate.configuration.elbow = pos.elbow;
            candidate.configuration.wrist = ori.wrist;
            candidate.joints = fromDH(theta);
            result.push_back(std::move(candidate));
        }
    }

    return result;
}

// ============================================================================
// Turn Selection
// ============================================================================

double SphericalWristSolver::closestTurn(double value, double reference, const Joint& joint) {
    if (!joint.isRevolute()) return value;

    bool found = false;
    double best = value;
    for (int k = -2; k <= 2; ++k) {
        double v = value + 2.0 * PI * k;
        if (!joint.isWithinRange(v)) continue;
        if (!found || std::abs(v - reference) < std::abs(best - reference)) {
            best = v;
            found = true;
        }
    }
    return best;
}

// ============================================================================
// Branch Selection
// ============================================================================

const ArmCandidate* SphericalWristSolver::select(
    const std::vector<ArmCandidate>& candidates,
    const MechanismRequest& request,
    const std::vector<Joint>& joints,
    std::vector<std::string>& errors) const
{
    if (candidates.empty()) return nullptr;

    if (request.configuration) {
        for (const auto& c : candidates) {
            if (c.configuration == *request.configuration) return &c;
        }
        errors.push_back(fmt::format("Configuration {} cannot reach the target",
                                     request.configuration->toString()));
    }

    std::vector<const ArmCandidate*> pool;
    for (const auto& c : candidates) {
        if (allWithinRange(c.joints, joints)) pool.push_back(&c);
    }
    if (pool.empty()) {
        for (const auto& c : candidates) pool.push_back(&c);
    }

    if (request.previous) {
        Configuration previous = configurationOf(*request.previous);
        for (const auto* c : pool) {
            if (c->configuration == previous) return c;
        }

        const ArmCandidate* best = nullptr;
        double best_cost = std::numeric_limits<double>::max();
        for (const auto* c : pool) {
            double cost = weightedDistance(c->joints, *request.previous);
            if (cost < best_cost) {
                best_cost = cost;
                best = c;
            }
        }
        return best;
    }

    const ArmCandidate* best = pool.front();
    for (const auto* c : pool) {
        if (c->configuration.rank() < best->configuration.rank()) best = c;
    }
    return best;
}

// ============================================================================
// Solve
// ============================================================================

KinematicSolution SphericalWristSolver::solve(const MechanismRequest& request,
                                              const std::vector<Joint>& joints) const
{
    KinematicSolution solution;

    const JointValues* previous =
        (request.previous && request.previous->size() == ARM_JOINTS) ? request.previous : nullptr;

    if (request.joints) {
        solution.joints = *request.joints;
    } else if (request.flange) {
        double q4 = previous ? (*previous)[3] : 0.0;
        auto candidates = inverse(*request.flange, previous ? &q4 : nullptr);

        // Whole-turn alternatives, nearest to the previous joints (or zero)
        for (auto& c : candidates) {
            for (int i = 0; i < ARM_JOINTS; ++i) {
                double reference = previous ? (*previous)[i] : 0.0;
                c.joints[i] = closestTurn(c.joints[i], reference, joints[i]);
            }
        }

        MechanismRequest selection = request;
        selection.previous = previous;
        const ArmCandidate* chosen = select(candidates, selection, joints, solution.errors);

        if (!chosen) {
            solution.errors.push_back("Target out of reach");
            solution.joints = previous ? *previous : defaultValues(joints);
            solution.frames = forward(solution.joints);
            solution.configuration = configurationOf(solution.joints);
            return solution;
        }

        solution.joints = chosen->joints;
        solution.configuration = chosen->configuration;
        solution.frames = forward(solution.joints);
        reportOutOfRange(solution.joints, joints, solution.errors);
        return solution;
    } else {
        solution.joints = defaultValues(joints);
    }

    solution.frames = forward(solution.joints);
    solution.configuration = configurationOf(solution.joints);
    reportOutOfRange(solution.joints, joints, solution.errors);
    return solution;
}

} // namespace kinematics
} // namespace robot_cell
