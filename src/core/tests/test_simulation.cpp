/**
 * @file test_simulation.cpp
 * @brief Unit tests for Simulation (keyframe playback)
 *
 * Keyframes used by most tests (one group, one joint, one frame):
 *   t = 0 s  joints {0}  frame I          target 0
 *   t = 2 s  joints {1}  frame T(10,0,0)  target 1  (Elbow)
 *   t = 4 s  joints {3}  frame T(10,0,0)  target 2  (Elbow)
 */

#include <gtest/gtest.h>
#include "program/Simulation.hpp"

using namespace robot_cell;
using namespace robot_cell::kinematics;
using namespace robot_cell::program;

// ============================================================================
// Test Fixture
// ============================================================================

class SimulationTest : public ::testing::Test {
protected:
    std::shared_ptr<const std::vector<Keyframe>> keyframes;

    static constexpr double POS_TOL = 1e-9;     // mm

    static Keyframe keyframe(double time, int target, double joint, const Matrix4d& frame,
                             bool elbow = false) {
        KinematicSolution solution;
        solution.joints = { joint };
        solution.frames = { frame };
        solution.configuration.elbow = elbow;

        Keyframe k;
        k.time = time;
        k.targetIndex = target;
        k.solutions = { solution };
        return k;
    }

    void SetUp() override {
        Matrix4d moved = makeTranslation(Vector3d(10.0, 0.0, 0.0));
        keyframes = std::make_shared<const std::vector<Keyframe>>(std::vector<Keyframe>{
            keyframe(0.0, 0, 0.0, Matrix4d::Identity()),
            keyframe(2.0, 1, 1.0, moved, true),
            keyframe(4.0, 2, 3.0, moved, true)
        });
    }
};

// ============================================================================
// Stepping
// ============================================================================

TEST_F(SimulationTest, StartsAtFirstKeyframe) {
    Simulation simulation(keyframes);

    EXPECT_DOUBLE_EQ(simulation.duration(), 4.0);
    EXPECT_EQ(simulation.currentPose().targetIndex, 0);
    ASSERT_EQ(simulation.currentPose().solutions.size(), 1u);
    EXPECT_DOUBLE_EQ(simulation.currentPose().solutions[0].joints[0], 0.0);
}

TEST_F(SimulationTest, NormalizedTime) {
    Simulation simulation(keyframes);

    const auto& pose = simulation.step(0.5);
    EXPECT_DOUBLE_EQ(pose.time, 2.0);
    EXPECT_EQ(pose.targetIndex, 1);
    EXPECT_NEAR(pose.solutions[0].joints[0], 1.0, 1e-12);
}

TEST_F(SimulationTest, AbsoluteTimeInterpolates) {
    Simulation simulation(keyframes);

    const auto& pose = simulation.step(1.0, false);
    EXPECT_EQ(pose.targetIndex, 1);
    EXPECT_NEAR(pose.solutions[0].joints[0], 0.5, 1e-12);

    Vector3d p = translationOf(pose.solutions[0].frames[0]);
    EXPECT_NEAR(p.x(), 5.0, POS_TOL);
    EXPECT_NEAR(p.y(), 0.0, POS_TOL);

    simulation.step(3.0, false);
    EXPECT_EQ(simulation.currentPose().targetIndex, 2);
    EXPECT_NEAR(simulation.currentPose().solutions[0].joints[0], 2.0, 1e-12);
}

TEST_F(SimulationTest, TimeIsClamped) {
    Simulation simulation(keyframes);

    simulation.step(-1.0, false);
    EXPECT_DOUBLE_EQ(simulation.currentPose().time, 0.0);
    EXPECT_EQ(simulation.currentPose().targetIndex, 0);
    EXPECT_DOUBLE_EQ(simulation.currentPose().solutions[0].joints[0], 0.0);

    simulation.step(2.0);
    EXPECT_DOUBLE_EQ(simulation.currentPose().time, 4.0);
    EXPECT_EQ(simulation.currentPose().targetIndex, 2);
    EXPECT_DOUBLE_EQ(simulation.currentPose().solutions[0].joints[0], 3.0);
}

TEST_F(SimulationTest, SteppingBackwards) {
    Simulation simulation(keyframes);

    simulation.step(3.5, false);
    simulation.step(0.5, false);
    EXPECT_EQ(simulation.currentPose().targetIndex, 1);
    EXPECT_NEAR(simulation.currentPose().solutions[0].joints[0], 0.25, 1e-12);
}

TEST_F(SimulationTest, ConfigurationHeldUntilKeyframe) {
    Simulation simulation(keyframes);

    simulation.step(1.9, false);
    EXPECT_FALSE(simulation.currentPose().solutions[0].configuration.elbow);

    simulation.step(2.0, false);
    EXPECT_TRUE(simulation.currentPose().solutions[0].configuration.elbow);

    auto solutions = Simulation::interpolate((*keyframes)[0], (*keyframes)[1], 1.0);
    EXPECT_TRUE(solutions[0].configuration.elbow);
}

TEST_F(SimulationTest, InstancesShareKeyframes) {
    Simulation a(keyframes);
    Simulation b(keyframes);

    a.step(0.25);
    b.step(1.0);

    EXPECT_NEAR(a.currentPose().solutions[0].joints[0], 0.5, 1e-12);
    EXPECT_NEAR(b.currentPose().solutions[0].joints[0], 3.0, 1e-12);
    EXPECT_EQ(&a.keyframes(), &b.keyframes());
}

TEST_F(SimulationTest, SingleKeyframe) {
    auto single = std::make_shared<const std::vector<Keyframe>>(
        std::vector<Keyframe>{ keyframe(0.0, 0, 0.7, Matrix4d::Identity()) });
    Simulation simulation(single);

    const auto& pose = simulation.step(0.5);
    EXPECT_DOUBLE_EQ(pose.time, 0.0);
    EXPECT_DOUBLE_EQ(pose.solutions[0].joints[0], 0.7);
}

TEST_F(SimulationTest, RequiresKeyframes) {
    EXPECT_THROW(Simulation(std::make_shared<const std::vector<Keyframe>>()), std::invalid_argument);
    EXPECT_THROW(Simulation(nullptr), std::invalid_argument);
}
