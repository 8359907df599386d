/**
 * @file test_check_program.cpp
 * @brief Unit tests for CheckProgram (validation, resolution, keyframing)
 */

#include <gtest/gtest.h>
#include "TestCells.hpp"
#include "program/CheckProgram.hpp"

using namespace robot_cell;
using namespace robot_cell::kinematics;
using namespace robot_cell::program;
using namespace robot_cell::test;

// ============================================================================
// Test Fixture
// ============================================================================

class CheckProgramTest : public ::testing::Test {
protected:
    std::shared_ptr<const RobotCell> cell = singleArmCell();
    CheckSettings coarse;

    static constexpr double POS_TOL = 1e-6;     // mm
    static constexpr double TIME_TOL = 1e-9;    // s

    void SetUp() override {
        coarse.linearStep = 10.0;
        coarse.angularStep = 0.1;
    }

    static Matrix4d downPose(double x, double y, double z) {
        Matrix3d R;
        R << -1, 0,  0,
              0, 1,  0,
              0, 0, -1;
        return makeTransform(R, Vector3d(x, y, z));
    }

    static int countDiagnostics(const CheckProgram& check, const std::string& prefix) {
        int count = 0;
        for (const auto& d : check.diagnostics()) {
            if (d.message.rfind(prefix, 0) == 0) ++count;
        }
        return count;
    }

    static JointValues turned(double j1) {
        JointValues q = homeJoints();
        q[0] = j1;
        return q;
    }
};

// ============================================================================
// Structural errors
// ============================================================================

TEST_F(CheckProgramTest, Structural_ToolpathCount) {
    CheckProgram check(*cell, {});

    ASSERT_EQ(check.errors().size(), 1u);
    EXPECT_EQ(check.errors()[0], "You supplied 0 toolpath(s), this robot cell requires 1 toolpath(s)");
    EXPECT_TRUE(check.keyframes().empty());
    EXPECT_TRUE(check.solutions().empty());
    EXPECT_DOUBLE_EQ(check.duration(), 0.0);
}

TEST_F(CheckProgramTest, Structural_MismatchedTargetCounts) {
    auto twoGroups = armAndPositionerCell();
    std::vector<target::Toolpath> toolpaths = {
        { jointTarget(homeJoints()), jointTarget(homeJoints()) },
        { jointTarget({}, { 0.0 }) }
    };

    CheckProgram check(*twoGroups, toolpaths);

    ASSERT_TRUE(check.hasErrors());
    EXPECT_EQ(check.errors()[0], "All toolpaths must contain the same number of targets");
    EXPECT_TRUE(check.keyframes().empty());
}

TEST_F(CheckProgramTest, Structural_EmptyProgram) {
    CheckProgram check(*cell, { target::Toolpath{} });

    ASSERT_TRUE(check.hasErrors());
    EXPECT_EQ(check.errors()[0], "The program must contain at least 1 target");
}

TEST_F(CheckProgramTest, Structural_NullTarget) {
    CheckProgram check(*cell, { { jointTarget(homeJoints()), nullptr } });

    ASSERT_TRUE(check.hasErrors());
    EXPECT_EQ(check.errors()[0], "Target index 1 is null or invalid");
    EXPECT_TRUE(check.keyframes().empty());
}

TEST_F(CheckProgramTest, Structural_JointCount) {
    CheckProgram check(*cell, { { jointTarget({ 0.0, 0.0, 0.0, 0.0, 0.0 }) } });

    ASSERT_TRUE(check.hasErrors());
    EXPECT_EQ(check.errors()[0], "Target index 0 of group 'Robot' has 5 joint value(s), should have 6");
}

TEST_F(CheckProgramTest, Structural_InvalidCoupling) {
    auto t = target::Target::cartesianPose(homeFlange());
    t.frame = frame::TargetFrame::coupled(Matrix4d::Identity(), -1, 0, "table");

    CheckProgram check(*cell, { { std::make_shared<const target::Target>(t) } });

    ASSERT_TRUE(check.hasErrors());
    EXPECT_NE(check.errors()[0].find("which does not exist"), std::string::npos);
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(CheckProgramTest, SingleUnreachableTarget) {
    target::Toolpath toolpath = {
        jointTarget(homeJoints()),
        poseTarget(makeTranslation(Vector3d(5000.0, 0.0, 0.0))),
        jointTarget(turned(0.5))
    };

    CheckProgram check(*cell, { toolpath }, coarse);

    EXPECT_FALSE(check.hasErrors());
    ASSERT_EQ(check.diagnostics().size(), 1u);
    EXPECT_EQ(check.diagnostics()[0].targetIndex, 1);
    EXPECT_EQ(check.diagnostics()[0].group, 0);
    EXPECT_EQ(check.diagnostics()[0].message, "Target out of reach");

    EXPECT_FALSE(check.keyframes().empty());
    EXPECT_EQ(check.keyframes().back().targetIndex, 2);
}

TEST_F(CheckProgramTest, ContinuityAcrossTargets) {
    JointValues qA = { 0.2, 1.2, -2.6, 0.3, -0.6, 0.1 };
    Matrix4d flangeA = cell->group(0).robot()->forward(qA, Matrix4d::Identity()).back();

    target::Toolpath toolpath = {
        jointTarget(qA),
        poseTarget(shifted(flangeA, Vector3d(20.0, 10.0, -15.0)))
    };

    CheckProgram check(*cell, { toolpath }, coarse);

    ASSERT_EQ(check.solutions().size(), 2u);
    const auto& solution = check.solutions()[1][0];
    EXPECT_FALSE(solution.hasErrors());
    EXPECT_TRUE(solution.configuration.elbow);
    EXPECT_FALSE(solution.configuration.shoulder);
    EXPECT_NEAR(solution.joints[1], 1.221197, 1e-5);
    EXPECT_NEAR(solution.joints[2], -2.606719, 1e-5);
}

TEST_F(CheckProgramTest, FixedTargetsCarryConfiguration) {
    auto original = poseTarget(shifted(homeFlange(), Vector3d(0.0, 50.0, 0.0)));
    auto joint = jointTarget(homeJoints());

    CheckProgram check(*cell, { { joint, original } }, coarse);

    ASSERT_EQ(check.fixedTargets().size(), 2u);
    const auto& fixed = check.fixedTargets()[1].target(0);
    ASSERT_NE(fixed.cartesian(), nullptr);
    ASSERT_TRUE(fixed.cartesian()->configuration.has_value());
    EXPECT_EQ(*fixed.cartesian()->configuration, check.solutions()[1][0].configuration);

    // Callers' targets are never modified
    EXPECT_FALSE(original->cartesian()->configuration.has_value());
    EXPECT_EQ(check.fixedTargets()[0].programTargets[0].target, joint);
    EXPECT_EQ(check.fixedTargets()[1].index, 1);
}

// ============================================================================
// Keyframes
// ============================================================================

TEST_F(CheckProgramTest, KeyframesAreMonotonic) {
    target::Toolpath toolpath = {
        jointTarget(homeJoints()),
        poseTarget(shifted(homeFlange(), Vector3d(-200.0, 100.0, -100.0)), target::Motion::LINEAR),
        jointTarget(turned(-0.4)),
        poseTarget(shifted(homeFlange(), Vector3d(0.0, 0.0, 50.0)))
    };

    CheckProgram check(*cell, { toolpath }, coarse);
    const auto& keyframes = check.keyframes();

    ASSERT_GT(keyframes.size(), toolpath.size());
    EXPECT_DOUBLE_EQ(keyframes.front().time, 0.0);
    EXPECT_EQ(keyframes.front().targetIndex, 0);

    int target = 0;
    for (size_t k = 1; k < keyframes.size(); ++k) {
        EXPECT_GE(keyframes[k].time, keyframes[k - 1].time);
        EXPECT_GE(keyframes[k].targetIndex, target);
        target = keyframes[k].targetIndex;
        ASSERT_EQ(keyframes[k].solutions.size(), 1u);
        EXPECT_EQ(keyframes[k].solutions[0].frames.size(), 8u);
    }
    EXPECT_EQ(keyframes.back().targetIndex, 3);
    EXPECT_DOUBLE_EQ(check.duration(), keyframes.back().time);
}

TEST_F(CheckProgramTest, DurationFromSpeeds) {
    CheckProgram check(*cell, { { jointTarget(homeJoints()), jointTarget(turned(0.5)) } }, coarse);

    // TCP travels the chord of a 0.5 rad turn about J1 at 100 mm/s
    double chord = 2.0 * HOME_X * std::sin(0.25);
    EXPECT_NEAR(check.duration(), chord / 100.0, 1e-6);
}

TEST_F(CheckProgramTest, FixedTimeOverridesSpeeds) {
    auto t = target::Target::joint(turned(0.5));
    t.speed = target::Speed::fixedTime(2.0);

    CheckProgram check(*cell, { { jointTarget(homeJoints()), std::make_shared<const target::Target>(t) } },
                       coarse);

    EXPECT_NEAR(check.duration(), 2.0, TIME_TOL);
}

TEST_F(CheckProgramTest, LinearMotionIsSubdivided) {
    CheckSettings settings;
    settings.linearStep = 10.0;
    settings.angularStep = 1.0;

    Matrix4d end = shifted(homeFlange(), Vector3d(100.0, 0.0, 0.0));
    CheckProgram check(*cell, { { jointTarget(homeJoints()),
                                  poseTarget(end, target::Motion::LINEAR) } }, settings);

    EXPECT_TRUE(check.diagnostics().empty());
    const auto& keyframes = check.keyframes();
    ASSERT_EQ(keyframes.size(), 11u);

    for (size_t k = 0; k < keyframes.size(); ++k) {
        Vector3d p = translationOf(keyframes[k].solutions[0].toolFrame());
        EXPECT_NEAR(p.x(), HOME_X + 10.0 * k, 1e-6) << "keyframe " << k;
        EXPECT_NEAR(p.y(), 0.0, 1e-6);
        EXPECT_NEAR(p.z(), HOME_Z, 1e-6);
        EXPECT_NEAR(rotationAngleBetween(keyframes[k].solutions[0].toolFrame(), homeFlange()),
                    0.0, 1e-6);
        EXPECT_NEAR(keyframes[k].time, 0.1 * k, 1e-9);
    }
}

TEST_F(CheckProgramTest, ConfigurationChangeInLinearMotion) {
    Configuration flipped;
    flipped.wrist = true;

    CheckSettings settings;
    settings.linearStep = 5.0;
    settings.angularStep = 0.1;

    target::Toolpath toolpath = {
        poseTarget(homeFlange()),
        poseTarget(shifted(homeFlange(), Vector3d(10.0, 0.0, 0.0)), target::Motion::LINEAR, flipped)
    };

    CheckProgram check(*cell, { toolpath }, settings);

    EXPECT_EQ(check.solutions()[1][0].configuration, flipped);
    EXPECT_EQ(countDiagnostics(check, "Joint discontinuity in linear motion"), 1);
    for (const auto& d : check.diagnostics()) {
        EXPECT_EQ(d.targetIndex, 1);
    }
}

TEST_F(CheckProgramTest, LinearMotionThroughInvalidPoses) {
    CheckSettings settings;
    settings.linearStep = 20.0;
    settings.angularStep = 0.1;

    // Wrist centres at (640, 480, 505) and (-640, -480, 505): the line
    // crosses the J1 axis at shoulder height. Within 190 mm of the axis the
    // wrist centre is closer than 340 mm to the shoulder on both sides,
    // tighter than the arm can fold, so no branch reaches those samples.
    target::Toolpath toolpath = {
        poseTarget(downPose(640.0, 480.0, 405.0)),
        poseTarget(downPose(-640.0, -480.0, 405.0), target::Motion::LINEAR)
    };

    CheckProgram check(*cell, { toolpath }, settings);

    ASSERT_FALSE(check.hasErrors());
    EXPECT_FALSE(check.solutions()[0][0].hasErrors());
    EXPECT_FALSE(check.solutions()[1][0].hasErrors());
    EXPECT_EQ(countDiagnostics(check, "Linear motion passes through an invalid pose: "), 1);

    // The unreachable stretch is sampled
    bool sampledUnreachable = false;
    for (const auto& keyframe : check.keyframes()) {
        if (keyframe.solutions[0].hasErrors()) sampledUnreachable = true;
    }
    EXPECT_TRUE(sampledUnreachable);
    for (const auto& d : check.diagnostics()) {
        EXPECT_EQ(d.targetIndex, 1);
    }
}

TEST_F(CheckProgramTest, InvalidSettingsFallBack) {
    CheckSettings settings;
    settings.linearStep = -1.0;
    settings.angularStep = 0.0;

    CheckProgram check(*cell, { { jointTarget(homeJoints()), jointTarget(turned(0.05)) } }, settings);

    EXPECT_FALSE(check.hasErrors());
    EXPECT_GT(check.keyframes().size(), 2u);
}

TEST_F(CheckProgramTest, SettingsFromConfig) {
    config::CheckConfig config;
    config.linear_step = 5.0;
    config.angular_step = 2.0;
    config.joint_jump_factor = 4.0;

    auto settings = CheckSettings::fromConfig(config);
    EXPECT_DOUBLE_EQ(settings.linearStep, 5.0);
    EXPECT_NEAR(settings.angularStep, degToRad(2.0), 1e-15);
    EXPECT_DOUBLE_EQ(settings.jointJumpFactor, 4.0);
}
