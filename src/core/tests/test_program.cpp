/**
 * @file test_program.cpp
 * @brief Unit tests for Program (naming, multi-file indices, playback, export)
 */

#include <gtest/gtest.h>
#include "TestCells.hpp"
#include "program/Program.hpp"

using namespace robot_cell;
using namespace robot_cell::kinematics;
using namespace robot_cell::program;
using namespace robot_cell::test;

namespace {

/**
 * Records every pose handed to the mesh layer
 */
class RecordingPoser : public IMeshPoser {
public:
    void pose(const std::vector<KinematicSolution>& solutions,
              const target::CellTarget& cellTarget) override {
        ++calls;
        lastJoints = solutions.at(0).joints;
        lastTarget = cellTarget.index;
    }

    int calls = 0;
    JointValues lastJoints;
    int lastTarget = -1;
};

JointValues turned(double j1) {
    JointValues q = homeJoints();
    q[0] = j1;
    return q;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ProgramTest : public ::testing::Test {
protected:
    CheckSettings coarse;

    void SetUp() override {
        coarse.linearStep = 20.0;
        coarse.angularStep = 0.1;
    }

    target::Toolpath threeTargets() const {
        return { jointTarget(homeJoints()),
                 poseTarget(shifted(homeFlange(), Vector3d(0.0, 50.0, 0.0))),
                 jointTarget(turned(0.3)) };
    }
};

// ============================================================================
// Naming
// ============================================================================

TEST_F(ProgramTest, IdentifierRules) {
    std::string error;
    EXPECT_TRUE(Program::isValidIdentifier("Weld_01", error));
    EXPECT_TRUE(error.empty());

    EXPECT_FALSE(Program::isValidIdentifier("", error));
    EXPECT_EQ(error, "name is empty");

    EXPECT_FALSE(Program::isValidIdentifier(std::string(35, 'a'), error));
    EXPECT_EQ(error, "name is 3 character(s) too long");
    EXPECT_TRUE(Program::isValidIdentifier(std::string(32, 'a'), error));

    EXPECT_FALSE(Program::isValidIdentifier("1st", error));
    EXPECT_EQ(error, "name must start with a letter");

    EXPECT_FALSE(Program::isValidIdentifier("_weld", error));
    EXPECT_EQ(error, "name must start with a letter");

    EXPECT_FALSE(Program::isValidIdentifier("weld-01", error));
    EXPECT_EQ(error, "name can only contain letters, digits, and underscores (_)");

    EXPECT_FALSE(Program::isValidIdentifier("weld 01", error));
    EXPECT_FALSE(Program::isValidIdentifier("w\xc3\xa9ld", error));
}

TEST_F(ProgramTest, InvalidNameStillSimulates) {
    Program program(std::string(40, 'P'), singleArmCell(), { threeTargets() }, {}, coarse);

    ASSERT_EQ(program.errors().size(), 1u);
    EXPECT_EQ(program.errors()[0], "Program name is 8 character(s) too long");
    EXPECT_TRUE(program.hasSimulation());
    EXPECT_EQ(program.targets().size(), 3u);
}

TEST_F(ProgramTest, MultiGroupNameIncludesLongestGroup) {
    auto cell = armAndPositionerCell();
    target::Toolpath positioner = { jointTarget({}, { 0.0 }), jointTarget({}, { 0.5 }),
                                    jointTarget({}, { 1.0 }) };

    // "Weld" -> "Weld_Positioner_000"
    Program ok("Weld", cell, { threeTargets(), positioner }, {}, coarse);
    EXPECT_TRUE(ok.errors().empty());

    // 20 + 15 characters
    Program tooLong("ABCDEFGHIJKLMNOPQRST", cell, { threeTargets(), positioner }, {}, coarse);
    ASSERT_EQ(tooLong.errors().size(), 1u);
    EXPECT_EQ(tooLong.errors()[0], "Program name is 3 character(s) too long");
}

TEST_F(ProgramTest, KukaLegacyNameWarning) {
    auto kuka = singleArmCell(config::Manufacturer::KUKA);

    Program program("ABCDEFGHIJKLMNOPQRSTUVWXYZ1234", kuka, { threeTargets() }, {}, coarse);
    EXPECT_TRUE(program.errors().empty());
    ASSERT_EQ(program.warnings().size(), 1u);
    EXPECT_EQ(program.warnings()[0],
              "If using an older KRC2 or KRC3 controller, make the program name 6 character(s) shorter");

    Program other("ABCDEFGHIJKLMNOPQRSTUVWXYZ1234", singleArmCell(), { threeTargets() }, {}, coarse);
    EXPECT_TRUE(other.warnings().empty());
}

// ============================================================================
// Multi-file indices
// ============================================================================

TEST_F(ProgramTest, MultiFileIndices) {
    Program program("Split", singleArmCell(), { threeTargets() }, { 5, 2, 2, 99 }, coarse);

    EXPECT_EQ(program.multiFileIndices(), (std::vector<int>{ 0, 2 }));
    ASSERT_EQ(program.warnings().size(), 1u);
    EXPECT_EQ(program.warnings()[0], "Multi-file index was higher than the number of targets");

    Program plain("Plain", singleArmCell(), { threeTargets() }, {}, coarse);
    EXPECT_EQ(plain.multiFileIndices(), (std::vector<int>{ 0 }));
    EXPECT_TRUE(plain.warnings().empty());
}

TEST_F(ProgramTest, MultiFileIndicesIgnoredWithErrors) {
    Program program("1st", singleArmCell(), { threeTargets() }, { 1, 2 }, coarse);

    ASSERT_EQ(program.errors().size(), 1u);
    EXPECT_TRUE(program.hasSimulation());
    EXPECT_EQ(program.multiFileIndices(), (std::vector<int>{ 0 }));
    EXPECT_TRUE(program.warnings().empty());
}

// ============================================================================
// Structural errors
// ============================================================================

TEST_F(ProgramTest, StructuralErrorsLeaveNoMotion) {
    Program program("Broken", singleArmCell(), { target::Toolpath{} }, {}, coarse);

    ASSERT_FALSE(program.errors().empty());
    EXPECT_EQ(program.errors()[0], "The program must contain at least 1 target");
    EXPECT_FALSE(program.hasSimulation());
    EXPECT_TRUE(program.keyframes().empty());
    EXPECT_TRUE(program.targets().empty());
    EXPECT_DOUBLE_EQ(program.duration(), 0.0);
    EXPECT_EQ(program.multiFileIndices(), (std::vector<int>{ 0 }));

    EXPECT_THROW(program.currentSimulationPose(), std::logic_error);
    EXPECT_THROW(program.checkCollisions(), std::logic_error);

    auto poser = std::make_shared<RecordingPoser>();
    program.setMeshPoser(poser);
    program.animate(0.5);
    EXPECT_EQ(poser->calls, 0);
}

TEST_F(ProgramTest, RequiresCell) {
    EXPECT_THROW(Program("NoCell", nullptr, { threeTargets() }), std::invalid_argument);
}

// ============================================================================
// Playback
// ============================================================================

TEST_F(ProgramTest, Summary) {
    auto t = target::Target::joint(turned(0.5));
    t.speed = target::Speed::fixedTime(3725.0);

    Program program("Long", singleArmCell(),
                    { { jointTarget(homeJoints()), std::make_shared<const target::Target>(t) } },
                    {}, coarse);

    EXPECT_NEAR(program.duration(), 3725.0, 1e-9);
    EXPECT_EQ(program.summary(), "Program (Long with 2 targets and 01:02:05 (h:m:s) long)");
}

TEST_F(ProgramTest, AnimatePosesMeshes) {
    Program program("Animated", singleArmCell(),
                    { { jointTarget(homeJoints()), jointTarget(turned(0.4)) } }, {}, coarse);
    ASSERT_TRUE(program.hasSimulation());

    auto poser = std::make_shared<RecordingPoser>();
    program.setMeshPoser(poser);

    program.animate(0.0);
    EXPECT_EQ(poser->calls, 1);
    EXPECT_EQ(poser->lastTarget, 0);
    EXPECT_NEAR(poser->lastJoints[0], 0.0, 1e-12);

    program.animate(0.5);
    EXPECT_EQ(poser->calls, 2);
    EXPECT_EQ(poser->lastTarget, 1);
    EXPECT_NEAR(poser->lastJoints[0], 0.2, 1e-9);

    program.animate(program.duration(), false);
    EXPECT_NEAR(poser->lastJoints[0], 0.4, 1e-12);
    EXPECT_NEAR(program.currentSimulationPose().time, program.duration(), 1e-12);

    // Without a mesh layer only the cursor moves
    program.setMeshPoser(nullptr);
    program.animate(0.0);
    EXPECT_EQ(poser->calls, 3);
    EXPECT_DOUBLE_EQ(program.currentSimulationPose().time, 0.0);
}

TEST_F(ProgramTest, CollisionsFromProgram) {
    auto t = target::Target::joint(turned(0.4));
    t.tool = sphereTool(10.0);

    Program program("Clear", singleArmCell(),
                    { { jointTarget(homeJoints(), {}, sphereTool(10.0)),
                        std::make_shared<const target::Target>(t) } }, {}, coarse);

    auto collision = program.checkCollisions();
    EXPECT_FALSE(collision.hasCollision());
    EXPECT_FALSE(collision.sampleTimes().empty());
}

// ============================================================================
// Export
// ============================================================================

TEST_F(ProgramTest, JsonExport) {
    Program program("Export", singleArmCell(config::Manufacturer::ABB),
                    { threeTargets() }, {}, coarse);
    auto j = program.toJson();

    EXPECT_EQ(j["name"], "Export");
    EXPECT_EQ(j["cell"], "TestCell");
    EXPECT_EQ(j["manufacturer"], "ABB");
    EXPECT_TRUE(j["errors"].empty());
    ASSERT_EQ(j["targets"].size(), 3u);
    EXPECT_EQ(j["multi_file_indices"], nlohmann::json::array({ 0 }));

    const auto& pose = j["targets"][1]["groups"][0];
    EXPECT_EQ(pose["group"], 0);
    EXPECT_EQ(pose["motion"], "Joint");
    EXPECT_EQ(pose["tool"], "DefaultTool");
    EXPECT_EQ(pose["frame"], "world");
    EXPECT_EQ(pose["joints"].size(), 6u);
    EXPECT_EQ(pose["configuration"], program.solutions()[1][0].configuration.toString());
    ASSERT_EQ(pose["pose"].size(), 7u);
    EXPECT_NEAR(pose["pose"][1].get<double>(), 50.0, 1e-9);

    Program kuka("Export", singleArmCell(config::Manufacturer::KUKA),
                 { threeTargets() }, {}, coarse);
    auto k = kuka.toJson();
    EXPECT_EQ(k["targets"][0]["groups"][0]["pose"].size(), 6u);
    EXPECT_NEAR(k["targets"][0]["groups"][0]["pose"][0].get<double>(), HOME_X, 1e-6);
}

TEST_F(ProgramTest, JsonExportDiagnostics) {
    Program program("Reach", singleArmCell(),
                    { { jointTarget(homeJoints()),
                        poseTarget(makeTranslation(Vector3d(5000.0, 0.0, 0.0))) } }, {}, coarse);
    auto j = program.toJson();

    ASSERT_EQ(j["diagnostics"].size(), 1u);
    EXPECT_EQ(j["diagnostics"][0]["target"], 1);
    EXPECT_EQ(j["diagnostics"][0]["group"], 0);
    EXPECT_EQ(j["diagnostics"][0]["message"], "Target out of reach");
}
