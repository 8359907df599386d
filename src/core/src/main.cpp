/**
 * @file main.cpp
 * @brief robot_cell_check - checks the default pose of a configured robot cell
 *
 * Usage: robot_cell_check [config_dir]
 * Prints the program report as JSON on stdout.
 */

#include <iostream>
#include <memory>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "kinematics/RobotCell.hpp"
#include "program/Program.hpp"

using namespace robot_cell;
using namespace robot_cell::config;

int main(int argc, char* argv[]) {
    std::string config_dir = "config";
    if (argc > 1) {
        config_dir = argv[1];
    }

    // Console only until the system config names a log file
    Logger::init("", "info");

    LOG_INFO("========================================");
    LOG_INFO("Robot Cell Check v1.0.0");
    LOG_INFO("========================================");
    LOG_INFO("Config directory: {}", config_dir);

    auto& config = ConfigManager::instance();
    if (!config.loadAll(config_dir)) {
        LOG_ERROR("Failed to load configuration files");
        LOG_ERROR("Make sure cell_config.yaml and system_config.yaml exist in: {}", config_dir);
        return 1;
    }

    // Reconfigure logger based on loaded config
    const auto& system = config.systemConfig();
    Logger::init(system.logging);

    auto built = kinematics::RobotCell::fromConfig(config.cellConfig());
    if (!built) {
        LOG_ERROR("Invalid robot cell configuration");
        return 1;
    }
    auto cell = std::make_shared<const kinematics::RobotCell>(std::move(*built));

    // One target per group at its default joints
    target::Speed speed;
    speed.translation = system.check.default_translation_speed;
    speed.rotation = kinematics::degToRad(system.check.default_rotation_speed);

    tool::ToolPtr tool = cell->tools().empty() ? tool::Tool::defaultTool() : cell->tools().front();

    std::vector<target::Toolpath> toolpaths;
    for (const auto& group : cell->groups()) {
        auto defaults = group.defaultJoints();
        kinematics::JointValues robot(defaults.begin(), defaults.begin() + group.robotJointCount());
        kinematics::JointValues external(defaults.begin() + group.robotJointCount(), defaults.end());

        auto t = target::Target::joint(robot, external);
        t.name = group.name() + "_home";
        t.tool = tool;
        t.speed = speed;
        toolpaths.push_back({ std::make_shared<const target::Target>(t) });
    }

    program::Program prog(cell->name() + "_check", cell, toolpaths, {},
                          program::CheckSettings::fromConfig(system.check));

    nlohmann::json report = prog.toJson();

    if (prog.hasSimulation()) {
        program::CollisionSettings settings;
        settings.first = system.collision.first;
        settings.second = system.collision.second;
        settings.linearStep = system.collision.linear_step;
        settings.angularStep = kinematics::degToRad(system.collision.angular_step);

        auto collision = prog.checkCollisions(settings);
        nlohmann::json pairs = nlohmann::json::array();
        for (const auto& pair : collision.pairs()) {
            pairs.push_back({ {"first", pair.first}, {"second", pair.second},
                              {"time", pair.time}, {"target", pair.targetIndex} });
        }
        report["collisions"] = pairs;
    }

    std::cout << report.dump(2) << std::endl;

    LOG_INFO("{}", prog.summary());
    return prog.errors().empty() ? 0 : 2;
}
