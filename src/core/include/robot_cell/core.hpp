#pragma once
/**
 * @file core.hpp
 * @brief Main include file for Robot Cell Core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/kinematics/RobotCell.hpp"
#include "../../src/target/Target.hpp"
#include "../../src/program/Program.hpp"
