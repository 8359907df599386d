/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace robot_cell {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// ============================================================================
// YAML -> config structures
// ============================================================================

frame::Frame parseFrame(const YAML::Node& node) {
    frame::Frame f;
    if (!node) return f;
    f.x = node["x"].as<double>(0.0);
    f.y = node["y"].as<double>(0.0);
    f.z = node["z"].as<double>(0.0);
    f.rx = node["rx"].as<double>(0.0);
    f.ry = node["ry"].as<double>(0.0);
    f.rz = node["rz"].as<double>(0.0);
    return f;
}

template <size_t N>
std::array<double, N> parseArray(const YAML::Node& node, const std::array<double, N>& fallback) {
    if (!node) return fallback;
    if (!node.IsSequence() || node.size() != N) {
        throw YAML::Exception(node.Mark(), "expected a list of " + std::to_string(N) + " numbers");
    }
    std::array<double, N> result;
    for (size_t i = 0; i < N; ++i) {
        result[i] = node[i].as<double>();
    }
    return result;
}

GeometryConfig parseGeometry(const YAML::Node& node) {
    GeometryConfig g;
    if (!node) return g;
    if (node["capsules"]) {
        for (const auto& c : node["capsules"]) {
            g.capsules.push_back(parseArray<7>(c, {}));
        }
    }
    if (node["spheres"]) {
        for (const auto& s : node["spheres"]) {
            g.spheres.push_back(parseArray<4>(s, {}));
        }
    }
    return g;
}

ArmConfig parseArm(const YAML::Node& node) {
    ArmConfig arm;
    arm.name = node["name"].as<std::string>("Robot");
    arm.base = parseFrame(node["base"]);
    arm.base_geometry = parseGeometry(node["base_geometry"]);

    if (node["joints"]) {
        for (const auto& jn : node["joints"]) {
            ArmJointConfig j;
            j.name = jn["name"].as<std::string>("");
            j.a = jn["a"].as<double>(0.0);
            j.alpha = jn["alpha"].as<double>(0.0);
            j.d = jn["d"].as<double>(0.0);
            j.theta_offset = jn["theta_offset"].as<double>(0.0);
            j.sign = jn["sign"].as<double>(1.0);
            j.min = jn["min"].as<double>(-180.0);
            j.max = jn["max"].as<double>(180.0);
            j.max_speed = jn["max_speed"].as<double>(180.0);
            j.default_value = jn["default"].as<double>(0.0);
            j.geometry = parseGeometry(jn["geometry"]);
            arm.joints.push_back(j);
        }
    }
    return arm;
}

ExternalConfig parseExternal(const YAML::Node& node) {
    ExternalConfig ext;
    ext.name = node["name"].as<std::string>("External");
    ext.kind = node["kind"].as<std::string>("track");
    ext.moves_robot = node["moves_robot"].as<bool>(false);
    ext.base = parseFrame(node["base"]);
    ext.base_geometry = parseGeometry(node["base_geometry"]);

    if (node["joints"]) {
        for (const auto& jn : node["joints"]) {
            AxisJointConfig j;
            j.name = jn["name"].as<std::string>("");
            j.axis = parseArray<3>(jn["axis"], {0.0, 0.0, 1.0});
            j.offset = parseArray<3>(jn["offset"], {0.0, 0.0, 0.0});
            j.min = jn["min"].as<double>(-1000.0);
            j.max = jn["max"].as<double>(1000.0);
            j.max_speed = jn["max_speed"].as<double>(500.0);
            j.default_value = jn["default"].as<double>(0.0);
            j.geometry = parseGeometry(jn["geometry"]);
            ext.joints.push_back(j);
        }
    }
    return ext;
}

bool parseCell(const YAML::Node& root, CellConfig& config) {
    YAML::Node cell = root["cell"];
    if (!cell) {
        LOG_ERROR("Missing 'cell' section in config");
        return false;
    }

    config.name = cell["name"].as<std::string>("RobotCell");
    config.manufacturer = manufacturerFromString(cell["manufacturer"].as<std::string>("OTHER"));

    config.groups.clear();
    if (cell["groups"]) {
        for (const auto& gn : cell["groups"]) {
            GroupConfig group;
            group.name = gn["name"].as<std::string>("Group");
            if (gn["robot"]) {
                group.robot = parseArm(gn["robot"]);
            }
            if (gn["externals"]) {
                for (const auto& en : gn["externals"]) {
                    group.externals.push_back(parseExternal(en));
                }
            }
            config.groups.push_back(group);
        }
    }

    config.tools.clear();
    if (cell["tools"]) {
        for (const auto& tn : cell["tools"]) {
            ToolConfig tool;
            tool.name = tn["name"].as<std::string>("DefaultTool");
            tool.tcp = parseFrame(tn["tcp"]);
            tool.weight = tn["weight"].as<double>(0.0);
            tool.geometry = parseGeometry(tn["geometry"]);
            config.tools.push_back(tool);
        }
    }

    if (config.groups.empty()) {
        LOG_ERROR("Cell config validation failed: no mechanical groups");
        return false;
    }
    return true;
}

bool parseSystem(const YAML::Node& root, SystemConfig& config) {
    YAML::Node system = root["system"];
    if (!system) {
        LOG_ERROR("Missing 'system' section in config");
        return false;
    }

    // Version
    config.version = system["version"].as<std::string>("1.0.0");

    // Logging settings
    if (system["logging"]) {
        auto logging = system["logging"];
        config.logging.level = logging["level"].as<std::string>("info");
        config.logging.file = logging["file"].as<std::string>("logs/robot_cell.log");
        config.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
        config.logging.max_files = logging["max_files"].as<int>(5);
        config.logging.file_enabled = logging["file_enabled"].as<bool>(true);
    }

    // Program check settings
    if (system["check"]) {
        auto check = system["check"];
        config.check.linear_step = check["linear_step"].as<double>(1.0);
        config.check.angular_step = check["angular_step"].as<double>(1.0);
        config.check.joint_jump_factor = check["joint_jump_factor"].as<double>(10.0);
        config.check.default_translation_speed = check["default_translation_speed"].as<double>(100.0);
        config.check.default_rotation_speed = check["default_rotation_speed"].as<double>(90.0);
    }

    // Collision settings
    if (system["collision"]) {
        auto collision = system["collision"];
        config.collision.linear_step = collision["linear_step"].as<double>(100.0);
        config.collision.angular_step = collision["angular_step"].as<double>(45.0);
        if (collision["first"]) {
            config.collision.first = collision["first"].as<std::vector<int>>();
        }
        if (collision["second"]) {
            config.collision.second = collision["second"].as<std::vector<int>>();
        }
    }

    if (config.check.linear_step <= 0.0 || config.check.angular_step <= 0.0 ||
        config.collision.linear_step <= 0.0 || config.collision.angular_step <= 0.0) {
        LOG_ERROR("System config validation failed: step sizes must be positive");
        return false;
    }
    return true;
}

json geometryToJson(const GeometryConfig& g) {
    return {
        {"capsules", g.capsules},
        {"spheres", g.spheres}
    };
}

json frameToJson(const frame::Frame& f) {
    return {
        {"x", f.x}, {"y", f.y}, {"z", f.z},
        {"rx", f.rx}, {"ry", f.ry}, {"rz", f.rz}
    };
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

// ============================================================================
// Loading
// ============================================================================

bool ConfigManager::applyCellConfig(const std::string& source, bool fromFile) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        YAML::Node root;
        if (fromFile) {
            if (!fs::exists(source)) {
                LOG_ERROR("Cell config file not found: {}", source);
                return false;
            }
            LOG_INFO("Loading cell config from: {}", source);
            root = YAML::LoadFile(source);
        } else {
            root = YAML::Load(source);
        }

        CellConfig config;
        if (!parseCell(root, config)) {
            return false;
        }

        m_cell_config = config;
        LOG_INFO("Cell config loaded: {} ({} groups, {} tools)",
                 m_cell_config.name, m_cell_config.groups.size(), m_cell_config.tools.size());
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in cell config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading cell config: {}", e.what());
        return false;
    }
}

bool ConfigManager::applySystemConfig(const std::string& source, bool fromFile) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        YAML::Node root;
        if (fromFile) {
            if (!fs::exists(source)) {
                LOG_ERROR("System config file not found: {}", source);
                return false;
            }
            LOG_INFO("Loading system config from: {}", source);
            root = YAML::LoadFile(source);
        } else {
            root = YAML::Load(source);
        }

        SystemConfig config;
        if (!parseSystem(root, config)) {
            return false;
        }

        m_system_config = config;
        LOG_INFO("System config loaded: version {}", m_system_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadCellConfig(const std::string& filepath) {
    return applyCellConfig(filepath, true);
}

bool ConfigManager::loadCellConfigFromString(const std::string& yaml) {
    return applyCellConfig(yaml, false);
}

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    return applySystemConfig(filepath, true);
}

bool ConfigManager::loadSystemConfigFromString(const std::string& yaml) {
    return applySystemConfig(yaml, false);
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    std::string cell_path = config_dir + "/cell_config.yaml";
    std::string system_path = config_dir + "/system_config.yaml";

    bool cell_ok = loadCellConfig(cell_path);
    bool system_ok = loadSystemConfig(system_path);

    m_loaded = cell_ok && system_ok;
    return m_loaded;
}

// ============================================================================
// JSON export
// ============================================================================

std::string ConfigManager::cellConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["name"] = m_cell_config.name;
    j["manufacturer"] = manufacturerToString(m_cell_config.manufacturer);

    j["groups"] = json::array();
    for (const auto& group : m_cell_config.groups) {
        json g;
        g["name"] = group.name;

        if (group.robot) {
            json robot;
            robot["name"] = group.robot->name;
            robot["base"] = frameToJson(group.robot->base);
            robot["base_geometry"] = geometryToJson(group.robot->base_geometry);
            robot["joints"] = json::array();
            for (const auto& jc : group.robot->joints) {
                robot["joints"].push_back({
                    {"name", jc.name},
                    {"a", jc.a},
                    {"alpha", jc.alpha},
                    {"d", jc.d},
                    {"theta_offset", jc.theta_offset},
                    {"sign", jc.sign},
                    {"min", jc.min},
                    {"max", jc.max},
                    {"max_speed", jc.max_speed},
                    {"default", jc.default_value},
                    {"geometry", geometryToJson(jc.geometry)}
                });
            }
            g["robot"] = robot;
        } else {
            g["robot"] = nullptr;
        }

        g["externals"] = json::array();
        for (const auto& ext : group.externals) {
            json e;
            e["name"] = ext.name;
            e["kind"] = ext.kind;
            e["moves_robot"] = ext.moves_robot;
            e["base"] = frameToJson(ext.base);
            e["base_geometry"] = geometryToJson(ext.base_geometry);
            e["joints"] = json::array();
            for (const auto& jc : ext.joints) {
                e["joints"].push_back({
                    {"name", jc.name},
                    {"axis", jc.axis},
                    {"offset", jc.offset},
                    {"min", jc.min},
                    {"max", jc.max},
                    {"max_speed", jc.max_speed},
                    {"default", jc.default_value},
                    {"geometry", geometryToJson(jc.geometry)}
                });
            }
            g["externals"].push_back(e);
        }

        j["groups"].push_back(g);
    }

    j["tools"] = json::array();
    for (const auto& tool : m_cell_config.tools) {
        j["tools"].push_back({
            {"name", tool.name},
            {"tcp", tool.tcp.toArray()},
            {"weight", tool.weight},
            {"geometry", geometryToJson(tool.geometry)}
        });
    }

    return j.dump(2);
}

std::string ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_system_config.version;
    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file},
        {"max_size_mb", m_system_config.logging.max_size_mb},
        {"max_files", m_system_config.logging.max_files},
        {"file_enabled", m_system_config.logging.file_enabled}
    };
    j["check"] = {
        {"linear_step", m_system_config.check.linear_step},
        {"angular_step", m_system_config.check.angular_step},
        {"joint_jump_factor", m_system_config.check.joint_jump_factor},
        {"default_translation_speed", m_system_config.check.default_translation_speed},
        {"default_rotation_speed", m_system_config.check.default_rotation_speed}
    };
    j["collision"] = {
        {"linear_step", m_system_config.collision.linear_step},
        {"angular_step", m_system_config.collision.angular_step},
        {"first", m_system_config.collision.first},
        {"second", m_system_config.collision.second}
    };

    return j.dump(2);
}

} // namespace config
} // namespace robot_cell
