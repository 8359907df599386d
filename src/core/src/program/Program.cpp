/**
 * @file Program.cpp
 * @brief Program implementation
 */

#include "Program.hpp"
#include "../frame/FrameConversions.hpp"
#include "../logging/Logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace robot_cell {
namespace program {

namespace {

constexpr size_t MAX_NAME_LENGTH = 32;
constexpr size_t KUKA_LEGACY_NAME_LENGTH = 24;

const std::vector<Keyframe>& emptyKeyframes() {
    static const std::vector<Keyframe> empty;
    return empty;
}

} // namespace

Program::Program(std::string name,
                 std::shared_ptr<const kinematics::RobotCell> cell,
                 const std::vector<target::Toolpath>& toolpaths,
                 const std::vector<int>& multiFileIndices,
                 const CheckSettings& settings)
    : name_(std::move(name))
    , cell_(std::move(cell))
{
    if (!cell_) {
        throw std::invalid_argument("Program '" + name_ + "' needs a robot cell");
    }

    CheckProgram check(*cell_, toolpaths, settings);

    errors_ = check.errors();
    if (!check.hasErrors()) {
        targets_ = check.fixedTargets();
        solutions_ = check.solutions();
        diagnostics_ = check.diagnostics();
        keyframes_ = std::make_shared<const std::vector<Keyframe>>(check.keyframes());
        duration_ = check.duration();
        simulation_ = std::make_unique<Simulation>(keyframes_);
    }

    checkName();
    fixMultiFileIndices(multiFileIndices);

    for (const auto& w : warnings_) LOG_WARN("Program '{}': {}", name_, w);
    LOG_INFO("{}", summary());
}

// ============================================================================
// Identity
// ============================================================================

bool Program::isValidIdentifier(const std::string& name, std::string& error) {
    if (name.empty()) {
        error = "name is empty";
        return false;
    }

    if (name.size() > MAX_NAME_LENGTH) {
        error = fmt::format("name is {} character(s) too long", name.size() - MAX_NAME_LENGTH);
        return false;
    }

    if (!std::isalpha(static_cast<unsigned char>(name[0]))) {
        error = "name must start with a letter";
        return false;
    }

    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u >= 0x80 || !(std::isalnum(u) || c == '_')) {
            error = "name can only contain letters, digits, and underscores (_)";
            return false;
        }
    }

    error.clear();
    return true;
}

void Program::checkName() {
    std::string checked = name_;

    // Generated files for multi-group cells are named per group and part
    if (cell_->groups().size() > 1) {
        const auto& groups = cell_->groups();
        auto longest = std::max_element(groups.begin(), groups.end(),
            [](const auto& a, const auto& b) { return a.name().size() < b.name().size(); });
        checked = fmt::format("{}_{}_000", name_, longest->name());
    }

    std::string error;
    if (!isValidIdentifier(checked, error)) {
        errors_.push_back("Program " + error);
    }

    if (cell_->manufacturer() == config::Manufacturer::KUKA &&
        checked.size() > KUKA_LEGACY_NAME_LENGTH) {
        warnings_.push_back(fmt::format(
            "If using an older KRC2 or KRC3 controller, make the program name {} character(s) shorter",
            checked.size() - KUKA_LEGACY_NAME_LENGTH));
    }
}

void Program::fixMultiFileIndices(const std::vector<int>& indices) {
    multiFileIndices_.clear();

    // Erroneous programs are never split
    if (errors_.empty() && !targets_.empty()) {
        const int count = static_cast<int>(targets_.size());
        for (int i : indices) {
            if (i >= 0 && i < count) multiFileIndices_.push_back(i);
        }
        if (multiFileIndices_.size() < indices.size()) {
            warnings_.push_back("Multi-file index was higher than the number of targets");
        }
        std::sort(multiFileIndices_.begin(), multiFileIndices_.end());
        multiFileIndices_.erase(std::unique(multiFileIndices_.begin(), multiFileIndices_.end()),
                                multiFileIndices_.end());
    }

    if (multiFileIndices_.empty() || multiFileIndices_.front() != 0) {
        multiFileIndices_.insert(multiFileIndices_.begin(), 0);
    }
}

// ============================================================================
// Playback
// ============================================================================

const std::vector<Keyframe>& Program::keyframes() const {
    return keyframes_ ? *keyframes_ : emptyKeyframes();
}

void Program::animate(double time, bool normalized) {
    if (!simulation_) return;

    const auto& pose = simulation_->step(time, normalized);

    if (!meshPoser_) return;
    meshPoser_->pose(pose.solutions, targets_.at(pose.targetIndex));
}

const SimulationPose& Program::currentSimulationPose() const {
    if (!simulation_) {
        throw std::logic_error("Program '" + name_ + "' cannot be animated");
    }
    return simulation_->currentPose();
}

Collision Program::checkCollisions(const CollisionSettings& settings) const {
    if (!simulation_) {
        throw std::logic_error("Program '" + name_ + "' has no motion to check");
    }
    return Collision(*cell_, *keyframes_, targets_, settings);
}

// ============================================================================
// Reporting
// ============================================================================

std::string Program::summary() const {
    int total = static_cast<int>(duration_);
    int hours = total / 3600;
    int minutes = (total % 3600) / 60;
    int seconds = total % 60;
    return fmt::format("Program ({} with {} targets and {:02}:{:02}:{:02} (h:m:s) long)",
                       name_, targets_.size(), hours, minutes, seconds);
}

nlohmann::json Program::toJson() const {
    nlohmann::json j;
    j["name"] = name_;
    j["cell"] = cell_->name();
    j["manufacturer"] = config::manufacturerToString(cell_->manufacturer());
    j["duration"] = duration_;
    j["errors"] = errors_;
    j["warnings"] = warnings_;
    j["multi_file_indices"] = multiFileIndices_;

    nlohmann::json targets = nlohmann::json::array();
    for (size_t i = 0; i < targets_.size(); ++i) {
        nlohmann::json cellTarget;
        cellTarget["index"] = targets_[i].index;

        nlohmann::json groups = nlohmann::json::array();
        for (const auto& programTarget : targets_[i].programTargets) {
            const auto& t = *programTarget.target;
            const auto& solution = solutions_[i][programTarget.group];

            nlohmann::json g;
            g["group"] = programTarget.group;
            g["name"] = t.name;
            g["motion"] = target::motionToString(t.motion);
            g["tool"] = t.tool ? t.tool->name : "";
            g["speed"] = t.speed.name;
            g["frame"] = t.frame.name;
            g["joints"] = solution.joints;
            g["configuration"] = solution.configuration.toString();
            if (const auto* cartesian = t.cartesian()) {
                g["pose"] = frame::frameToNumbers(cartesian->pose, cell_->manufacturer());
            } else {
                g["pose"] = frame::frameToNumbers(solution.toolFrame(), cell_->manufacturer());
            }
            groups.push_back(g);
        }
        cellTarget["groups"] = groups;
        targets.push_back(cellTarget);
    }
    j["targets"] = targets;

    nlohmann::json diagnostics = nlohmann::json::array();
    for (const auto& d : diagnostics_) {
        diagnostics.push_back({ {"target", d.targetIndex}, {"group", d.group}, {"message", d.message} });
    }
    j["diagnostics"] = diagnostics;

    return j;
}

} // namespace program
} // namespace robot_cell
