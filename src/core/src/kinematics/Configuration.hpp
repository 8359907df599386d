/**
 * @file Configuration.hpp
 * @brief Inverse-kinematics branch flags of a 6-axis arm
 */

#pragma once

#include <string>

namespace robot_cell {
namespace kinematics {

/**
 * Configuration tag (shoulder / elbow / wrist branch).
 *
 * All flags false is the "front, elbow up, no flip" branch.
 * rank() orders tags lexicographically with shoulder most significant;
 * when nothing else decides, the lowest rank wins.
 */
struct Configuration {
    bool shoulder = false;  // wrist center behind the J1 axis
    bool elbow = false;     // elbow down
    bool wrist = false;     // wrist flipped

    int rank() const {
        return (shoulder ? 4 : 0) | (elbow ? 2 : 0) | (wrist ? 1 : 0);
    }

    static Configuration fromRank(int rank) {
        Configuration c;
        c.shoulder = (rank & 4) != 0;
        c.elbow = (rank & 2) != 0;
        c.wrist = (rank & 1) != 0;
        return c;
    }

    bool operator==(const Configuration& other) const {
        return rank() == other.rank();
    }

    bool operator!=(const Configuration& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        if (rank() == 0) return "None";
        std::string s;
        auto add = [&s](const char* flag) {
            if (!s.empty()) s += "|";
            s += flag;
        };
        if (shoulder) add("Shoulder");
        if (elbow) add("Elbow");
        if (wrist) add("Wrist");
        return s;
    }
};

} // namespace kinematics
} // namespace robot_cell
