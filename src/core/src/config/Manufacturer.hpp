/**
 * @file Manufacturer.hpp
 * @brief Controller vendor of a robot cell
 */

#pragma once

#include <string>

namespace robot_cell {
namespace config {

enum class Manufacturer {
    ABB,
    KUKA,
    UR,
    STAUBLI,
    OTHER
};

inline std::string manufacturerToString(Manufacturer m) {
    switch (m) {
        case Manufacturer::ABB:     return "ABB";
        case Manufacturer::KUKA:    return "KUKA";
        case Manufacturer::UR:      return "UR";
        case Manufacturer::STAUBLI: return "STAUBLI";
        case Manufacturer::OTHER:   return "OTHER";
        default: return "UNKNOWN";
    }
}

inline Manufacturer manufacturerFromString(const std::string& str) {
    if (str == "ABB" || str == "abb") return Manufacturer::ABB;
    if (str == "KUKA" || str == "kuka") return Manufacturer::KUKA;
    if (str == "UR" || str == "ur") return Manufacturer::UR;
    if (str == "STAUBLI" || str == "staubli") return Manufacturer::STAUBLI;
    return Manufacturer::OTHER;
}

} // namespace config
} // namespace robot_cell
