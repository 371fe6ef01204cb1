/// @file value_format.cpp
/// @brief Implements number formatting

#include "core/value_format.hpp"

#include <cmath>
#include <sstream>

namespace algoscope {

namespace {

constexpr double MAX_EXACT_INTEGER = 9007199254740992.0; // 2^53

} // namespace

std::string format_value(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::trunc(value) == value && std::abs(value) < MAX_EXACT_INTEGER) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace algoscope
