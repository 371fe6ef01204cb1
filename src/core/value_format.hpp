#pragma once

/// @file value_format.hpp
/// @brief Number formatting for narratives and labels

#include <string>

namespace algoscope {

/// Formats a value the way a user typed it: integral values without a
/// fractional part ("42"), everything else with up to six significant digits.
[[nodiscard]] std::string format_value(double value);

} // namespace algoscope
