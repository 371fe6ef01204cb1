#pragma once

/// @file element_input.hpp
/// @brief Turns comma-separated user text into validated numeric sequences

#include <string_view>
#include <vector>

namespace algoscope {

/// Parses comma-separated numbers for the array algorithms and checks the
/// element count is within [MIN_ELEMENTS, MAX_ELEMENTS].
/// @throws EngineError(INVALID_ELEMENT_INPUT) for a non-numeric token or a bad count
[[nodiscard]] std::vector<double> parse_elements(std::string_view text);

/// Checks an already-typed sequence against the array algorithm bounds.
/// @throws EngineError(INVALID_ELEMENT_INPUT) for a bad count or a non-finite value
void validate_elements(const std::vector<double>& values);

/// Parses comma-separated numbers without count limits (tree and list builds).
/// @throws EngineError(INVALID_ELEMENT_INPUT) for a non-numeric token or no values
[[nodiscard]] std::vector<double> parse_values(std::string_view text);

/// Parses a single number (search and delete targets).
/// @throws EngineError(INVALID_ELEMENT_INPUT) if the text is not one finite number
[[nodiscard]] double parse_value(std::string_view text);

} // namespace algoscope
