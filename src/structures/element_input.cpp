/// @file element_input.cpp
/// @brief Implements numeric input parsing and validation

#include "structures/element_input.hpp"

#include "core/config.hpp"
#include "core/errors.hpp"
#include "structures/graph.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace algoscope {

namespace {

[[noreturn]] void input_failure(const std::string& message) {
    throw EngineError(ErrorCode::INVALID_ELEMENT_INPUT, message);
}

double parse_number(const std::string& token) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size() || !std::isfinite(value)) {
        input_failure("\"" + token + "\" is not a number");
    }
    return value;
}

} // namespace

std::vector<double> parse_values(std::string_view text) {
    std::vector<double> values;
    for (const std::string& token : split_list(text)) {
        values.push_back(parse_number(token));
    }
    if (values.empty()) {
        input_failure("No values were given");
    }
    return values;
}

std::vector<double> parse_elements(std::string_view text) {
    std::vector<double> values = parse_values(text);
    validate_elements(values);
    return values;
}

void validate_elements(const std::vector<double>& values) {
    if (values.size() < MIN_ELEMENTS || values.size() > MAX_ELEMENTS) {
        input_failure("Invalid array: " + std::to_string(values.size()) +
                      " elements given, expected between " + std::to_string(MIN_ELEMENTS) +
                      " and " + std::to_string(MAX_ELEMENTS));
    }
    for (double value : values) {
        if (!std::isfinite(value)) {
            input_failure("Array values must be finite numbers");
        }
    }
}

double parse_value(std::string_view text) {
    std::vector<std::string> tokens = split_list(text);
    if (tokens.size() != 1) {
        input_failure("Enter exactly one number");
    }
    return parse_number(tokens.front());
}

} // namespace algoscope
