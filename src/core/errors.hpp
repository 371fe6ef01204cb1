#pragma once

/// @file errors.hpp
/// @brief Error taxonomy for input validation and path reconstruction.
///
/// Programming errors (bad arena ids, malformed steps) use the standard
/// exception types. Everything a user can cause through bad input is an
/// EngineError carrying one of the codes below plus an instruction that
/// tells the user how to fix it.

#include <stdexcept>
#include <string>
#include <string_view>

namespace algoscope {

enum class ErrorCode {
    INVALID_ELEMENT_INPUT,
    GRAPH_PARSE_ERROR,
    UNKNOWN_START_NODE,
    MISSING_TARGET_NODE,
    PATH_NOT_FOUND,
    UNSORTED_INPUT_FOR_BINARY_SEARCH,
};

/// Returns the stable name of an error code
[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::INVALID_ELEMENT_INPUT:
        return "InvalidElementInput";
    case ErrorCode::GRAPH_PARSE_ERROR:
        return "GraphParseError";
    case ErrorCode::UNKNOWN_START_NODE:
        return "UnknownStartNode";
    case ErrorCode::MISSING_TARGET_NODE:
        return "MissingTargetNode";
    case ErrorCode::PATH_NOT_FOUND:
        return "PathNotFound";
    case ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH:
        return "UnsortedInputForBinarySearch";
    }
    return "Unknown";
}

/// Returns the user-facing instruction that accompanies an error code
[[nodiscard]] std::string_view error_instruction(ErrorCode code);

/// A user-correctable failure, raised before trace generation starts
/// (or by path reconstruction, the one check that needs the search result).
class EngineError : public std::runtime_error {
  public:
    EngineError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] std::string_view instruction() const { return error_instruction(code_); }

  private:
    ErrorCode code_;
};

} // namespace algoscope
