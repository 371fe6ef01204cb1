/// @file errors.cpp
/// @brief User instructions for each error code

#include "core/errors.hpp"

namespace algoscope {

std::string_view error_instruction(ErrorCode code) {
    switch (code) {
    case ErrorCode::INVALID_ELEMENT_INPUT:
        return "Use comma-separated numbers (min 2, max 50 elements), e.g. 10,2,50,4.";
    case ErrorCode::GRAPH_PARSE_ERROR:
        return "Use \"A-B, A-C\" for edges and \"A-B:5, A-C:2\" for weights.";
    case ErrorCode::UNKNOWN_START_NODE:
        return "Choose a start node that appears in the edge list.";
    case ErrorCode::MISSING_TARGET_NODE:
        return "Enter a target node for the pathfinding algorithm.";
    case ErrorCode::PATH_NOT_FOUND:
        return "Pick a target node that is connected to the start node.";
    case ErrorCode::UNSORTED_INPUT_FOR_BINARY_SEARCH:
        return "Binary search needs ascending order; the array has been sorted for you.";
    }
    return "";
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace algoscope
