/// @file notice.cpp
/// @brief Notice factories

#include "session/notice.hpp"

#include <utility>

namespace algoscope {

Notice Notice::success(std::string message) {
    return {true, std::nullopt, std::move(message), {}};
}

Notice Notice::failure(ErrorCode code, std::string message) {
    return {false, code, std::move(message), std::string(error_instruction(code))};
}

Notice Notice::refused(std::string message, std::string instruction) {
    return {false, std::nullopt, std::move(message), std::move(instruction)};
}

} // namespace algoscope
