#pragma once

/// @file notice.hpp
/// @brief Outcome of a session operation, ready to show to the user

#include "core/errors.hpp"

#include <optional>
#include <string>

namespace algoscope {

struct Notice {
    bool ok = true;
    std::optional<ErrorCode> code; ///< Set for failures from the error taxonomy
    std::string message;
    std::string instruction; ///< What the user can do about it; empty on success

    [[nodiscard]] static Notice success(std::string message);

    /// A failure carrying the code's standard instruction
    [[nodiscard]] static Notice failure(ErrorCode code, std::string message);

    /// An operation that was not attempted (busy, nothing loaded, ...)
    [[nodiscard]] static Notice refused(std::string message, std::string instruction);
};

} // namespace algoscope
