#pragma once

/// @file array_replay.hpp
/// @brief Re-applies the array-mutating steps of a trace to a copy of its input

#include "trace/trace.hpp"

#include <cstddef>
#include <vector>

namespace algoscope {

/// Applies SWAP, SHIFT and OVERWRITE to the array; every other kind is ignored.
/// @throws std::out_of_range if a subject index is outside the array
void apply_array_step(std::vector<double>& values, const Step& step);

/// Returns the array state after the first `count` steps of the trace.
/// `count` larger than the trace replays the whole trace.
[[nodiscard]] std::vector<double> replay_prefix(const std::vector<double>& initial,
                                                const Trace& trace, std::size_t count);

} // namespace algoscope
