#pragma once

/// @file node_id.hpp
/// @brief Stable arena ids shared by the tree and list structures

#include <cstddef>

namespace algoscope {

/// Index of a node in its structure's arena; never reused within one structure
using NodeId = std::size_t;

/// Marks an absent link (no child, no next, no prev)
constexpr NodeId NO_NODE = static_cast<NodeId>(-1);

} // namespace algoscope
