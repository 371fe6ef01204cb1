#pragma once

/// @file config.hpp
/// @brief Engine-wide limits and playback timing constants

#include <cstddef>

namespace algoscope {

// --- Playback timing (milliseconds) ---
constexpr int MIN_DELAY_MS = 10;
constexpr int MAX_DELAY_MS = 3000;
constexpr int DEFAULT_SPEED = 500; ///< Speed slider default; higher = faster

// --- Array algorithm input bounds ---
constexpr std::size_t MIN_ELEMENTS = 2;
constexpr std::size_t MAX_ELEMENTS = 50;

/// Prefix used for every diagnostic line written to stderr
constexpr const char* LOG_PREFIX = "[algoscope]";

} // namespace algoscope
