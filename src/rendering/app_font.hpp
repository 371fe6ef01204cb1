/// @file app_font.hpp
/// @brief Application-wide font and the text helpers every panel draws with.

#pragma once

#include <raylib.h>

namespace algoscope {

/// Loads the first TTF found among the known locations. Call after InitWindow().
/// Falls back to raylib's built-in font (and says so on stderr).
void init_app_font();

/// Releases the font if one was loaded. Call before CloseWindow().
void cleanup_app_font();

[[nodiscard]] Font get_app_font();

/// DrawText() with the application font
void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color);

/// MeasureText() with the application font
int MeasureAppText(const char* text, int fontSize);

} // namespace algoscope
